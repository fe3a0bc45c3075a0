#include "ui_thread.hpp"

#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>

#include "program/message_pump.hpp"

namespace rayshell
{

namespace
{

// Shuts the frontend down however the thread leaves.
class FrontendGuard
{
   public:
    explicit FrontendGuard(UiFrontend& frontend) : frontend_(frontend) {}
    ~FrontendGuard() { frontend_.shutdown(); }

    FrontendGuard(const FrontendGuard&)            = delete;
    FrontendGuard& operator=(const FrontendGuard&) = delete;

   private:
    UiFrontend& frontend_;
};

PumpResult handle_ui_message(const ThreadContext& ctx, const ThreadMessage& message)
{
    if (ctx.hooks.on_message_handled)
        ctx.hooks.on_message_handled(message);

    const auto& ui = std::get<UiMessage>(message);
    switch (ui.message)
    {
        case UiThreadMessage::ExitUiThread:
            RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "ui thread told to exit");
            return PumpResult::Exit;
    }
    return PumpResult::Continue;
}

// Applies only what the frame changed, so writes made to state.ui by anyone
// else while the frame was being built survive.
void merge_frame_changes(const UiData& before, const UiData& after, UiData& shared)
{
    auto merge_flag = [](bool was, bool now, bool& target)
    {
        if (was != now)
            target = now;
    };
    merge_flag(before.windows.metrics, after.windows.metrics, shared.windows.metrics);
    merge_flag(before.windows.demo, after.windows.demo, shared.windows.demo);
    merge_flag(before.windows.ui_management,
               after.windows.ui_management,
               shared.windows.ui_management);
    merge_flag(before.windows.config, after.windows.config, shared.windows.config);
    shared.frames += after.frames - before.frames;
}

}   // namespace

void run_ui_thread(ThreadContext ctx, std::unique_ptr<UiFrontend> frontend)
{
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "ui thread started");
    wait_at_startup_barrier(ctx, Addressee::Ui);

    FrontendGuard guard(*frontend);
    frontend->init();

    bool quit_sent = false;
    for (;;)
    {
        RAYSHELL_LOG_TRACE(targets::UI_TRACE_EVENT_LOOP, "ui frame");

        // The lock is not held while the frame is built.
        const UiData before  = ctx.state->with_lock([](ProgramState& state) { return state.ui; });
        UiData       ui      = before;
        auto         outcome = frontend->frame(ui);
        ctx.state->with_lock([&before, &ui](ProgramState& state)
                             { merge_frame_changes(before, ui, state.ui); });

        bool close = outcome == FrameOutcome::CloseRequested || frontend->close_requested();
        if (close && !quit_sent)
        {
            RAYSHELL_LOG_INFO(targets::UI_DEBUG_USER_INTERACTION,
                              "window close requested, asking program to quit");
            send_or_throw(messages::quit_app_no_error(QuitAppNoErrorReason::QuitInteractionByUser),
                          ctx.sender);
            quit_sent = true;
        }

        auto result = drain_messages(ctx.receiver,
                                     Addressee::Ui,
                                     [&ctx](const ThreadMessage& message)
                                     { return handle_ui_message(ctx, message); });
        if (result == PumpResult::Exit)
            break;
    }

    close_endpoints(ctx, Addressee::Ui);
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "ui thread exiting");
}

}   // namespace rayshell
