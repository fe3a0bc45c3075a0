#include "engine_thread.hpp"

#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <thread>

#include "program/message_pump.hpp"

namespace rayshell
{

static PumpResult handle_engine_message(const ThreadContext& ctx, const ThreadMessage& message)
{
    if (ctx.hooks.on_message_handled)
        ctx.hooks.on_message_handled(message);

    const auto& engine = std::get<EngineMessage>(message);
    switch (engine.message)
    {
        case EngineThreadMessage::ExitEngineThread:
            RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "engine thread told to exit");
            return PumpResult::Exit;
    }
    return PumpResult::Continue;
}

void run_engine_thread(ThreadContext ctx)
{
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "engine thread started");
    wait_at_startup_barrier(ctx, Addressee::Engine);

    for (;;)
    {
        RAYSHELL_LOG_TRACE(targets::ENGINE_TRACE_GLOBAL_LOOP, "engine tick");
        std::this_thread::sleep_for(ctx.timing.engine_tick);

        ctx.state->with_lock([](ProgramState& state) { ++state.engine.ticks; });

        auto result = drain_messages(ctx.receiver,
                                     Addressee::Engine,
                                     [&ctx](const ThreadMessage& message)
                                     { return handle_engine_message(ctx, message); });
        if (result == PumpResult::Exit)
            break;
    }

    close_endpoints(ctx, Addressee::Engine);
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "engine thread exiting");
}

}   // namespace rayshell
