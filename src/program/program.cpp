#include "program.hpp"

#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <thread>

#include "engine/engine_thread.hpp"
#include "message_pump.hpp"
#include "ui/headless_frontend.hpp"
#include "ui/ui_thread.hpp"

namespace rayshell
{

// Engine, UI and the program thread itself.
static constexpr std::ptrdiff_t STARTUP_PARTICIPANTS = 3;

Program::Program(ProgramOptions options)
    : options_(std::move(options)), state_(make_shared_program_state())
{
    if (!options_.terminator)
        options_.terminator = default_process_terminator();
    if (!options_.make_frontend)
    {
        auto tick              = options_.timing.ui_tick;
        options_.make_frontend = [tick] { return std::make_unique<HeadlessFrontend>(tick); };
    }

    auto [sender, receiver] = make_message_channel(options_.channel_capacity);
    sender_                 = std::move(sender);
    receiver_               = std::move(receiver);
}

Program::~Program()
{
    stop_workers();
}

ProgramResult Program::run()
{
    set_current_thread_name("program");
    RAYSHELL_LOG_INFO(targets::PROGRAM_DEBUG_GENERAL, "program starting");

    auto barrier = std::make_shared<StartupBarrier>(STARTUP_PARTICIPANTS);
    spawn_workers(barrier);

    // Only the threads' own senders may keep the channel alive from here on.
    program_sender_ = sender_;
    sender_.unsubscribe();

    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "program thread waiting at startup barrier");
    barrier->arrive_and_wait();
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "program thread passed startup barrier");
    state_->with_lock([](ProgramState& s) { s.program.status = ProgramStatus::Running; });

    ProgramResult result;
    try
    {
        for (;;)
        {
            RAYSHELL_LOG_TRACE(targets::PROGRAM_TRACE_GLOBAL_LOOP, "program poll");
            if (!supervise_workers(result))
                break;

            auto pump = drain_messages(
                receiver_,
                Addressee::Program,
                [&](const ThreadMessage& message)
                {
                    const auto& program = std::get<ProgramMessage>(message).message;
                    return std::visit(
                        overloaded{
                            [&](const QuitAppNoError& quit)
                            {
                                RAYSHELL_LOG_INFO(targets::PROGRAM_DEBUG_GENERAL,
                                                  "quit requested ({}), shutting down",
                                                  to_string(quit.reason));
                                begin_shutdown();
                                return PumpResult::Continue;
                            },
                            [&](const QuitAppError& quit)
                            {
                                result.error = quit.error ? quit.error
                                                          : share(ErrorReport("quit with an empty error"));
                                RAYSHELL_LOG_ERROR(targets::GENERAL_ERROR_FATAL,
                                                   "app quitting because of an error: {}",
                                                   format_report(*result.error, options_.error_style));
                                return PumpResult::Exit;
                            },
                        },
                        program);
                });
            if (pump == PumpResult::Exit)
                break;

            if (shutting_down_ && !engine_.is_running() && !ui_.is_running())
            {
                RAYSHELL_LOG_DEBUG(targets::PROGRAM_DEBUG_GENERAL, "all workers have exited");
                break;
            }

            std::this_thread::sleep_for(options_.timing.program_poll);
        }
    }
    catch (...)
    {
        stop_workers();
        throw;
    }

    stop_workers();
    RAYSHELL_LOG_INFO(targets::PROGRAM_DEBUG_GENERAL,
                      "program finished {}",
                      result.ok() ? "cleanly" : "with an error");
    return result;
}

void Program::spawn_workers(const std::shared_ptr<StartupBarrier>& barrier)
{
    // Receivers are copied from receiver_ before anything can be sent.
    ThreadContext engine_ctx{barrier,
                             state_,
                             MessageSender(sender_),
                             MessageReceiver(receiver_),
                             options_.timing,
                             options_.engine_hooks};
    engine_ = WorkerThread::spawn("engine",
                                  [ctx = std::move(engine_ctx)]() mutable
                                  { run_engine_thread(std::move(ctx)); });

    try
    {
        auto          frontend = options_.make_frontend();
        ThreadContext ui_ctx{barrier,
                             state_,
                             MessageSender(sender_),
                             MessageReceiver(receiver_),
                             options_.timing,
                             options_.ui_hooks};
        ui_ = WorkerThread::spawn("ui",
                                  [ctx = std::move(ui_ctx), frontend = std::move(frontend)]() mutable
                                  { run_ui_thread(std::move(ctx), std::move(frontend)); });
    }
    catch (...)
    {
        // Any failure here, Error or not, must let the engine past the
        // barrier on behalf of the program and the missing UI thread, then
        // stop it.
        send_logged(messages::exit_engine_thread());
        auto token = barrier->arrive(2);
        (void)token;
        engine_.join();
        throw;
    }
}

void Program::begin_shutdown()
{
    if (shutting_down_)
        return;
    shutting_down_ = true;
    state_->with_lock([](ProgramState& s) { s.program.status = ProgramStatus::ShuttingDown; });

    if (ui_.is_running())
        send_or_throw(messages::exit_ui_thread(), program_sender_);
    if (engine_.is_running())
        send_or_throw(messages::exit_engine_thread(), program_sender_);
}

// Returns false if a worker failed and the loop must stop.
bool Program::supervise_workers(ProgramResult& result)
{
    for (WorkerThread* worker : {&engine_, &ui_})
    {
        RAYSHELL_LOG_TRACE(targets::PROGRAM_TRACE_THREAD_STATUS_POLL,
                           "{} thread is {}",
                           worker->name(),
                           to_string(worker->state()));
        if (worker->state() != WorkerState::Failed)
            continue;

        SharedReport failure = worker->failure();
        options_.terminator(*failure);
        // Only reached when the terminator does not end the process.
        result.error = failure;
        return false;
    }
    return true;
}

void Program::stop_workers()
{
    if (ui_.is_running())
        send_logged(messages::exit_ui_thread());
    if (engine_.is_running())
        send_logged(messages::exit_engine_thread());
    ui_.join();
    engine_.join();

    program_sender_.unsubscribe();
    receiver_.unsubscribe();
}

void Program::send_logged(const ThreadMessage& message)
{
    MessageSender& sender = program_sender_.is_subscribed() ? program_sender_ : sender_;
    auto           outcome = send(message, sender);
    if (!outcome.ok())
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "could not deliver {} during shutdown: {}",
                          to_string(message),
                          format_report(*outcome.error, ErrorLogStyle::ShortWithCause));
    }
}

}   // namespace rayshell
