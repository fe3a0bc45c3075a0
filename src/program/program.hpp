#pragma once

#include <functional>
#include <memory>
#include <rayshell/config.hpp>
#include <rayshell/error.hpp>
#include <rayshell/program_data.hpp>

#include "channel.hpp"
#include "config/constants.hpp"
#include "process_terminator.hpp"
#include "thread_context.hpp"
#include "ui/ui_frontend.hpp"
#include "worker_thread.hpp"

namespace rayshell
{

struct ProgramOptions
{
    ThreadTimingConfig timing;
    ErrorLogStyle      error_style      = ErrorLogStyle::ShortWithCause;
    size_t             channel_capacity = constants::MESSAGE_CHANNEL_CAPACITY;

    // Called on the program thread before the UI thread is spawned.
    std::function<std::unique_ptr<UiFrontend>()> make_frontend;

    // Empty means default_process_terminator().
    ProcessTerminator terminator;

    ThreadHooks engine_hooks;
    ThreadHooks ui_hooks;
};

// How run() ended. A null error is a clean quit.
struct ProgramResult
{
    SharedReport error;

    bool ok() const { return !error; }
};

// The supervisor. run() spawns the engine and UI threads, meets them at the
// startup barrier, then polls its own messages and the workers' health until
// the app is told to quit.
class Program
{
   public:
    explicit Program(ProgramOptions options);
    ~Program();

    Program(const Program&)            = delete;
    Program& operator=(const Program&) = delete;

    // Blocks until the program quits. Throws Error if a thread cannot be
    // spawned or the program channel fails.
    ProgramResult run();

    SharedProgramState state() const { return state_; }

    // Extra sender on the program channel. Must be taken before run().
    MessageSender make_sender() const { return sender_; }

   private:
    void spawn_workers(const std::shared_ptr<StartupBarrier>& barrier);
    void begin_shutdown();
    bool supervise_workers(ProgramResult& result);
    void stop_workers();
    void send_logged(const ThreadMessage& message);

    ProgramOptions     options_;
    SharedProgramState state_;
    MessageSender      sender_;     // made with the channel, dropped once workers have their copies
    MessageReceiver    receiver_;   // made with the channel, kept as the program thread receiver
    MessageSender      program_sender_;
    WorkerThread       engine_;
    WorkerThread       ui_;
    bool               shutting_down_ = false;
};

}   // namespace rayshell
