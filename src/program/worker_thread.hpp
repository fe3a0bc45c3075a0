#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <rayshell/error.hpp>
#include <rayshell/logger.hpp>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace rayshell
{

enum class WorkerState
{
    Running,
    Finished,   // body returned
    Failed,     // body threw; failure() holds the report
};

const char* to_string(WorkerState state);

// A named OS thread whose body is run under a guard that records how it
// ended. The supervisor polls state() and decides what to do about failures;
// nothing is restarted.
class WorkerThread
{
   public:
    WorkerThread() = default;
    ~WorkerThread();

    WorkerThread(WorkerThread&&) noexcept        = default;
    WorkerThread& operator=(WorkerThread&& other) noexcept;
    WorkerThread(const WorkerThread&)            = delete;
    WorkerThread& operator=(const WorkerThread&) = delete;

    // Starts `body` on a new thread named `name`. Throws Error if the OS
    // refuses to create the thread.
    template <typename F>
    static WorkerThread spawn(std::string name, F&& body);

    const std::string& name() const { return name_; }
    WorkerState        state() const;
    bool               is_running() const { return state() == WorkerState::Running; }
    SharedReport       failure() const;

    // Waits up to `timeout` for the body to end. Returns true if it has.
    bool wait_for_exit(std::chrono::milliseconds timeout) const;

    // Joins if joinable. Safe to call more than once.
    void join();

   private:
    struct Shared
    {
        std::atomic<WorkerState> state{WorkerState::Running};
        mutable std::mutex       mutex;
        std::condition_variable  exited;
        SharedReport             failure;

        void finish();
        void fail(ErrorReport report, const std::string& name);
    };

    template <typename F>
    static void run_guarded(Shared& shared, const std::string& name, F& body);

    [[noreturn]] static void throw_spawn_error(const std::string& name, const std::system_error& e);

    std::string             name_;
    std::shared_ptr<Shared> shared_;
    std::thread             thread_;
};

template <typename F>
WorkerThread WorkerThread::spawn(std::string name, F&& body)
{
    WorkerThread worker;
    worker.name_   = std::move(name);
    worker.shared_ = std::make_shared<Shared>();
    try
    {
        worker.thread_ = std::thread(
            [shared = worker.shared_, name = worker.name_, body = std::forward<F>(body)]() mutable
            { run_guarded(*shared, name, body); });
    }
    catch (const std::system_error& e)
    {
        throw_spawn_error(worker.name_, e);
    }
    return worker;
}

template <typename F>
void WorkerThread::run_guarded(Shared& shared, const std::string& name, F& body)
{
    set_current_thread_name(name);
    try
    {
        body();
        shared.finish();
    }
    catch (const std::exception& e)
    {
        shared.fail(report_from_exception(e), name);
    }
    catch (...)
    {
        shared.fail(ErrorReport("unknown exception type"), name);
    }
}

}   // namespace rayshell
