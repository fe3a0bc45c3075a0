#include "worker_thread.hpp"

#include <rayshell/log_targets.hpp>

namespace rayshell
{

const char* to_string(WorkerState state)
{
    switch (state)
    {
        case WorkerState::Running:
            return "Running";
        case WorkerState::Finished:
            return "Finished";
        case WorkerState::Failed:
            return "Failed";
    }
    return "Unknown";
}

WorkerThread::~WorkerThread()
{
    join();
}

WorkerThread& WorkerThread::operator=(WorkerThread&& other) noexcept
{
    if (this != &other)
    {
        join();
        name_   = std::move(other.name_);
        shared_ = std::move(other.shared_);
        thread_ = std::move(other.thread_);
    }
    return *this;
}

WorkerState WorkerThread::state() const
{
    return shared_ ? shared_->state.load() : WorkerState::Finished;
}

SharedReport WorkerThread::failure() const
{
    if (!shared_)
        return nullptr;
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->failure;
}

bool WorkerThread::wait_for_exit(std::chrono::milliseconds timeout) const
{
    if (!shared_)
        return true;
    std::unique_lock<std::mutex> lock(shared_->mutex);
    return shared_->exited.wait_for(
        lock, timeout, [this] { return shared_->state.load() != WorkerState::Running; });
}

void WorkerThread::join()
{
    if (thread_.joinable())
    {
        RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "joining {} thread", name_);
        thread_.join();
    }
}

void WorkerThread::throw_spawn_error(const std::string& name, const std::system_error& e)
{
    ErrorReport report(e.what());
    report.wrap("could not spawn " + name + " thread");
    report.note("the operating system refused to create a thread");
    throw Error(std::move(report));
}

void WorkerThread::Shared::finish()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        state = WorkerState::Finished;
    }
    exited.notify_all();
    RAYSHELL_LOG_DEBUG(targets::THREAD_DEBUG_GENERAL, "thread finished");
}

void WorkerThread::Shared::fail(ErrorReport report, const std::string& name)
{
    report.wrap(name + " thread terminated by an exception");
    RAYSHELL_LOG_CRITICAL(targets::GENERAL_ERROR_FATAL,
                          "{}",
                          format_report(report, ErrorLogStyle::ShortWithCause));
    {
        std::lock_guard<std::mutex> lock(mutex);
        failure = share(std::move(report));
        state   = WorkerState::Failed;
    }
    exited.notify_all();
}

}   // namespace rayshell
