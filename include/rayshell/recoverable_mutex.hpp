#pragma once

#include <mutex>
#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <type_traits>
#include <utility>

namespace rayshell
{

// Mutex-guarded value whose only access path is with_lock(). If the closure
// throws while holding the lock the value is marked poisoned; the next
// acquisition logs a non-fatal warning, clears the mark and carries on with
// whatever the value holds.
template <typename T>
class RecoverableMutex
{
   public:
    RecoverableMutex() = default;
    explicit RecoverableMutex(T value) : value_(std::move(value)) {}

    RecoverableMutex(const RecoverableMutex&)            = delete;
    RecoverableMutex& operator=(const RecoverableMutex&) = delete;

    // The closure's result is returned by value; a reference to the guarded
    // value would outlive the lock.
    template <typename F>
        requires(!std::is_reference_v<std::invoke_result_t<F, T&>>)
    auto with_lock(F&& f)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (poisoned_)
        {
            RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                              "shared state lock was poisoned by a failed holder, recovering");
            poisoned_ = false;
            ++recoveries_;
        }
        RAYSHELL_LOG_TRACE(targets::THREAD_TRACE_MUTEX_SYNC, "acquired shared state lock");
        try
        {
            return std::forward<F>(f)(value_);
        }
        catch (...)
        {
            poisoned_ = true;
            throw;
        }
    }

    bool is_poisoned() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return poisoned_;
    }

    // Number of times a poisoned lock has been recovered.
    size_t recovery_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return recoveries_;
    }

   private:
    mutable std::mutex mutex_;
    T                  value_{};
    bool               poisoned_   = false;
    size_t             recoveries_ = 0;
};

}   // namespace rayshell
