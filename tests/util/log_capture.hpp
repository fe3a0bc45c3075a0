#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <rayshell/logger.hpp>
#include <string>
#include <vector>

namespace rayshell::test
{

// Routes every log entry into memory for the lifetime of the object. Enables
// all levels and clears category filters; restores a quiet logger afterwards.
class LogCapture
{
   public:
    explicit LogCapture(LogLevel level = LogLevel::Trace) : entries_(std::make_shared<Entries>())
    {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_target_filters({});
        logger.set_level(level);
        logger.add_sink(
            [entries = entries_](const Logger::LogEntry& entry)
            {
                std::lock_guard<std::mutex> lock(entries->mutex);
                entries->list.push_back(entry);
            });
    }

    ~LogCapture()
    {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_target_filters({});
        logger.set_level(LogLevel::Info);
    }

    LogCapture(const LogCapture&)            = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<Logger::LogEntry> entries() const
    {
        std::lock_guard<std::mutex> lock(entries_->mutex);
        return entries_->list;
    }

    size_t count(const std::string& category) const
    {
        auto all = entries();
        return static_cast<size_t>(std::count_if(all.begin(),
                                                 all.end(),
                                                 [&](const Logger::LogEntry& e)
                                                 { return e.category == category; }));
    }

    size_t count(LogLevel level, const std::string& category) const
    {
        auto all = entries();
        return static_cast<size_t>(
            std::count_if(all.begin(),
                          all.end(),
                          [&](const Logger::LogEntry& e)
                          { return e.level == level && e.category == category; }));
    }

    bool contains(const std::string& text) const
    {
        for (const auto& e : entries())
        {
            if (e.message.find(text) != std::string::npos)
                return true;
        }
        return false;
    }

   private:
    struct Entries
    {
        std::mutex                    mutex;
        std::vector<Logger::LogEntry> list;
    };
    std::shared_ptr<Entries> entries_;
};

}   // namespace rayshell::test
