#include "headless_frontend.hpp"

#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <thread>

namespace rayshell
{

HeadlessFrontend::HeadlessFrontend(std::chrono::milliseconds tick,
                                   std::optional<uint64_t>   close_after_frames)
    : tick_(tick), close_after_frames_(close_after_frames)
{
}

void HeadlessFrontend::init()
{
    RAYSHELL_LOG_INFO(targets::UI_DEBUG_GENERAL, "running without a window");
    initialized_ = true;
}

FrameOutcome HeadlessFrontend::frame(UiData& ui)
{
    std::this_thread::sleep_for(tick_);
    ++ui.frames;
    ++frames_;
    RAYSHELL_LOG_TRACE(targets::UI_TRACE_RENDER, "headless frame {}", ui.frames);

    if (close_after_frames_ && frames_ >= *close_after_frames_)
        close_requested_ = true;
    return close_requested_ ? FrameOutcome::CloseRequested : FrameOutcome::Continue;
}

bool HeadlessFrontend::close_requested() const
{
    return close_requested_;
}

void HeadlessFrontend::shutdown()
{
    initialized_ = false;
}

}   // namespace rayshell
