#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

#include "ui_frontend.hpp"

namespace rayshell
{

// Frontend without a window: each frame just waits one UI tick. Can ask to
// close after a fixed number of frames, or when request_close() is called.
class HeadlessFrontend : public UiFrontend
{
   public:
    explicit HeadlessFrontend(std::chrono::milliseconds     tick,
                              std::optional<uint64_t>       close_after_frames = std::nullopt);

    void         init() override;
    FrameOutcome frame(UiData& ui) override;
    bool         close_requested() const override;
    void         shutdown() override;

    // Thread-safe.
    void request_close() { close_requested_ = true; }

    uint64_t frames() const { return frames_; }
    bool     initialized() const { return initialized_; }

   private:
    std::chrono::milliseconds tick_;
    std::optional<uint64_t>   close_after_frames_;
    std::atomic<uint64_t>     frames_{0};
    std::atomic<bool>         close_requested_{false};
    std::atomic<bool>         initialized_{false};
};

}   // namespace rayshell
