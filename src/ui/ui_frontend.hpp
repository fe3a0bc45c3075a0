#pragma once

#include <rayshell/program_data.hpp>

namespace rayshell
{

enum class FrameOutcome
{
    Continue,
    CloseRequested,   // the user asked to close the window
};

// The part of the UI thread that talks to a window system. All calls happen
// on the UI thread. Failures throw Error and end the UI thread.
class UiFrontend
{
   public:
    virtual ~UiFrontend() = default;

    virtual void         init()                = 0;
    virtual FrameOutcome frame(UiData& ui)     = 0;
    virtual bool         close_requested() const = 0;

    // Must tolerate being called without init() or more than once.
    virtual void shutdown() = 0;
};

}   // namespace rayshell
