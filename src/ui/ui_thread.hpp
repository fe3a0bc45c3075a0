#pragma once

#include <memory>

#include "program/thread_context.hpp"
#include "ui_frontend.hpp"

namespace rayshell
{

// UI thread entry point. Waits at the startup barrier, initializes the
// frontend, then renders one frame and drains messages per iteration. A
// window close request is forwarded to the program thread; the loop keeps
// running until Ui(ExitUiThread) arrives.
void run_ui_thread(ThreadContext ctx, std::unique_ptr<UiFrontend> frontend);

}   // namespace rayshell
