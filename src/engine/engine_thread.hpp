#pragma once

#include "program/thread_context.hpp"

namespace rayshell
{

// Engine thread entry point. Waits at the startup barrier, then ticks and
// drains its messages until told to exit. Fatal channel failures propagate.
void run_engine_thread(ThreadContext ctx);

}   // namespace rayshell
