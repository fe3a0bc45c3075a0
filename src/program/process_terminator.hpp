#pragma once

#include <functional>
#include <rayshell/error.hpp>

namespace rayshell
{

// The single place a failed worker thread is escalated to. The default ends
// the process; tests install one that records the report instead.
using ProcessTerminator = std::function<void(const ErrorReport&)>;

// Logs the report as critical, flushes standard streams and calls _Exit(1).
[[noreturn]] void terminate_process(const ErrorReport& report);

ProcessTerminator default_process_terminator();

}   // namespace rayshell
