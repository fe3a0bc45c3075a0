#include "process_terminator.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>

namespace rayshell
{

void terminate_process(const ErrorReport& report)
{
    RAYSHELL_LOG_CRITICAL(targets::DOMINO_EFFECT_FAILURE,
                          "a thread died, terminating the whole process:\n{}",
                          format_report(report, ErrorLogStyle::Debug));
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
    std::_Exit(EXIT_FAILURE);
}

ProcessTerminator default_process_terminator()
{
    return [](const ErrorReport& report) { terminate_process(report); };
}

}   // namespace rayshell
