#include <rayshell/program_data.hpp>
#include <sstream>

namespace rayshell
{

const char* to_string(ProgramStatus status)
{
    switch (status)
    {
        case ProgramStatus::Starting:
            return "Starting";
        case ProgramStatus::Running:
            return "Running";
        case ProgramStatus::ShuttingDown:
            return "ShuttingDown";
    }
    return "Unknown";
}

std::string describe(const ProgramState& state)
{
    std::ostringstream os;
    os << "ProgramState {\n";
    os << "  program.status: " << to_string(state.program.status) << "\n";
    os << "  engine.ticks: " << state.engine.ticks << "\n";
    os << "  ui.frames: " << state.ui.frames << "\n";
    os << "  ui.windows: metrics=" << state.ui.windows.metrics
       << " demo=" << state.ui.windows.demo
       << " ui_management=" << state.ui.windows.ui_management
       << " config=" << state.ui.windows.config << "\n";
    os << "}";
    return os.str();
}

}   // namespace rayshell
