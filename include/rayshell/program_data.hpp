#pragma once

#include <cstdint>
#include <memory>
#include <rayshell/recoverable_mutex.hpp>
#include <string>

namespace rayshell
{

// Which auxiliary windows the UI shows.
struct ShownWindows
{
    bool metrics       = false;
    bool demo          = false;
    bool ui_management = false;
    bool config        = false;
};

struct UiData
{
    ShownWindows windows;
    uint64_t     frames = 0;
};

struct EngineData
{
    uint64_t ticks = 0;
};

enum class ProgramStatus
{
    Starting,
    Running,
    ShuttingDown,
};

struct ProgramData
{
    ProgramStatus status = ProgramStatus::Starting;
};

struct ProgramState
{
    UiData      ui;
    EngineData  engine;
    ProgramData program;
};

// Handle shared by every thread; lives as long as its longest holder.
using SharedProgramState = std::shared_ptr<RecoverableMutex<ProgramState>>;

inline SharedProgramState make_shared_program_state()
{
    return std::make_shared<RecoverableMutex<ProgramState>>();
}

const char* to_string(ProgramStatus status);

// Multi-line dump of the state for debug logging.
std::string describe(const ProgramState& state);

}   // namespace rayshell
