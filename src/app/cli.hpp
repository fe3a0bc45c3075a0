#pragma once

#include <cstdint>
#include <optional>
#include <rayshell/logger.hpp>
#include <string>
#include <vector>

namespace rayshell
{

struct CliOptions
{
    std::string             config_path;   // empty: AppConfig::default_path()
    std::optional<LogLevel> log_level;     // overrides the config's min_level
    std::string             log_file;
    bool                    headless = false;
    std::optional<uint64_t> frames;        // headless only: ask to quit after N frames
    bool                    help = false;
};

// Returns nullopt and fills `error` on bad arguments.
std::optional<CliOptions> parse_cli(const std::vector<std::string>& args, std::string& error);

std::string usage(const std::string& program_name);

}   // namespace rayshell
