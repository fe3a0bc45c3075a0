#include "cli.hpp"

#include <cstdlib>

namespace rayshell
{

std::optional<CliOptions> parse_cli(const std::vector<std::string>& args, std::string& error)
{
    CliOptions options;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg      = args[i];
        auto               next_arg = [&](std::string& out) -> bool
        {
            if (i + 1 >= args.size())
            {
                error = arg + " needs a value";
                return false;
            }
            out = args[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            options.help = true;
        }
        else if (arg == "--headless")
        {
            options.headless = true;
        }
        else if (arg == "--config")
        {
            if (!next_arg(options.config_path))
                return std::nullopt;
        }
        else if (arg == "--log-file")
        {
            if (!next_arg(options.log_file))
                return std::nullopt;
        }
        else if (arg == "--log-level")
        {
            std::string value;
            if (!next_arg(value))
                return std::nullopt;
            LogLevel level;
            if (!Logger::level_from_string(value, level))
            {
                error = "unknown log level '" + value + "'";
                return std::nullopt;
            }
            options.log_level = level;
        }
        else if (arg == "--frames")
        {
            std::string value;
            if (!next_arg(value))
                return std::nullopt;
            char*              end = nullptr;
            unsigned long long n   = std::strtoull(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || n == 0)
            {
                error = "--frames needs a positive number, got '" + value + "'";
                return std::nullopt;
            }
            options.frames = static_cast<uint64_t>(n);
        }
        else
        {
            error = "unknown argument '" + arg + "'";
            return std::nullopt;
        }
    }
    return options;
}

std::string usage(const std::string& program_name)
{
    return "usage: " + program_name
           + " [--config <path>] [--log-level <level>] [--log-file <path>] [--headless]"
             " [--frames <n>]\n"
             "  --config     config file (default ~/.config/rayshell/config.json)\n"
             "  --log-level  trace, debug, info, warn, error or critical\n"
             "  --log-file   also append log entries to this file\n"
             "  --headless   run without a window\n"
             "  --frames     with --headless, quit after this many frames\n";
}

}   // namespace rayshell
