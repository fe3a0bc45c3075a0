#include <iostream>
#include <memory>
#include <rayshell/config.hpp>
#include <rayshell/error.hpp>
#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <string>
#include <vector>

#include "cli.hpp"
#include "program/program.hpp"
#include "ui/headless_frontend.hpp"

#ifdef RAYSHELL_USE_IMGUI
    #include "ui/imgui_frontend.hpp"
#endif

int main(int argc, char* argv[])
{
    using namespace rayshell;

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string              cli_error;
    auto                     cli = parse_cli(args, cli_error);
    if (!cli)
    {
        std::cerr << cli_error << "\n" << usage(argv[0]);
        return 1;
    }
    if (cli->help)
    {
        std::cout << usage(argv[0]);
        return 0;
    }

    auto& logger = Logger::instance();
    logger.add_sink(sinks::console_sink());
    if (!cli->log_file.empty())
        logger.add_sink(sinks::file_sink(cli->log_file));

    std::string config_path = cli->config_path.empty() ? AppConfig::default_path() : cli->config_path;
    AppConfig   config      = AppConfig::load_or_default(config_path);

    logger.set_level(cli->log_level.value_or(config.runtime.tracing.min_level));
    logger.set_target_filters(config.runtime.tracing.target_filters);

    auto store = std::make_shared<AppConfigStore>(config);

    ProgramOptions options;
    options.timing      = config.runtime.timing;
    options.error_style = config.runtime.tracing.error_style;

    bool headless = cli->headless;
#ifndef RAYSHELL_USE_IMGUI
    if (!headless)
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "built without a GUI, running headless");
        headless = true;
    }
#endif

    if (headless)
    {
        auto tick              = config.runtime.timing.ui_tick;
        auto frames            = cli->frames;
        options.make_frontend  = [tick, frames]
        { return std::make_unique<HeadlessFrontend>(tick, frames); };
    }
#ifdef RAYSHELL_USE_IMGUI
    else
    {
        options.make_frontend = [store] { return std::make_unique<ImGuiFrontend>(store); };
    }
#endif

    try
    {
        Program program(std::move(options));
        ProgramResult result = program.run();
        if (!result.ok())
        {
            RAYSHELL_LOG_ERROR(targets::GENERAL_ERROR_FATAL,
                               "exiting with error: {}",
                               format_report(*result.error, config.runtime.tracing.error_style));
            return 1;
        }
    }
    catch (const Error& e)
    {
        RAYSHELL_LOG_CRITICAL(targets::GENERAL_ERROR_FATAL,
                              "{}",
                              format_report(e.report(), ErrorLogStyle::Debug));
        return 1;
    }

    RAYSHELL_LOG_INFO(targets::PROGRAM_DEBUG_GENERAL, "goodbye");
    return 0;
}
