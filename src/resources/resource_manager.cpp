#include "resource_manager.hpp"

#include <rayshell/error.hpp>
#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <system_error>

namespace rayshell
{

std::filesystem::path executable_directory()
{
    std::error_code ec;
    auto            exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        ErrorReport report(ec.message());
        report.wrap("was not able to find current process file location");
        report.note("attempted to resolve /proc/self/exe");
        throw Error(std::move(report));
    }

    auto dir = exe.parent_path();
    if (dir.empty())
    {
        ErrorReport report("executable path " + exe.string() + " has no parent directory");
        report.wrap("could not get directory of executable");
        throw Error(std::move(report));
    }

    RAYSHELL_LOG_TRACE(targets::RESOURCES_DEBUG_LOAD, "executable directory is {}", dir.string());
    return dir;
}

std::filesystem::path resource_root(const ResourcesConfig& config)
{
    return executable_directory() / config.resources_path;
}

std::filesystem::path fonts_directory(const ResourcesConfig& config)
{
    return resource_root(config) / config.fonts_path;
}

}   // namespace rayshell
