#pragma once

#include <filesystem>
#include <rayshell/config.hpp>

namespace rayshell
{

// Directory holding the running executable. Throws Error if it cannot be found.
std::filesystem::path executable_directory();

// Base folder for bundled resources: executable directory + resources_path.
std::filesystem::path resource_root(const ResourcesConfig& config);

// resource_root() + fonts_path.
std::filesystem::path fonts_directory(const ResourcesConfig& config);

}   // namespace rayshell
