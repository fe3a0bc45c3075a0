#include <gtest/gtest.h>

#include "resources/resource_manager.hpp"

using namespace rayshell;

TEST(ResourceManager, ExecutableDirectoryContainsTestBinary)
{
    auto dir = executable_directory();
    EXPECT_TRUE(dir.is_absolute());
    EXPECT_TRUE(std::filesystem::is_directory(dir));

    auto exe = std::filesystem::read_symlink("/proc/self/exe");
    EXPECT_EQ(exe.parent_path(), dir);
}

TEST(ResourceManager, ResourceRootUsesConfiguredFolder)
{
    ResourcesConfig config;
    EXPECT_EQ(resource_root(config), executable_directory() / "app_resources");

    config.resources_path = "assets";
    EXPECT_EQ(resource_root(config), executable_directory() / "assets");
}

TEST(ResourceManager, FontsDirectoryIsUnderResourceRoot)
{
    ResourcesConfig config;
    config.resources_path = "assets";
    config.fonts_path     = "typefaces";
    EXPECT_EQ(fonts_directory(config), executable_directory() / "assets" / "typefaces");
}
