#pragma once

#include <cstddef>

// Values fixed at build time.

namespace rayshell::constants
{

// Selects font files when scanning the fonts directory.
inline constexpr const char* FONT_FILE_PATH_FILTER = R"(.*\.ttf$)";

// Pulls the base name, weight and extension out of a font path such as
// `fonts/Fira Code/Fira Code (Bold).ttf`. Groups: 1 base, 2 weight, 3 ext.
inline constexpr const char* FONT_NAME_EXTRACTOR =
    R"([\\/]([\w \-_\.]*) \(([\w \-_\.]*)\)\.(\w+))";

inline constexpr const char* UNKNOWN_FONT_BASE_NAME = "Unknown Fonts";

inline constexpr float MIN_FONT_SIZE     = 8.0f;
inline constexpr float MAX_FONT_SIZE     = 128.0f;
inline constexpr float DEFAULT_FONT_SIZE = 16.0f;

// Bound on queued messages per channel. Hitting it means a reader is stuck.
inline constexpr size_t MESSAGE_CHANNEL_CAPACITY = 4096;

inline constexpr int CONFIG_FILE_VERSION = 1;

}   // namespace rayshell::constants
