#pragma once

#include <filesystem>
#include <optional>

namespace polyserve::core {

// Path of the currently running executable file.
// Uses /proc/self/exe and falls back to argv[0] when procfs is unavailable.
std::optional<std::filesystem::path> executable_path(const char* argv0);

} // namespace polyserve::core
