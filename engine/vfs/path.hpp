#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace polyserve::vfs {

// Canonical archive path: leading '/' stripped, segments separated by single
// '/', no empty, "." or ".." segments, no NUL or backslash.
// Returns std::nullopt if the path cannot be made canonical.
std::optional<std::string> normalize_path(std::string_view path);

// File extension including the dot, lowercased ("" if none).
std::string path_extension(std::string_view path);

} // namespace polyserve::vfs
