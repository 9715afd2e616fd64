#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <span>
#include <vector>

namespace polyserve::core {

// Read entire file contents into memory.
// @return File contents, or std::nullopt if the file cannot be read.
std::optional<std::vector<std::uint8_t>> read_file(const std::filesystem::path& filePath);

// Write the concatenation of `parts` to a temporary sibling of `target` and
// rename it into place. On failure nothing is left at `target` or beside it.
// @param executable  Set rwxr-xr-x permissions on the result.
// @return true on success.
bool write_file_atomic(const std::filesystem::path& target,
                       std::initializer_list<std::span<const std::uint8_t>> parts,
                       bool executable = false);

} // namespace polyserve::core
