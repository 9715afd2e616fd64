#pragma once

// Polyglot combiner: executable stub followed by an archive section.
//
// The host loader sees the stub's header at offset 0; an archive reader finds
// the trailer at end-of-file and derives the section start from it. Nothing
// is rewritten, so both views stay consistent for any stub length.

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace polyserve::vfs {

// Size limit value meaning "no limit".
constexpr std::uint64_t kNoSizeLimit = 0;

// @return stub || archive.
// Throws ArchiveError(StubTooLarge) if maxSize != kNoSizeLimit and the
// combined size exceeds it.
std::vector<std::uint8_t> combine(std::span<const std::uint8_t> stub,
                                  std::span<const std::uint8_t> archive,
                                  std::uint64_t maxSize = kNoSizeLimit);

// Same as combine(), written straight to `output` (atomically, mode 0755).
// Throws ArchiveError(StubTooLarge) or ArchiveError(IoError).
void write_combined(const std::filesystem::path& output,
                    std::span<const std::uint8_t> stub,
                    std::span<const std::uint8_t> archive,
                    std::uint64_t maxSize = kNoSizeLimit);

} // namespace polyserve::vfs
