#pragma once

#include <stdexcept>
#include <string>

namespace polyserve::vfs {

enum class ArchiveErrc {
    InvalidPath,
    DuplicatePath,
    EmptyTree,
    StubTooLarge,
    CorruptArchive,
    IoError,
};

inline const char* to_string(ArchiveErrc code) {
    switch (code) {
        case ArchiveErrc::InvalidPath: return "InvalidPath";
        case ArchiveErrc::DuplicatePath: return "DuplicatePath";
        case ArchiveErrc::EmptyTree: return "EmptyTree";
        case ArchiveErrc::StubTooLarge: return "StubTooLarge";
        case ArchiveErrc::CorruptArchive: return "CorruptArchive";
        case ArchiveErrc::IoError: return "IoError";
    }
    return "Unknown";
}

// Thrown by the assembler, the combiner and the index.
class ArchiveError : public std::runtime_error {
public:
    ArchiveError(ArchiveErrc code, const std::string& detail)
        : std::runtime_error(std::string(to_string(code)) + ": " + detail)
        , code_(code) {}

    ArchiveErrc code() const noexcept { return code_; }

private:
    ArchiveErrc code_;
};

} // namespace polyserve::vfs
