#include "polyglot.hpp"

#include "archive_error.hpp"

#include "core/file_util.hpp"

namespace polyserve::vfs {

namespace {

void check_size(std::uint64_t stubSize, std::uint64_t archiveSize, std::uint64_t maxSize) {
    if (maxSize == kNoSizeLimit) {
        return;
    }
    if (stubSize > maxSize || archiveSize > maxSize - stubSize) {
        throw ArchiveError(ArchiveErrc::StubTooLarge,
                           "stub " + std::to_string(stubSize) + " + archive " +
                               std::to_string(archiveSize) + " bytes exceeds limit of " +
                               std::to_string(maxSize));
    }
}

} // namespace

std::vector<std::uint8_t> combine(std::span<const std::uint8_t> stub,
                                  std::span<const std::uint8_t> archive,
                                  std::uint64_t maxSize) {
    check_size(stub.size(), archive.size(), maxSize);

    std::vector<std::uint8_t> out;
    out.reserve(stub.size() + archive.size());
    out.insert(out.end(), stub.begin(), stub.end());
    out.insert(out.end(), archive.begin(), archive.end());
    return out;
}

void write_combined(const std::filesystem::path& output,
                    std::span<const std::uint8_t> stub,
                    std::span<const std::uint8_t> archive,
                    std::uint64_t maxSize) {
    check_size(stub.size(), archive.size(), maxSize);

    if (!core::write_file_atomic(output, {stub, archive}, true)) {
        throw ArchiveError(ArchiveErrc::IoError, "cannot write " + output.string());
    }
}

} // namespace polyserve::vfs
