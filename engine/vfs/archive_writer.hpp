#pragma once

#include "pak_format.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace polyserve::vfs {

// Archive section assembler.
// Collects a file tree and emits [FileRecord]* [Directory] [Trailer].
// Output depends only on the added (path, bytes, mtime) set, never on the
// order of add_file() calls, so identical trees give identical bytes.
class ArchiveWriter {
public:
    enum class CompressionPolicy {
        Auto,       // Deflate when it makes the payload strictly smaller.
        StoreOnly,  // Never compress.
    };

    ArchiveWriter();
    ~ArchiveWriter();

    // Non-copyable.
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // Applies to files added afterwards.
    void set_compression(CompressionPolicy policy, int level = 9);

    // When set, every file added afterwards gets this mtime instead of its own.
    void set_fixed_mtime(std::optional<std::int64_t> mtime) { fixedMtime_ = mtime; }

    // Add a file to the archive.
    // @param archivePath  Path inside the archive (e.g., "css/site.css").
    // @param data         File contents.
    // @param mtime        Modification time, Unix seconds.
    // Throws ArchiveError(InvalidPath) or ArchiveError(DuplicatePath).
    void add_file(const std::string& archivePath, const std::vector<std::uint8_t>& data,
                  std::int64_t mtime = 0);

    // Add a file from disk; mtime is taken from the file system.
    // Throws as add_file(), or ArchiveError(IoError) if the source is unreadable.
    void add_file_from_disk(const std::string& archivePath, const std::filesystem::path& sourcePath);

    // Serialize the archive section.
    // Throws ArchiveError(EmptyTree) if no file was added.
    std::vector<std::uint8_t> finalize() const;

    // Get number of files added so far.
    std::uint32_t file_count() const { return static_cast<std::uint32_t>(entries_.size()); }

    // Sum of uncompressed sizes.
    std::uint64_t input_bytes() const { return inputBytes_; }

private:
    struct PendingEntry {
        std::vector<std::uint8_t> payload;  // Stored or deflated bytes.
        std::uint64_t uncompressedSize{0};
        Compression method{Compression::Stored};
        std::uint32_t crc32{0};
        std::int64_t mtime{0};
    };

    // Keyed by normalized path; std::map keeps byte-lexicographic order.
    std::map<std::string, PendingEntry> entries_;
    CompressionPolicy policy_{CompressionPolicy::Auto};
    int level_{9};
    std::optional<std::int64_t> fixedMtime_;
    std::uint64_t inputBytes_{0};
};

} // namespace polyserve::vfs
