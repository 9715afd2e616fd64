#pragma once

#include "codec.hpp"
#include "image_source.hpp"
#include "pak_format.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace polyserve::vfs {

// Sequential reader over one entry's bytes.
// Decoded mode inflates lazily and checks length and CRC-32 at end of stream.
// Raw mode yields the stored bytes as they are (deflate stream or plain data).
class BodyReader {
public:
    enum class Mode {
        Decoded,
        Raw,
    };

    BodyReader(std::shared_ptr<const ImageSource> image, std::uint64_t sectionOffset,
               const DirectoryEntry& entry, Mode mode);
    ~BodyReader();

    BodyReader(BodyReader&&) noexcept;
    BodyReader& operator=(BodyReader&&) noexcept;

    // Number of bytes this reader produces in total.
    std::uint64_t size() const { return size_; }

    bool done() const { return finished_; }

    // Fill up to out.size() bytes.
    // @return Bytes written; 0 only once the body is complete.
    // Throws ArchiveError(IoError) when the image cannot be read and
    // ArchiveError(CorruptArchive) on a bad deflate stream or checksum.
    std::size_t read(std::span<std::uint8_t> out);

private:
    std::size_t read_stored(std::span<std::uint8_t> out);
    std::size_t read_inflated(std::span<std::uint8_t> out);
    void fill_input();
    void finish();

    std::shared_ptr<const ImageSource> image_;
    std::string path_;
    Mode mode_;
    Compression method_;

    std::uint64_t position_{0};   // Absolute image offset of the next stored byte.
    std::uint64_t remaining_{0};  // Stored bytes not yet read from the image.
    std::uint64_t size_{0};
    std::uint64_t produced_{0};
    std::uint32_t expectedCrc_{0};
    std::uint32_t crc_{0};
    bool finished_{false};

    std::unique_ptr<codec::Inflater> inflater_;
    std::vector<std::uint8_t> inputBuffer_;
    std::span<const std::uint8_t> input_;
};

// Read-only index of an archive section found at the end of an image.
// Built once, then shared; all methods are const and safe to call from
// any number of threads.
class ArchiveIndex {
public:
    // Open an artifact file (normally the running executable).
    // Throws ArchiveError(IoError) if the file cannot be opened and
    // ArchiveError(CorruptArchive) if its archive section is invalid.
    static std::shared_ptr<const ArchiveIndex> open(const std::filesystem::path& imagePath);

    // Build from any image source. Throws as open().
    static std::shared_ptr<const ArchiveIndex> load(std::shared_ptr<const ImageSource> image);

    ArchiveIndex(const ArchiveIndex&) = delete;
    ArchiveIndex& operator=(const ArchiveIndex&) = delete;

    // Get list of all entries in archive, sorted by path.
    const std::vector<DirectoryEntry>& entries() const { return entries_; }

    // Get entry by normalized path.
    const DirectoryEntry* find(std::string_view path) const;

    // Check if file exists in archive.
    bool has_file(std::string_view path) const { return find(path) != nullptr; }

    BodyReader open_body(const DirectoryEntry& entry) const;
    BodyReader open_raw(const DirectoryEntry& entry) const;

    // Extract whole file contents, decoded and checksum-verified.
    // @return File data, or std::nullopt if missing or unreadable.
    std::optional<std::vector<std::uint8_t>> extract(std::string_view path) const;

    // Absolute offset of the archive section inside the image (the stub length).
    std::uint64_t section_offset() const { return sectionOffset_; }
    std::uint64_t section_size() const { return trailer_.sectionSize; }
    std::uint64_t image_size() const { return image_->size(); }

private:
    explicit ArchiveIndex(std::shared_ptr<const ImageSource> image);

    void parse();

    std::shared_ptr<const ImageSource> image_;
    Trailer trailer_{};
    std::uint64_t sectionOffset_{0};
    std::vector<DirectoryEntry> entries_;
    std::unordered_map<std::string, std::size_t> pathIndex_;  // path -> index in entries_
};

} // namespace polyserve::vfs
