#include "archive_index.hpp"

#include "archive_error.hpp"
#include "path.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace polyserve::vfs {

namespace {

constexpr std::size_t kInputChunk = 64 * 1024;

[[noreturn]] void corrupt(const std::string& detail) {
    throw ArchiveError(ArchiveErrc::CorruptArchive, detail);
}

} // namespace

// =============================================================================
// BodyReader
// =============================================================================

BodyReader::BodyReader(std::shared_ptr<const ImageSource> image, std::uint64_t sectionOffset,
                       const DirectoryEntry& entry, Mode mode)
    : image_(std::move(image))
    , path_(entry.path)
    , mode_(mode)
    , method_(entry.method)
    , position_(sectionOffset + entry.dataOffset)
    , remaining_(entry.compressedSize)
    , expectedCrc_(entry.crc32) {
    const bool decode = mode_ == Mode::Decoded && method_ == Compression::Deflate;
    size_ = (mode_ == Mode::Raw) ? entry.compressedSize : entry.uncompressedSize;

    if (decode) {
        inflater_ = std::make_unique<codec::Inflater>();
        if (!inflater_->valid()) {
            throw ArchiveError(ArchiveErrc::IoError, "inflateInit failed for '" + path_ + "'");
        }
    }

    finished_ = (size_ == 0 && remaining_ == 0);
    if (finished_ && mode_ == Mode::Decoded && expectedCrc_ != 0) {
        corrupt("checksum mismatch for '" + path_ + "'");
    }
}

BodyReader::~BodyReader() = default;
BodyReader::BodyReader(BodyReader&&) noexcept = default;
BodyReader& BodyReader::operator=(BodyReader&&) noexcept = default;

std::size_t BodyReader::read(std::span<std::uint8_t> out) {
    if (finished_ || out.empty()) {
        return 0;
    }
    if (inflater_) {
        return read_inflated(out);
    }
    return read_stored(out);
}

std::size_t BodyReader::read_stored(std::span<std::uint8_t> out) {
    const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(out.size(), remaining_));
    if (!image_->read_at(position_, out.first(n))) {
        throw ArchiveError(ArchiveErrc::IoError, "read failed for '" + path_ + "'");
    }

    position_ += n;
    remaining_ -= n;
    produced_ += n;
    if (mode_ == Mode::Decoded) {
        crc_ = codec::crc32(out.first(n), crc_);
    }

    if (remaining_ == 0) {
        finish();
    }
    return n;
}

void BodyReader::fill_input() {
    const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(kInputChunk, remaining_));
    inputBuffer_.resize(n);
    if (!image_->read_at(position_, inputBuffer_)) {
        throw ArchiveError(ArchiveErrc::IoError, "read failed for '" + path_ + "'");
    }
    position_ += n;
    remaining_ -= n;
    input_ = inputBuffer_;
}

std::size_t BodyReader::read_inflated(std::span<std::uint8_t> out) {
    std::size_t written = 0;

    while (written == 0) {
        if (input_.empty()) {
            if (remaining_ == 0) {
                corrupt("truncated deflate stream for '" + path_ + "'");
            }
            fill_input();
        }

        std::size_t produced = 0;
        const auto status = inflater_->inflate(input_, out.subspan(written), produced);
        if (status == codec::Inflater::Status::Error) {
            corrupt("invalid deflate stream for '" + path_ + "'");
        }

        crc_ = codec::crc32(out.subspan(written, produced), crc_);
        written += produced;
        produced_ += produced;
        if (produced_ > size_) {
            corrupt("entry '" + path_ + "' inflates past its recorded size");
        }

        if (status == codec::Inflater::Status::StreamEnd) {
            finish();
            break;
        }
    }

    // All bytes are out but the end-of-stream marker may sit in unread input.
    while (!finished_ && produced_ == size_) {
        if (input_.empty()) {
            if (remaining_ == 0) {
                corrupt("truncated deflate stream for '" + path_ + "'");
            }
            fill_input();
        }

        std::array<std::uint8_t, 1> scratch{};
        std::size_t extra = 0;
        const auto status = inflater_->inflate(input_, scratch, extra);
        if (status == codec::Inflater::Status::Error || extra != 0) {
            corrupt("invalid deflate stream for '" + path_ + "'");
        }
        if (status == codec::Inflater::Status::StreamEnd) {
            finish();
        }
    }

    return written;
}

void BodyReader::finish() {
    finished_ = true;
    if (mode_ == Mode::Raw) {
        return;
    }
    if (produced_ != size_) {
        corrupt("entry '" + path_ + "' decoded to " + std::to_string(produced_) + " bytes, expected " +
                std::to_string(size_));
    }
    if (crc_ != expectedCrc_) {
        corrupt("checksum mismatch for '" + path_ + "'");
    }
}

// =============================================================================
// ArchiveIndex
// =============================================================================

ArchiveIndex::ArchiveIndex(std::shared_ptr<const ImageSource> image) : image_(std::move(image)) {}

std::shared_ptr<const ArchiveIndex> ArchiveIndex::open(const std::filesystem::path& imagePath) {
    auto image = FileImage::open(imagePath);
    if (!image) {
        throw ArchiveError(ArchiveErrc::IoError, "cannot open " + imagePath.string());
    }
    return load(std::move(image));
}

std::shared_ptr<const ArchiveIndex> ArchiveIndex::load(std::shared_ptr<const ImageSource> image) {
    if (!image) {
        throw ArchiveError(ArchiveErrc::IoError, "no image");
    }

    std::shared_ptr<ArchiveIndex> index(new ArchiveIndex(std::move(image)));
    index->parse();
    return index;
}

void ArchiveIndex::parse() {
    const std::uint64_t fileSize = image_->size();
    if (fileSize < PAK_TRAILER_SIZE) {
        corrupt("image of " + std::to_string(fileSize) + " bytes is too small for a trailer");
    }

    // --- Trailer ---

    std::array<std::uint8_t, PAK_TRAILER_SIZE> trailerBytes{};
    if (!image_->read_at(fileSize - PAK_TRAILER_SIZE, trailerBytes)) {
        throw ArchiveError(ArchiveErrc::IoError, "cannot read trailer");
    }
    trailer_ = read_trailer(trailerBytes);

    if (trailer_.magic != PAK_TRAILER_MAGIC) {
        corrupt("no archive trailer at end of image");
    }
    if (trailer_.version != PAK_VERSION) {
        corrupt("unsupported archive version " + std::to_string(trailer_.version));
    }
    if (trailer_.sectionSize < PAK_TRAILER_SIZE || trailer_.sectionSize > fileSize) {
        corrupt("archive section size " + std::to_string(trailer_.sectionSize) +
                " does not fit image of " + std::to_string(fileSize) + " bytes");
    }

    // The section start is derived, never stored: this is what makes the
    // layout independent of the stub length.
    sectionOffset_ = fileSize - trailer_.sectionSize;

    const std::uint64_t directoryEnd = trailer_.sectionSize - PAK_TRAILER_SIZE;
    if (trailer_.directoryOffset > directoryEnd ||
        trailer_.directorySize != directoryEnd - trailer_.directoryOffset) {
        corrupt("directory does not end at the trailer");
    }
    if (trailer_.entryCount == 0) {
        corrupt("archive has no entries");
    }
    if (static_cast<std::uint64_t>(trailer_.entryCount) * PAK_DIRENT_MIN_SIZE > trailer_.directorySize) {
        corrupt("entry count " + std::to_string(trailer_.entryCount) + " exceeds directory size");
    }

    // --- Directory ---

    std::vector<std::uint8_t> directory(static_cast<std::size_t>(trailer_.directorySize));
    if (!image_->read_at(sectionOffset_ + trailer_.directoryOffset, directory)) {
        throw ArchiveError(ArchiveErrc::IoError, "cannot read directory");
    }
    if (codec::crc32(directory) != trailer_.directoryCrc) {
        corrupt("directory checksum mismatch");
    }

    entries_.reserve(trailer_.entryCount);
    pathIndex_.reserve(trailer_.entryCount);

    core::ByteReader reader(directory);
    for (std::uint32_t i = 0; i < trailer_.entryCount; ++i) {
        DirectoryEntry entry;
        try {
            entry = read_directory_entry(reader);
        } catch (const std::runtime_error& e) {
            corrupt("directory entry " + std::to_string(i) + ": " + e.what());
        }

        if (entry.method != Compression::Stored && entry.method != Compression::Deflate) {
            corrupt("unknown compression method for '" + entry.path + "'");
        }
        if (entry.method == Compression::Stored && entry.compressedSize != entry.uncompressedSize) {
            corrupt("stored entry '" + entry.path + "' has mismatched sizes");
        }

        auto normalized = normalize_path(entry.path);
        if (!normalized || *normalized != entry.path) {
            corrupt("invalid path in directory: '" + entry.path + "'");
        }

        // Record header and data must lie before the directory.
        const std::uint64_t headerSize = PAK_RECORD_FIXED_SIZE + entry.path.size();
        if (entry.recordOffset > trailer_.directoryOffset ||
            headerSize > trailer_.directoryOffset - entry.recordOffset ||
            entry.dataOffset != entry.recordOffset + headerSize ||
            entry.compressedSize > trailer_.directoryOffset - entry.dataOffset) {
            corrupt("entry '" + entry.path + "' lies outside the archive section");
        }

        if (!entries_.empty() && !(entries_.back().path < entry.path)) {
            if (entries_.back().path == entry.path) {
                corrupt("duplicate path '" + entry.path + "'");
            }
            corrupt("directory is not sorted at '" + entry.path + "'");
        }

        if (!pathIndex_.emplace(entry.path, entries_.size()).second) {
            corrupt("duplicate path '" + entry.path + "'");
        }
        entries_.push_back(std::move(entry));
    }

    if (!reader.at_end()) {
        corrupt("trailing bytes after " + std::to_string(trailer_.entryCount) + " directory entries");
    }
}

const DirectoryEntry* ArchiveIndex::find(std::string_view path) const {
    auto it = pathIndex_.find(std::string(path));
    if (it == pathIndex_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

BodyReader ArchiveIndex::open_body(const DirectoryEntry& entry) const {
    return BodyReader(image_, sectionOffset_, entry, BodyReader::Mode::Decoded);
}

BodyReader ArchiveIndex::open_raw(const DirectoryEntry& entry) const {
    return BodyReader(image_, sectionOffset_, entry, BodyReader::Mode::Raw);
}

std::optional<std::vector<std::uint8_t>> ArchiveIndex::extract(std::string_view path) const {
    const DirectoryEntry* entry = find(path);
    if (!entry) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> data(static_cast<std::size_t>(entry->uncompressedSize));
    try {
        BodyReader body = open_body(*entry);
        std::size_t filled = 0;
        while (!body.done()) {
            const std::size_t n = body.read(std::span<std::uint8_t>(data).subspan(filled));
            if (n == 0) {
                break;
            }
            filled += n;
        }
        if (filled != data.size()) {
            return std::nullopt;
        }
    } catch (const ArchiveError&) {
        return std::nullopt;
    }

    return data;
}

} // namespace polyserve::vfs
