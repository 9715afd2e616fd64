#include "archive_writer.hpp"

#include "archive_error.hpp"
#include "codec.hpp"
#include "path.hpp"

#include "core/byte_buffer.hpp"
#include "core/file_util.hpp"

#include <sys/stat.h>

namespace polyserve::vfs {

ArchiveWriter::ArchiveWriter() = default;

ArchiveWriter::~ArchiveWriter() = default;

void ArchiveWriter::set_compression(CompressionPolicy policy, int level) {
    policy_ = policy;
    level_ = level;
}

void ArchiveWriter::add_file(const std::string& archivePath, const std::vector<std::uint8_t>& data,
                             std::int64_t mtime) {
    auto normalized = normalize_path(archivePath);
    if (!normalized) {
        throw ArchiveError(ArchiveErrc::InvalidPath, "'" + archivePath + "'");
    }
    if (entries_.count(*normalized) != 0) {
        throw ArchiveError(ArchiveErrc::DuplicatePath,
                           "'" + archivePath + "' normalizes to existing '" + *normalized + "'");
    }

    PendingEntry entry;
    entry.uncompressedSize = data.size();
    entry.crc32 = codec::crc32(data);
    entry.mtime = fixedMtime_.value_or(mtime);

    if (policy_ == CompressionPolicy::Auto && !data.empty()) {
        auto deflated = codec::deflate_raw(data, level_);
        if (deflated && deflated->size() < data.size()) {
            entry.payload = std::move(*deflated);
            entry.method = Compression::Deflate;
        }
    }
    if (entry.method == Compression::Stored) {
        entry.payload = data;
    }

    inputBytes_ += data.size();
    entries_.emplace(std::move(*normalized), std::move(entry));
}

void ArchiveWriter::add_file_from_disk(const std::string& archivePath,
                                       const std::filesystem::path& sourcePath) {
    const std::string pathStr = sourcePath.string();

    struct stat st {};
    if (::stat(pathStr.c_str(), &st) != 0) {
        throw ArchiveError(ArchiveErrc::IoError, "cannot stat " + pathStr);
    }

    auto data = core::read_file(sourcePath);
    if (!data) {
        throw ArchiveError(ArchiveErrc::IoError, "cannot read " + pathStr);
    }

    add_file(archivePath, *data, static_cast<std::int64_t>(st.st_mtime));
}

std::vector<std::uint8_t> ArchiveWriter::finalize() const {
    if (entries_.empty()) {
        throw ArchiveError(ArchiveErrc::EmptyTree, "no files to pack");
    }

    core::ByteWriter out;
    std::vector<DirectoryEntry> directory;
    directory.reserve(entries_.size());

    for (const auto& [path, pending] : entries_) {
        DirectoryEntry entry;
        entry.path = path;
        entry.recordOffset = out.size();
        entry.uncompressedSize = pending.uncompressedSize;
        entry.compressedSize = pending.payload.size();
        entry.method = pending.method;
        entry.crc32 = pending.crc32;
        entry.mtime = pending.mtime;

        write_record_header(out, entry);
        entry.dataOffset = out.size();
        out.write_bytes(pending.payload);

        directory.push_back(std::move(entry));
    }

    const std::uint64_t directoryOffset = out.size();
    for (const auto& entry : directory) {
        write_directory_entry(out, entry);
    }
    const std::uint64_t directorySize = out.size() - directoryOffset;

    Trailer trailer;
    trailer.entryCount = static_cast<std::uint32_t>(directory.size());
    trailer.directoryCrc = codec::crc32(out.data().subspan(directoryOffset));
    trailer.directoryOffset = directoryOffset;
    trailer.directorySize = directorySize;
    trailer.sectionSize = out.size() + PAK_TRAILER_SIZE;
    write_trailer(out, trailer);

    return out.take();
}

} // namespace polyserve::vfs
