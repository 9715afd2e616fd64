#include "pak_format.hpp"

#include <algorithm>
#include <stdexcept>

namespace polyserve::vfs {

void write_trailer(core::ByteWriter& out, const Trailer& trailer) {
    out.write_u32(trailer.magic);
    out.write_u32(trailer.version);
    out.write_u32(trailer.entryCount);
    out.write_u32(trailer.directoryCrc);
    out.write_u64(trailer.directoryOffset);
    out.write_u64(trailer.directorySize);
    out.write_u64(trailer.sectionSize);
}

Trailer read_trailer(std::span<const std::uint8_t> bytes) {
    core::ByteReader in(bytes.first(std::min(bytes.size(), PAK_TRAILER_SIZE)));

    Trailer trailer;
    trailer.magic = in.read_u32();
    trailer.version = in.read_u32();
    trailer.entryCount = in.read_u32();
    trailer.directoryCrc = in.read_u32();
    trailer.directoryOffset = in.read_u64();
    trailer.directorySize = in.read_u64();
    trailer.sectionSize = in.read_u64();
    return trailer;
}

void write_record_header(core::ByteWriter& out, const DirectoryEntry& entry) {
    out.write_u32(PAK_RECORD_MAGIC);
    out.write_string(entry.path);
    out.write_u64(entry.uncompressedSize);
    out.write_u64(entry.compressedSize);
    out.write_u8(static_cast<std::uint8_t>(entry.method));
    out.write_u32(entry.crc32);
    out.write_i64(entry.mtime);
}

void write_directory_entry(core::ByteWriter& out, const DirectoryEntry& entry) {
    out.write_u32(PAK_DIRENT_MAGIC);
    out.write_u64(entry.recordOffset);
    out.write_u64(entry.dataOffset);
    out.write_u64(entry.uncompressedSize);
    out.write_u64(entry.compressedSize);
    out.write_u8(static_cast<std::uint8_t>(entry.method));
    out.write_u32(entry.crc32);
    out.write_i64(entry.mtime);
    out.write_string(entry.path);
}

DirectoryEntry read_directory_entry(core::ByteReader& in) {
    if (in.read_u32() != PAK_DIRENT_MAGIC) {
        throw std::runtime_error("bad directory entry magic");
    }

    DirectoryEntry entry;
    entry.recordOffset = in.read_u64();
    entry.dataOffset = in.read_u64();
    entry.uncompressedSize = in.read_u64();
    entry.compressedSize = in.read_u64();
    entry.method = static_cast<Compression>(in.read_u8());
    entry.crc32 = in.read_u32();
    entry.mtime = in.read_i64();
    entry.path = in.read_string();
    return entry;
}

} // namespace polyserve::vfs
