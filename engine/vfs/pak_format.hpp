#pragma once

// polyserve archive section format (PSAR)
//
// The archive section is appended to an arbitrary executable stub. Every
// offset below is relative to the start of the archive section, which a
// reader computes as (file length - Trailer.sectionSize). The stub length is
// never stored anywhere.
//
// All integers are little-endian.
//
// Layout:
// ┌─────────────────────────────────────┐
// │ Stub (opaque, any length >= 0)      │
// ╞═════════════════════════════════════╡  <- archive section start
// │ FileRecord * entry_count            │
// │   magic         : u32 = "PSFR"      │
// │   path_len      : u16               │
// │   path          : char[path_len]    │
// │   uncompressed  : u64               │
// │   compressed    : u64               │
// │   method        : u8                │
// │   crc32         : u32               │
// │   mtime         : i64               │
// │   data          : u8[compressed]    │
// ├─────────────────────────────────────┤
// │ Directory (path-sorted)             │
// │   magic         : u32 = "PSDE"      │
// │   record_offset : u64               │
// │   data_offset   : u64               │
// │   uncompressed  : u64               │
// │   compressed    : u64               │
// │   method        : u8                │
// │   crc32         : u32               │
// │   mtime         : i64               │
// │   path_len      : u16               │
// │   path          : char[path_len]    │
// ├─────────────────────────────────────┤
// │ Trailer (40 bytes, at end of file)  │
// │   magic         : u32 = "PSTR"      │
// │   version       : u32 = 1           │
// │   entry_count   : u32               │
// │   directory_crc : u32               │
// │   dir_offset    : u64               │
// │   dir_size      : u64               │
// │   section_size  : u64               │
// └─────────────────────────────────────┘

#include "core/byte_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace polyserve::vfs {

// "PSFR", "PSDE", "PSTR" as little-endian u32.
constexpr std::uint32_t PAK_RECORD_MAGIC = 0x52465350;
constexpr std::uint32_t PAK_DIRENT_MAGIC = 0x45445350;
constexpr std::uint32_t PAK_TRAILER_MAGIC = 0x52545350;

// Current format version
constexpr std::uint32_t PAK_VERSION = 1;

// Trailer size in bytes
constexpr std::size_t PAK_TRAILER_SIZE = 40;

// Fixed part of a FileRecord header (everything but the path).
constexpr std::size_t PAK_RECORD_FIXED_SIZE = 4 + 2 + 8 + 8 + 1 + 4 + 8;

// Fixed part of a DirectoryEntry (everything but the path).
constexpr std::size_t PAK_DIRENT_FIXED_SIZE = 4 + 8 + 8 + 8 + 8 + 1 + 4 + 8 + 2;

// Smallest possible directory entry: a one-byte path.
constexpr std::size_t PAK_DIRENT_MIN_SIZE = PAK_DIRENT_FIXED_SIZE + 1;

// Maximum path length (u16 length prefix).
constexpr std::size_t PAK_MAX_PATH_LENGTH = 0xFFFF;

enum class Compression : std::uint8_t {
    Stored = 0,
    Deflate = 8,
};

struct Trailer {
    std::uint32_t magic{PAK_TRAILER_MAGIC};
    std::uint32_t version{PAK_VERSION};
    std::uint32_t entryCount{0};
    std::uint32_t directoryCrc{0};
    std::uint64_t directoryOffset{0};
    std::uint64_t directorySize{0};
    std::uint64_t sectionSize{0};
};

// One directory entry as held in memory by both writer and reader.
struct DirectoryEntry {
    std::string path;
    std::uint64_t recordOffset{0};
    std::uint64_t dataOffset{0};
    std::uint64_t uncompressedSize{0};
    std::uint64_t compressedSize{0};
    Compression method{Compression::Stored};
    std::uint32_t crc32{0};
    std::int64_t mtime{0};
};

// --- Serialization (little-endian, see layout above) ---

void write_trailer(core::ByteWriter& out, const Trailer& trailer);

// Reads the fixed-size trailer. Does not validate field values.
// Throws std::runtime_error if fewer than PAK_TRAILER_SIZE bytes are given.
Trailer read_trailer(std::span<const std::uint8_t> bytes);

void write_record_header(core::ByteWriter& out, const DirectoryEntry& entry);

void write_directory_entry(core::ByteWriter& out, const DirectoryEntry& entry);

// Throws std::runtime_error on short input or a bad entry magic.
DirectoryEntry read_directory_entry(core::ByteReader& in);

} // namespace polyserve::vfs
