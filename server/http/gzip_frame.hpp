#pragma once

// gzip (RFC 1952) framing around a raw deflate stream already stored in the
// archive, so deflated entries can be served without inflating them.

#include <array>
#include <cstddef>
#include <cstdint>

namespace polyserve::http::gzip {

constexpr std::size_t kHeaderSize = 10;
constexpr std::size_t kTrailerSize = 8;

inline std::array<std::uint8_t, kHeaderSize> header(std::int64_t mtime) {
    const auto t = static_cast<std::uint32_t>(mtime > 0 ? mtime : 0);
    return {
        0x1F, 0x8B,  // ID1, ID2
        0x08,        // CM = deflate
        0x00,        // FLG
        static_cast<std::uint8_t>(t), static_cast<std::uint8_t>(t >> 8),
        static_cast<std::uint8_t>(t >> 16), static_cast<std::uint8_t>(t >> 24),
        0x00,        // XFL
        0x03,        // OS = Unix
    };
}

// CRC-32 and ISIZE (length mod 2^32) of the uncompressed data.
inline std::array<std::uint8_t, kTrailerSize> trailer(std::uint32_t crc, std::uint64_t size) {
    const auto isize = static_cast<std::uint32_t>(size);
    return {
        static_cast<std::uint8_t>(crc), static_cast<std::uint8_t>(crc >> 8),
        static_cast<std::uint8_t>(crc >> 16), static_cast<std::uint8_t>(crc >> 24),
        static_cast<std::uint8_t>(isize), static_cast<std::uint8_t>(isize >> 8),
        static_cast<std::uint8_t>(isize >> 16), static_cast<std::uint8_t>(isize >> 24),
    };
}

} // namespace polyserve::http::gzip
