#pragma once

// zlib wrappers for the two compression methods of the archive format.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace polyserve::vfs::codec {

// CRC-32 (IEEE), chainable: crc32(b, crc32(a)) == crc32(a || b).
std::uint32_t crc32(std::span<const std::uint8_t> data, std::uint32_t crc = 0);

// Raw deflate (RFC 1951, no zlib or gzip framing).
// @return Compressed bytes, or std::nullopt if zlib fails.
std::optional<std::vector<std::uint8_t>> deflate_raw(std::span<const std::uint8_t> data,
                                                     int level = Z_BEST_COMPRESSION);

// Streaming raw inflate. Non-copyable; owns the z_stream.
class Inflater {
public:
    enum class Status {
        Ok,         // Progress made, stream not finished.
        StreamEnd,  // Final block decoded.
        Error,      // Corrupt input.
    };

    Inflater();
    ~Inflater();

    Inflater(const Inflater&) = delete;
    Inflater& operator=(const Inflater&) = delete;

    bool valid() const { return initialized_; }

    // Consume from `input` (advanced past consumed bytes) and write into `out`.
    // `produced` receives the number of bytes written.
    Status inflate(std::span<const std::uint8_t>& input, std::span<std::uint8_t> out,
                   std::size_t& produced);

private:
    z_stream stream_{};
    bool initialized_{false};
};

} // namespace polyserve::vfs::codec
