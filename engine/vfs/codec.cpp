#include "codec.hpp"

#include <algorithm>
#include <limits>

namespace polyserve::vfs::codec {

namespace {

// zlib counts in uInt; feed large buffers in slices.
constexpr std::size_t kMaxZlibChunk = std::numeric_limits<uInt>::max();

} // namespace

std::uint32_t crc32(std::span<const std::uint8_t> data, std::uint32_t crc) {
    uLong value = crc;
    while (!data.empty()) {
        const std::size_t n = std::min(data.size(), kMaxZlibChunk);
        value = ::crc32(value, data.data(), static_cast<uInt>(n));
        data = data.subspan(n);
    }
    return static_cast<std::uint32_t>(value);
}

std::optional<std::vector<std::uint8_t>> deflate_raw(std::span<const std::uint8_t> data, int level) {
    z_stream strm{};

    // Negative window bits: raw deflate, no header or checksum.
    if (deflateInit2(&strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())));
    std::size_t written = 0;
    std::size_t consumed = 0;
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        const std::size_t inChunk = std::min(data.size() - consumed, kMaxZlibChunk);
        strm.next_in = const_cast<Bytef*>(data.data() + consumed);
        strm.avail_in = static_cast<uInt>(inChunk);

        if (written == out.size()) {
            out.resize(out.size() * 2 + 64);
        }
        const std::size_t outChunk = std::min(out.size() - written, kMaxZlibChunk);
        strm.next_out = out.data() + written;
        strm.avail_out = static_cast<uInt>(outChunk);

        const bool last = consumed + inChunk == data.size();
        ret = deflate(&strm, last ? Z_FINISH : Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            return std::nullopt;
        }

        consumed += inChunk - strm.avail_in;
        written += outChunk - strm.avail_out;
    }

    deflateEnd(&strm);
    out.resize(written);
    return out;
}

Inflater::Inflater() {
    if (inflateInit2(&stream_, -MAX_WBITS) == Z_OK) {
        initialized_ = true;
    }
}

Inflater::~Inflater() {
    if (initialized_) {
        inflateEnd(&stream_);
    }
}

Inflater::Status Inflater::inflate(std::span<const std::uint8_t>& input, std::span<std::uint8_t> out,
                                   std::size_t& produced) {
    produced = 0;
    if (!initialized_) {
        return Status::Error;
    }

    const std::size_t inChunk = std::min(input.size(), kMaxZlibChunk);
    const std::size_t outChunk = std::min(out.size(), kMaxZlibChunk);

    stream_.next_in = const_cast<Bytef*>(input.data());
    stream_.avail_in = static_cast<uInt>(inChunk);
    stream_.next_out = out.data();
    stream_.avail_out = static_cast<uInt>(outChunk);

    const int ret = ::inflate(&stream_, Z_NO_FLUSH);

    input = input.subspan(inChunk - stream_.avail_in);
    produced = outChunk - stream_.avail_out;

    switch (ret) {
        case Z_OK:
            return Status::Ok;
        case Z_STREAM_END:
            return Status::StreamEnd;
        case Z_BUF_ERROR:
            // No progress possible with the buffers given; caller supplies more.
            return Status::Ok;
        default:
            return Status::Error;
    }
}

} // namespace polyserve::vfs::codec
