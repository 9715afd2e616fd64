#pragma once

// Little-endian byte serialization shared by every on-disk structure of the
// archive format. Layout never depends on host endianness or struct packing.

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace polyserve::core {

// ============================================================================
// ByteWriter - append-only little-endian encoder
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    void write_u8(std::uint8_t v) { data_.push_back(v); }
    void write_u16(std::uint16_t v) { put_le(v); }
    void write_u32(std::uint32_t v) { put_le(v); }
    void write_u64(std::uint64_t v) { put_le(v); }
    void write_i64(std::int64_t v) { put_le(static_cast<std::uint64_t>(v)); }

    // u16 length prefix followed by the raw bytes.
    void write_string(std::string_view s) {
        if (s.size() > 0xFFFF) {
            throw std::runtime_error("ByteWriter: string longer than 65535 bytes");
        }
        write_u16(static_cast<std::uint16_t>(s.size()));
        data_.insert(data_.end(), s.begin(), s.end());
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    std::size_t size() const { return data_.size(); }
    std::span<const std::uint8_t> data() const { return data_; }
    std::vector<std::uint8_t> take() { return std::move(data_); }

private:
    template <typename T>
    void put_le(T v) {
        static_assert(std::is_unsigned_v<T>);
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            data_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        }
    }

    std::vector<std::uint8_t> data_;
};

// ============================================================================
// ByteReader - bounds-checked little-endian decoder over a borrowed span
// ============================================================================

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    std::uint8_t read_u8() { return get_le<std::uint8_t>(); }
    std::uint16_t read_u16() { return get_le<std::uint16_t>(); }
    std::uint32_t read_u32() { return get_le<std::uint32_t>(); }
    std::uint64_t read_u64() { return get_le<std::uint64_t>(); }
    std::int64_t read_i64() { return static_cast<std::int64_t>(get_le<std::uint64_t>()); }

    std::string read_string() {
        const auto bytes = read_bytes(read_u16());
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    // View into the underlying buffer; valid as long as it is.
    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        require(count);
        auto out = data_.subspan(pos_, count);
        pos_ += count;
        return out;
    }

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

private:
    template <typename T>
    T get_le() {
        static_assert(std::is_unsigned_v<T>);
        require(sizeof(T));
        T v = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            v = static_cast<T>(v | (static_cast<T>(data_[pos_ + i]) << (8 * i)));
        }
        pos_ += sizeof(T);
        return v;
    }

    void require(std::size_t need) const {
        if (need > data_.size() - pos_) {
            throw std::runtime_error("ByteReader: not enough data");
        }
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_{0};
};

} // namespace polyserve::core
