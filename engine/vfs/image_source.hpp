#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace polyserve::vfs {

// Random-access, read-only view of a whole artifact image.
// Implementations must allow concurrent read_at() calls without locking.
class ImageSource {
public:
    virtual ~ImageSource() = default;

    // Total image length, fixed at open time.
    virtual std::uint64_t size() const = 0;

    // Fill `out` with bytes starting at absolute `offset`.
    // @return false on I/O error or if the range extends past the end.
    virtual bool read_at(std::uint64_t offset, std::span<std::uint8_t> out) const = 0;
};

// Image backed by a file descriptor, read with pread().
class FileImage : public ImageSource {
public:
    ~FileImage() override;

    FileImage(const FileImage&) = delete;
    FileImage& operator=(const FileImage&) = delete;

    // @return nullptr if the file cannot be opened or measured.
    static std::shared_ptr<FileImage> open(const std::filesystem::path& path);

    std::uint64_t size() const override { return size_; }
    bool read_at(std::uint64_t offset, std::span<std::uint8_t> out) const override;

    const std::filesystem::path& path() const { return path_; }

private:
    FileImage(std::filesystem::path path, int fd, std::uint64_t size);

    std::filesystem::path path_;
    int fd_{-1};
    std::uint64_t size_{0};
};

// Image held in memory.
class MemoryImage : public ImageSource {
public:
    explicit MemoryImage(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}

    std::uint64_t size() const override { return bytes_.size(); }
    bool read_at(std::uint64_t offset, std::span<std::uint8_t> out) const override;

private:
    std::vector<std::uint8_t> bytes_;
};

} // namespace polyserve::vfs
