#include "image_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace polyserve::vfs {

FileImage::FileImage(std::filesystem::path path, int fd, std::uint64_t size)
    : path_(std::move(path)), fd_(fd), size_(size) {}

FileImage::~FileImage() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::shared_ptr<FileImage> FileImage::open(const std::filesystem::path& path) {
    const std::string pathStr = path.string();
    const int fd = ::open(pathStr.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return nullptr;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return nullptr;
    }

    return std::shared_ptr<FileImage>(new FileImage(path, fd, static_cast<std::uint64_t>(st.st_size)));
}

bool FileImage::read_at(std::uint64_t offset, std::span<std::uint8_t> out) const {
    if (offset > size_ || out.size() > size_ - offset) {
        return false;
    }

    std::size_t done = 0;
    while (done < out.size()) {
        const ssize_t n = ::pread(fd_, out.data() + done, out.size() - done,
                                  static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (n == 0) {
            // File shrank underneath us.
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

bool MemoryImage::read_at(std::uint64_t offset, std::span<std::uint8_t> out) const {
    if (offset > bytes_.size() || out.size() > bytes_.size() - offset) {
        return false;
    }
    if (!out.empty()) {
        std::memcpy(out.data(), bytes_.data() + offset, out.size());
    }
    return true;
}

} // namespace polyserve::vfs
