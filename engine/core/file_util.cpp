#include "file_util.hpp"

#include <cstdio>
#include <fstream>
#include <system_error>

#include <unistd.h>

namespace polyserve::core {

std::optional<std::vector<std::uint8_t>> read_file(const std::filesystem::path& filePath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec) || ec) {
        return std::nullopt;
    }

    const auto size = std::filesystem::file_size(filePath, ec);
    if (ec) {
        return std::nullopt;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> data(size);
    if (size > 0) {
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
        if (!file) {
            return std::nullopt;
        }
    }

    return data;
}

bool write_file_atomic(const std::filesystem::path& target,
                       std::initializer_list<std::span<const std::uint8_t>> parts,
                       bool executable) {
    namespace fs = std::filesystem;

    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(::getpid());

    std::FILE* file = std::fopen(tmp.string().c_str(), "wb");
    if (!file) {
        return false;
    }

    bool ok = true;
    for (const auto& part : parts) {
        if (!part.empty() && std::fwrite(part.data(), 1, part.size(), file) != part.size()) {
            ok = false;
            break;
        }
    }
    if (std::fflush(file) != 0) {
        ok = false;
    }
    if (std::fclose(file) != 0) {
        ok = false;
    }

    std::error_code ec;
    if (ok && executable) {
        fs::permissions(tmp,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                            fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace, ec);
        ok = !ec;
    }
    if (ok) {
        fs::rename(tmp, target, ec);
        ok = !ec;
    }

    if (!ok) {
        fs::remove(tmp, ec);
    }
    return ok;
}

} // namespace polyserve::core
