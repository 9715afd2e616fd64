#include "path.hpp"

#include "pak_format.hpp"

#include <cctype>

namespace polyserve::vfs {

std::optional<std::string> normalize_path(std::string_view path) {
    std::size_t start = 0;
    while (start < path.size() && path[start] == '/') {
        ++start;
    }
    path.remove_prefix(start);

    if (path.empty() || path.size() > PAK_MAX_PATH_LENGTH) {
        return std::nullopt;
    }

    std::size_t segStart = 0;
    for (std::size_t i = 0; i <= path.size(); ++i) {
        if (i < path.size()) {
            const char c = path[i];
            if (c == '\0' || c == '\\') {
                return std::nullopt;
            }
            if (c != '/') {
                continue;
            }
        }

        const std::string_view segment = path.substr(segStart, i - segStart);
        if (segment.empty() || segment == "." || segment == "..") {
            return std::nullopt;
        }
        segStart = i + 1;
    }

    return std::string(path);
}

std::string path_extension(std::string_view path) {
    const auto slash = path.rfind('/');
    const std::string_view name = slash == std::string_view::npos ? path : path.substr(slash + 1);

    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return {};
    }

    std::string ext(name.substr(dot));
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

} // namespace polyserve::vfs
