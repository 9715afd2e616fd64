#include "self_image.hpp"

#include <system_error>

namespace polyserve::core {

std::optional<std::filesystem::path> executable_path(const char* argv0) {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && fs::is_regular_file(self, ec)) {
        return self;
    }

    if (argv0 == nullptr || *argv0 == '\0') {
        return std::nullopt;
    }

    fs::path fallback = fs::absolute(argv0, ec);
    if (ec || !fs::is_regular_file(fallback, ec)) {
        return std::nullopt;
    }
    return fallback;
}

} // namespace polyserve::core
