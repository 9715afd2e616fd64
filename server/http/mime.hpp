#pragma once

#include <string>
#include <string_view>

namespace polyserve::http::mime {

// Content-Type for a path, from its extension.
// Unknown extensions map to "application/octet-stream".
std::string from_path(std::string_view path);

} // namespace polyserve::http::mime
