#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace polyserve::http {

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string format_http_date(std::int64_t unixSeconds);

// Parses IMF-fixdate only; other legacy formats yield std::nullopt.
std::optional<std::int64_t> parse_http_date(std::string_view text);

} // namespace polyserve::http
