#pragma once

#include "request.hpp"

#include <cstddef>
#include <string_view>

namespace polyserve::http {

// Parses an HTTP/1.0 or HTTP/1.1 request head (request line + headers).
// Request bodies are not parsed; the caller skips contentLength bytes.
class RequestParser {
public:
    enum class Result {
        Incomplete,  // Need more bytes.
        Complete,    // `out` filled; parsed_length() bytes consumed.
        Bad,         // Malformed; answer 400 and close.
        TooLarge,    // Head exceeds the limit; answer 431 and close.
    };

    static constexpr std::size_t kDefaultMaxHeadSize = 8192;

    explicit RequestParser(std::size_t maxHeadSize = kDefaultMaxHeadSize);

    Result parse(std::string_view buffer, Request& out);

    // Length of the request head consumed by the last Complete parse,
    // including any leading blank lines and the terminating blank line.
    std::size_t parsed_length() const { return parsedLength_; }

private:
    bool parse_request_line(std::string_view line, Request& out) const;
    bool parse_header_line(std::string_view line, Request& out) const;
    bool finish_headers(Request& out) const;

    std::size_t maxHeadSize_;
    std::size_t parsedLength_{0};
};

} // namespace polyserve::http
