#include "request_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace polyserve::http {

namespace {

// RFC 9110 token characters.
bool is_tchar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool is_token(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_tchar);
}

bool has_control_chars(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return (u < 0x20 && c != '\t') || u == 0x7F;
    });
}

std::string_view trim_ows(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// True if the comma-separated header value lists `token` (case-insensitive).
bool list_contains(std::string_view value, std::string_view token) {
    while (!value.empty()) {
        auto comma = value.find(',');
        std::string_view item = trim_ows(value.substr(0, comma));
        if (to_lower(item) == token) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        value.remove_prefix(comma + 1);
    }
    return false;
}

} // namespace

RequestParser::RequestParser(std::size_t maxHeadSize) : maxHeadSize_(maxHeadSize) {}

RequestParser::Result RequestParser::parse(std::string_view buffer, Request& out) {
    parsedLength_ = 0;
    out = Request{};

    // Ignore blank lines before the request line.
    std::size_t lineStart = 0;
    while (lineStart < buffer.size() && (buffer[lineStart] == '\r' || buffer[lineStart] == '\n')) {
        ++lineStart;
    }

    bool requestLineSeen = false;
    while (true) {
        const auto nl = buffer.find('\n', lineStart);
        if (nl == std::string_view::npos) {
            return buffer.size() > maxHeadSize_ ? Result::TooLarge : Result::Incomplete;
        }
        if (nl + 1 > maxHeadSize_) {
            return Result::TooLarge;
        }

        std::string_view line = buffer.substr(lineStart, nl - lineStart);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lineStart = nl + 1;

        if (!requestLineSeen) {
            // Reject as soon as the first line is known to be bad.
            if (!parse_request_line(line, out)) {
                return Result::Bad;
            }
            requestLineSeen = true;
            continue;
        }

        if (line.empty()) {
            if (!finish_headers(out)) {
                return Result::Bad;
            }
            parsedLength_ = lineStart;
            return Result::Complete;
        }

        if (!parse_header_line(line, out)) {
            return Result::Bad;
        }
    }
}

bool RequestParser::parse_request_line(std::string_view line, Request& out) const {
    if (has_control_chars(line)) {
        return false;
    }

    const auto sp1 = line.find(' ');
    if (sp1 == std::string_view::npos) {
        return false;
    }
    const auto sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos || line.find(' ', sp2 + 1) != std::string_view::npos) {
        return false;
    }

    std::string_view method = line.substr(0, sp1);
    std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string_view version = line.substr(sp2 + 1);

    if (!is_token(method) || target.empty()) {
        return false;
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return false;
    }

    // Absolute-form: keep only the path and query.
    if (target.front() != '/') {
        const auto scheme = target.find("://");
        if (scheme == std::string_view::npos) {
            return false;
        }
        const auto slash = target.find('/', scheme + 3);
        target = (slash == std::string_view::npos) ? std::string_view("/") : target.substr(slash);
    }

    out.method = std::string(method);
    out.target = std::string(target);
    out.version = std::string(version);
    return true;
}

bool RequestParser::parse_header_line(std::string_view line, Request& out) const {
    // Obsolete line folding is rejected.
    if (line.front() == ' ' || line.front() == '\t' || has_control_chars(line)) {
        return false;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return false;
    }

    std::string_view name = line.substr(0, colon);
    if (!is_token(name)) {
        return false;
    }

    const std::string key = to_lower(name);
    const std::string value(trim_ows(line.substr(colon + 1)));

    auto [it, inserted] = out.headers.emplace(key, value);
    if (!inserted) {
        if (key == "content-length") {
            // Repeats must agree.
            return it->second == value;
        }
        it->second += ", " + value;
    }
    return true;
}

bool RequestParser::finish_headers(Request& out) const {
    if (const std::string* cl = out.header("content-length")) {
        const char* first = cl->data();
        const char* last = cl->data() + cl->size();
        auto [ptr, ec] = std::from_chars(first, last, out.contentLength);
        if (cl->empty() || ec != std::errc() || ptr != last) {
            return false;
        }
    }

    out.hasTransferEncoding = out.header("transfer-encoding") != nullptr;

    const std::string* connection = out.header("connection");
    if (out.version == "HTTP/1.1") {
        out.keepAlive = !(connection && list_contains(*connection, "close"));
    } else {
        out.keepAlive = connection && list_contains(*connection, "keep-alive");
    }
    return true;
}

} // namespace polyserve::http
