#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace polyserve::http {

// One parsed request head. Lives as long as the request is being answered.
struct Request {
    std::string method;   // "GET"
    std::string target;   // "/docs/?page=2", origin-form
    std::string version;  // "HTTP/1.1"
    std::map<std::string, std::string> headers;  // Names lowercased.

    std::uint64_t contentLength{0};
    bool hasTransferEncoding{false};
    bool keepAlive{false};

    // @return Header value, or nullptr if absent. `name` must be lowercase.
    const std::string* header(std::string_view name) const {
        auto it = headers.find(std::string(name));
        return it == headers.end() ? nullptr : &it->second;
    }
};

} // namespace polyserve::http
