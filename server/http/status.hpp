#pragma once

namespace polyserve::http {

enum Status : int {
    kOk = 200,
    kMovedPermanently = 301,
    kNotModified = 304,
    kBadRequest = 400,
    kNotFound = 404,
    kMethodNotAllowed = 405,
    kRequestHeaderFieldsTooLarge = 431,
    kInternalServerError = 500,
    kServiceUnavailable = 503,
};

// Reason-Phrase for a status code.
inline const char* reason(int code) {
    switch (code) {
        case 200: return "OK";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default: break;
    }
    return "Unknown";
}

// 1xx, 204 and 304 never carry a body.
inline bool status_allows_body(int code) {
    return code >= 200 && code != 204 && code != 304;
}

} // namespace polyserve::http
