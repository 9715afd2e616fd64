#include "connection.hpp"

#include "core/logger.hpp"
#include "http/gzip_frame.hpp"
#include "http/http_date.hpp"
#include "http/request_parser.hpp"
#include "http/status.hpp"
#include "vfs/archive_error.hpp"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <optional>
#include <vector>

#include <sys/socket.h>
#include <sys/time.h>

namespace polyserve::server {

namespace {

constexpr std::size_t kReadChunk = 16 * 1024;
constexpr std::size_t kBodyChunk = 64 * 1024;
constexpr int kLingerTimeoutMs = 2000;

using core::LogLevel;
using core::logf;

} // namespace

Connection::Connection(int fd, std::string peer, const http::Router& router,
                       const ConnectionOptions& options)
    : fd_(fd), peer_(std::move(peer)), router_(router), options_(options) {}

void Connection::run() {
    serve();
    if (lingerOnClose_) {
        linger();
    }
}

void Connection::serve() {
    http::RequestParser parser;

    while (true) {
        http::Request request;
        auto result = parser.parse(inbuf_, request);
        while (result == http::RequestParser::Result::Incomplete) {
            // Peer closed or went idle: drop the connection without a response.
            if (!read_more()) {
                return;
            }
            result = parser.parse(inbuf_, request);
        }

        if (result == http::RequestParser::Result::Bad ||
            result == http::RequestParser::Result::TooLarge) {
            const int status = (result == http::RequestParser::Result::Bad)
                ? http::kBadRequest
                : http::kRequestHeaderFieldsTooLarge;
            lingerOnClose_ = true;
            write_response(request, http::Router::error(status), false);
            return;
        }

        inbuf_.erase(0, parser.parsed_length());

        bool keepAlive = options_.keepAlive && request.keepAlive;
        if (request.hasTransferEncoding) {
            // Chunked bodies are not decoded, so the stream cannot be resynchronized.
            keepAlive = false;
            lingerOnClose_ = true;
        } else if (request.contentLength > 0) {
            if (request.contentLength > options_.maxDrainBytes) {
                keepAlive = false;
                lingerOnClose_ = true;
            } else if (!skip_body(request.contentLength)) {
                return;
            }
        }

        http::ResponseDescriptor desc = router_.resolve(request);
        ++requestsServed_;

        if (!write_response(request, std::move(desc), keepAlive) || !keepAlive) {
            return;
        }
    }
}

void Connection::reject(int fd, std::string peer, const http::Router& router,
                        const ConnectionOptions& options, int status) {
    Connection conn(fd, std::move(peer), router, options);
    conn.write_response(http::Request{}, http::Router::error(status), false);
}

bool Connection::read_more() {
    char buf[kReadChunk];
    while (true) {
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            inbuf_.append(buf, static_cast<std::size_t>(n));
            return true;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            logf(LogLevel::Debug, "http", "%s idle timeout", peer_.c_str());
        }
        return false;
    }
}

bool Connection::skip_body(std::uint64_t length) {
    const std::uint64_t buffered = std::min<std::uint64_t>(length, inbuf_.size());
    inbuf_.erase(0, static_cast<std::size_t>(buffered));
    length -= buffered;

    while (length > 0) {
        if (!read_more()) {
            return false;
        }
        const std::uint64_t take = std::min<std::uint64_t>(length, inbuf_.size());
        inbuf_.erase(0, static_cast<std::size_t>(take));
        length -= take;
    }
    return true;
}

void Connection::linger() {
    if (::shutdown(fd_, SHUT_WR) != 0) {
        return;
    }

    timeval tv{};
    tv.tv_sec = kLingerTimeoutMs / 1000;
    tv.tv_usec = (kLingerTimeoutMs % 1000) * 1000;
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    char buf[kReadChunk];
    std::uint64_t drained = 0;
    while (drained < options_.maxDrainBytes) {
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        drained += static_cast<std::uint64_t>(n);
    }
}

bool Connection::send_all(const void* data, std::size_t size) {
    const char* p = static_cast<const char*>(data);
    while (size > 0) {
        const ssize_t n = ::send(fd_, p, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        p += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

bool Connection::write_head(const http::ResponseDescriptor& desc, bool keepAlive,
                            std::string_view firstChunk) {
    std::string head;
    head.reserve(256 + firstChunk.size());

    head += "HTTP/1.1 " + std::to_string(desc.status) + " " + http::reason(desc.status) + "\r\n";
    head += "Server: " + options_.serverName + "\r\n";
    head += "Date: " + http::format_http_date(static_cast<std::int64_t>(std::time(nullptr))) + "\r\n";

    if (desc.status != http::kNotModified) {
        head += "Content-Type: " + desc.contentType + "\r\n";
        head += "Content-Length: " + std::to_string(desc.contentLength) + "\r\n";
    }
    for (const auto& [name, value] : desc.headers) {
        head += name + ": " + value + "\r\n";
    }
    head += keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    head += "\r\n";
    head += firstChunk;

    return send_all(head.data(), head.size());
}

bool Connection::write_response(const http::Request& request, http::ResponseDescriptor desc,
                                bool keepAlive) {
    const bool sendBody = !desc.headOnly && desc.bodyKind != http::BodyKind::None &&
                          http::status_allows_body(desc.status);

    if (desc.bodyKind != http::BodyKind::Entry || !sendBody) {
        const std::string_view body = (sendBody && desc.bodyKind == http::BodyKind::Inline)
            ? std::string_view(desc.inlineBody)
            : std::string_view();
        const bool ok = write_head(desc, keepAlive, body);
        log_access(request, desc.status, body.size());
        return ok;
    }

    const vfs::DirectoryEntry& entry = *desc.entry;
    const bool gzip = desc.encoding == http::BodyEncoding::Gzip;
    const vfs::ArchiveIndex& index = router_.index();

    std::vector<std::uint8_t> chunk(kBodyChunk);
    std::optional<vfs::BodyReader> reader;
    std::string first;

    // Read the first chunk before committing to a status line, so an
    // unreadable image still gets a clean 500.
    try {
        reader.emplace(gzip ? index.open_raw(entry) : index.open_body(entry));
        if (gzip) {
            const auto header = http::gzip::header(entry.mtime);
            first.append(reinterpret_cast<const char*>(header.data()), header.size());
        }
        const std::size_t n = reader->read(chunk);
        first.append(reinterpret_cast<const char*>(chunk.data()), n);
    } catch (const vfs::ArchiveError& e) {
        logf(LogLevel::Error, "http", "cannot read '%s': %s", entry.path.c_str(), e.what());
        http::ResponseDescriptor err = http::Router::error(http::kInternalServerError);
        const bool ok = write_head(err, keepAlive, err.inlineBody);
        log_access(request, err.status, err.inlineBody.size());
        return ok;
    }

    if (!write_head(desc, keepAlive, first)) {
        return false;
    }
    std::uint64_t sent = first.size();

    try {
        while (!reader->done()) {
            const std::size_t n = reader->read(chunk);
            if (n == 0) {
                break;
            }
            if (!send_all(chunk.data(), n)) {
                return false;
            }
            sent += n;
        }
    } catch (const vfs::ArchiveError& e) {
        // Status already sent; the only safe signal left is closing the connection.
        logf(LogLevel::Error, "http", "aborting '%s' after %llu bytes: %s", entry.path.c_str(),
             static_cast<unsigned long long>(sent), e.what());
        return false;
    }

    if (gzip) {
        const auto trailer = http::gzip::trailer(entry.crc32, entry.uncompressedSize);
        if (!send_all(trailer.data(), trailer.size())) {
            return false;
        }
        sent += trailer.size();
    }

    log_access(request, desc.status, sent);

    if (sent != desc.contentLength) {
        logf(LogLevel::Error, "http", "'%s' sent %llu bytes, declared %llu", entry.path.c_str(),
             static_cast<unsigned long long>(sent),
             static_cast<unsigned long long>(desc.contentLength));
        return false;
    }
    return true;
}

void Connection::log_access(const http::Request& request, int status, std::uint64_t bytes) const {
    if (!core::Logger::instance().access_enabled()) {
        return;
    }
    logf(LogLevel::Info, "access", "%s \"%s %s %s\" %d %llu", peer_.c_str(),
         request.method.empty() ? "-" : request.method.c_str(),
         request.target.empty() ? "-" : request.target.c_str(),
         request.version.empty() ? "-" : request.version.c_str(), status,
         static_cast<unsigned long long>(bytes));
}

} // namespace polyserve::server
