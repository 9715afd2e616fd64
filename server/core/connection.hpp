#pragma once

// Connection - one accepted client socket.
// Reads requests in order, answers each before reading the next.

#include "http/request.hpp"
#include "http/router.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace polyserve::server {

struct ConnectionOptions {
    bool keepAlive{true};
    std::string serverName{"polyserve"};

    // Request bodies up to this size are skipped to keep the connection in
    // sync; larger ones end the connection after the response.
    std::uint64_t maxDrainBytes{1024 * 1024};
};

class Connection {
public:
    // Does not take ownership of `fd`.
    Connection(int fd, std::string peer, const http::Router& router, const ConnectionOptions& options);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Serve until the peer closes, a timeout fires, or a response ends the connection.
    void run();

    std::uint64_t requests_served() const { return requestsServed_; }

    // Answer a connection that will not be served (e.g. 503 at the limit).
    static void reject(int fd, std::string peer, const http::Router& router,
                       const ConnectionOptions& options, int status);

private:
    void serve();
    bool read_more();
    bool skip_body(std::uint64_t length);
    void linger();
    bool send_all(const void* data, std::size_t size);

    // @return false if the connection must be closed.
    bool write_response(const http::Request& request, http::ResponseDescriptor desc, bool keepAlive);
    bool write_head(const http::ResponseDescriptor& desc, bool keepAlive, std::string_view firstChunk);
    void log_access(const http::Request& request, int status, std::uint64_t bytes) const;

    int fd_;
    std::string peer_;
    const http::Router& router_;
    const ConnectionOptions& options_;

    std::string inbuf_;
    std::uint64_t requestsServed_{0};

    // Closing with unread input may reset the connection before the client
    // has read our response, so drain first.
    bool lingerOnClose_{false};
};

} // namespace polyserve::server
