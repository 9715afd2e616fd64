#pragma once

// HttpServer - HTTP/1.1 listener serving files out of an ArchiveIndex.
// One accept thread, one worker thread per connection.

#include "connection.hpp"

#include "http/router.hpp"
#include "vfs/archive_index.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace polyserve::server {

class HttpServer {
public:
    // Starts a thread running `fn`. May throw std::system_error like the
    // std::thread constructor does.
    using ThreadFactory = std::function<std::thread(std::function<void()> fn)>;

    struct Config {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};  // 0 picks an ephemeral port, see port().
        std::size_t maxConnections{256};
        std::uint32_t idleTimeoutMs{60000};

        ConnectionOptions connection{};
        http::RouterOptions router{};

        // Empty: plain std::thread.
        ThreadFactory threadFactory{};
    };

    HttpServer(std::shared_ptr<const vfs::ArchiveIndex> index, const Config& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind, listen and start accepting. Returns false if the socket could
    // not be bound; the server is then not running.
    bool start();

    // Stop accepting, unblock and join every connection. Safe to call twice.
    void stop();

    bool is_running() const { return running_.load(); }

    // Port actually bound (valid after a successful start()).
    std::uint16_t port() const { return boundPort_; }

    // Connections currently being served.
    std::size_t connection_count() const;

    const http::Router& router() const { return router_; }

private:
    struct Worker {
        int fd{-1};
        std::thread thread;
        std::atomic<bool> done{false};
    };

    std::thread spawn_(std::function<void()> fn) const;
    void accept_loop_();
    void handle_accept_(int fd, std::string peer);
    void reap_workers_();

    Config config_;
    http::Router router_;

    int listenFd_{-1};
    std::uint16_t boundPort_{0};

    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex workersMutex_;
    std::list<std::unique_ptr<Worker>> workers_;
};

} // namespace polyserve::server
