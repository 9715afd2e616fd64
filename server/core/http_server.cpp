#include "http_server.hpp"

#include "core/logger.hpp"
#include "http/status.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace polyserve::server {

namespace {

using core::LogLevel;
using core::logf;

constexpr int kListenBacklog = 128;
constexpr int kAcceptPollMs = 100;

std::string describe_peer(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = "?";
    std::uint16_t port = 0;

    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
        return std::string(host) + ":" + std::to_string(port);
    }
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
        return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    return host;
}

void set_timeouts(int fd, std::uint32_t timeoutMs) {
    if (timeoutMs == 0) {
        return;
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        logf(LogLevel::Warning, "net", "setsockopt(timeout) failed: %s", std::strerror(errno));
    }
}

} // namespace

HttpServer::HttpServer(std::shared_ptr<const vfs::ArchiveIndex> index, const Config& config)
    : config_(config), router_(std::move(index), config.router) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_.load()) return false;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST | AI_NUMERICSERV;

    const std::string service = std::to_string(config_.port);
    addrinfo* result = nullptr;
    const int rc = ::getaddrinfo(config_.address.empty() ? nullptr : config_.address.c_str(),
                                 service.c_str(), &hints, &result);
    if (rc != 0) {
        logf(LogLevel::Error, "net", "invalid listen address '%s': %s", config_.address.c_str(),
             ::gai_strerror(rc));
        return false;
    }

    int fd = ::socket(result->ai_family, result->ai_socktype | SOCK_CLOEXEC, result->ai_protocol);
    if (fd < 0) {
        logf(LogLevel::Error, "net", "socket() failed: %s", std::strerror(errno));
        ::freeaddrinfo(result);
        return false;
    }

    const int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, result->ai_addr, result->ai_addrlen) != 0 ||
        ::listen(fd, kListenBacklog) != 0) {
        logf(LogLevel::Error, "net", "failed to bind %s:%u: %s", config_.address.c_str(),
             static_cast<unsigned>(config_.port), std::strerror(errno));
        ::close(fd);
        ::freeaddrinfo(result);
        return false;
    }
    ::freeaddrinfo(result);

    sockaddr_storage bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        if (bound.ss_family == AF_INET) {
            boundPort_ = ntohs(reinterpret_cast<const sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            boundPort_ = ntohs(reinterpret_cast<const sockaddr_in6*>(&bound)->sin6_port);
        }
    } else {
        boundPort_ = config_.port;
    }

    listenFd_ = fd;
    logf(LogLevel::Info, "net", "listening on %s:%u (%zu files)", config_.address.c_str(),
         static_cast<unsigned>(boundPort_), router_.index().entries().size());

    running_.store(true);
    try {
        thread_ = spawn_([this]() { accept_loop_(); });
    } catch (const std::system_error& e) {
        logf(LogLevel::Error, "net", "cannot start accept thread: %s", e.what());
        running_.store(false);
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    return true;
}

std::thread HttpServer::spawn_(std::function<void()> fn) const {
    if (config_.threadFactory) {
        return config_.threadFactory(std::move(fn));
    }
    return std::thread(std::move(fn));
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) {
        thread_.join();
    }

    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }

    std::list<std::unique_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers.swap(workers_);
    }

    // Wake workers blocked in recv/send; each fd stays open until its thread is joined.
    for (auto& worker : workers) {
        ::shutdown(worker->fd, SHUT_RDWR);
    }
    for (auto& worker : workers) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
        ::close(worker->fd);
    }

    logf(LogLevel::Info, "net", "server stopped");
}

std::size_t HttpServer::connection_count() const {
    std::lock_guard<std::mutex> lock(workersMutex_);
    std::size_t count = 0;
    for (const auto& worker : workers_) {
        if (!worker->done.load()) {
            count++;
        }
    }
    return count;
}

void HttpServer::accept_loop_() {
    while (running_.load()) {
        reap_workers_();

        pollfd pfd{};
        pfd.fd = listenFd_;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready <= 0) {
            if (ready < 0 && errno != EINTR) {
                logf(LogLevel::Error, "net", "poll() failed: %s", std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptPollMs));
            }
            continue;
        }

        sockaddr_storage peer{};
        socklen_t peerLen = sizeof(peer);
        const int fd = ::accept4(listenFd_, reinterpret_cast<sockaddr*>(&peer), &peerLen,
                                 SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK &&
                errno != ECONNABORTED) {
                // EMFILE and friends: back off and keep the listener alive.
                logf(LogLevel::Warning, "net", "accept() failed: %s", std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptPollMs));
            }
            continue;
        }

        handle_accept_(fd, describe_peer(peer));
    }
}

void HttpServer::handle_accept_(int fd, std::string peer) {
    set_timeouts(fd, config_.idleTimeoutMs);

    if (config_.maxConnections > 0 && connection_count() >= config_.maxConnections) {
        logf(LogLevel::Warning, "net", "%s rejected: %zu connections open", peer.c_str(),
             config_.maxConnections);
        Connection::reject(fd, std::move(peer), router_, config_.connection,
                           http::kServiceUnavailable);
        ::close(fd);
        return;
    }

    logf(LogLevel::Debug, "net", "%s connected", peer.c_str());

    auto worker = std::make_unique<Worker>();
    Worker* raw = worker.get();
    raw->fd = fd;

    // The worker is published only once its thread exists; stop() joins this
    // thread before collecting workers, so none can be missed.
    try {
        raw->thread = spawn_([this, raw, peer]() {
            Connection conn(raw->fd, peer, router_, config_.connection);
            conn.run();
            logf(LogLevel::Debug, "net", "%s closed after %llu requests", peer.c_str(),
                 static_cast<unsigned long long>(conn.requests_served()));
            raw->done.store(true);
        });
    } catch (const std::system_error& e) {
        logf(LogLevel::Warning, "net", "%s rejected: cannot start worker: %s", peer.c_str(), e.what());
        Connection::reject(fd, std::move(peer), router_, config_.connection,
                           http::kServiceUnavailable);
        ::close(fd);
        return;
    }

    std::lock_guard<std::mutex> lock(workersMutex_);
    workers_.push_back(std::move(worker));
}

void HttpServer::reap_workers_() {
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        Worker& worker = **it;
        if (!worker.done.load()) {
            ++it;
            continue;
        }
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
        ::close(worker.fd);
        it = workers_.erase(it);
    }
}

} // namespace polyserve::server
