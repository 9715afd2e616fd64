/**
 * @file test_http_server.cpp
 * @brief End-to-end tests of the HTTP listener over loopback sockets.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"

#include "core/http_server.hpp"
#include "core/logger.hpp"
#include "http/http_date.hpp"
#include "vfs/codec.hpp"
#include "vfs/pak_format.hpp"
#include "vfs/polyglot.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <span>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <zlib.h>

using namespace polyserve;
using test_helpers::HttpClient;
using test_helpers::to_bytes;

namespace {

constexpr std::size_t kBigSize = 10 * 1024 * 1024;

struct Site {
    std::vector<std::uint8_t> big = test_helpers::noise_bytes(kBigSize, 0xC0FFEEu);
    std::string css = std::string(50000, 'c') + "/* end */";
    std::shared_ptr<const vfs::ArchiveIndex> index;

    Site() {
        // Keep test output to warnings and errors.
        core::LoggingConfig logging;
        logging.level = core::LogLevel::Warning;
        logging.access = false;
        core::Logger::instance().init(logging);

        vfs::ArchiveWriter writer;
        writer.add_file("index.html", to_bytes("<html>Hi</html>"), 1700000000);
        writer.add_file("docs/index.html", to_bytes("<html>Docs</html>"), 1700000000);
        writer.add_file("css/site.css", to_bytes(css), 1700000000);
        writer.add_file("big.bin", big, 1700000000);
        index = test_helpers::load_image(vfs::combine(to_bytes("#!stub\n"), writer.finalize()));
    }
};

const Site& site() {
    static const Site s;
    return s;
}

server::HttpServer::Config local_config() {
    server::HttpServer::Config config;
    config.address = "127.0.0.1";
    config.port = 0;
    config.idleTimeoutMs = 5000;
    return config;
}

std::string gunzip(const std::string& data) {
    z_stream zs{};
    REQUIRE(inflateInit2(&zs, 16 + MAX_WBITS) == Z_OK);

    std::string out;
    char buf[16384];
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int rc = Z_OK;
    while (rc == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        rc = inflate(&zs, Z_NO_FLUSH);
        out.append(buf, sizeof(buf) - zs.avail_out);
    }
    inflateEnd(&zs);
    REQUIRE(rc == Z_STREAM_END);
    return out;
}

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("HttpServer starts on an ephemeral port and stops cleanly", "[server][lifecycle]") {
    server::HttpServer server(site().index, local_config());

    REQUIRE(server.start());
    REQUIRE(server.is_running());
    REQUIRE(server.port() != 0);
    REQUIRE_FALSE(server.start());

    server.stop();
    REQUIRE_FALSE(server.is_running());
    server.stop();
}

TEST_CASE("HttpServer fails to bind an occupied port", "[server][lifecycle]") {
    server::HttpServer first(site().index, local_config());
    REQUIRE(first.start());

    auto config = local_config();
    config.port = first.port();
    server::HttpServer second(site().index, config);
    REQUIRE_FALSE(second.start());
    REQUIRE_FALSE(second.is_running());
}

TEST_CASE("HttpServer rejects an invalid listen address", "[server][lifecycle]") {
    auto config = local_config();
    config.address = "not-an-address";
    server::HttpServer server(site().index, config);
    REQUIRE_FALSE(server.start());
}

TEST_CASE("HttpServer stop unblocks idle connections", "[server][lifecycle]") {
    server::HttpServer server(site().index, local_config());
    REQUIRE(server.start());

    HttpClient client(server.port());
    REQUIRE(client.connected());
    auto resp = client.get("/");
    REQUIRE(resp.has_value());

    const auto begin = std::chrono::steady_clock::now();
    server.stop();
    REQUIRE(std::chrono::steady_clock::now() - begin < std::chrono::seconds(3));
    REQUIRE(client.peer_closed());
}

TEST_CASE("HttpServer start fails cleanly without an accept thread", "[server][lifecycle]") {
    auto config = local_config();
    config.threadFactory = [](std::function<void()>) -> std::thread {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    };

    server::HttpServer server(site().index, config);
    REQUIRE_FALSE(server.start());
    REQUIRE_FALSE(server.is_running());
    server.stop();
}

TEST_CASE("HttpServer survives a failed worker thread", "[server][lifecycle]") {
    // First call starts the accept thread; the second (first connection) fails.
    std::atomic<int> calls{0};
    auto config = local_config();
    config.threadFactory = [&calls](std::function<void()> fn) {
        if (calls.fetch_add(1) == 1) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return std::thread(std::move(fn));
    };

    server::HttpServer server(site().index, config);
    REQUIRE(server.start());

    {
        // Answered on accept, before any request is read.
        HttpClient refused(server.port());
        auto busy = refused.read_response();
        REQUIRE(busy.has_value());
        REQUIRE(busy->status == 503);
        REQUIRE(refused.peer_closed());
    }

    HttpClient client(server.port());
    auto resp = client.get("/");
    REQUIRE(resp.has_value());
    REQUIRE(resp->status == 200);
    REQUIRE(resp->body == "<html>Hi</html>");
    REQUIRE(server.is_running());
    REQUIRE(calls.load() == 3);
}

// =============================================================================
// Requests
// =============================================================================

TEST_CASE("HttpServer answers basic requests", "[server][http]") {
    server::HttpServer server(site().index, local_config());
    REQUIRE(server.start());

    SECTION("GET / serves index.html") {
        HttpClient client(server.port());
        auto resp = client.get("/");
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 200);
        REQUIRE(resp->body == "<html>Hi</html>");
        REQUIRE(*resp->header("content-type") == "text/html; charset=utf-8");
        REQUIRE(*resp->header("content-length") == "15");
        REQUIRE(*resp->header("server") == "polyserve");
        REQUIRE(*resp->header("last-modified") == http::format_http_date(1700000000));
        REQUIRE(resp->header("date") != nullptr);
    }

    SECTION("missing file is 404") {
        HttpClient client(server.port());
        auto resp = client.get("/missing.txt");
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 404);
        REQUIRE_FALSE(resp->body.empty());
    }

    SECTION("HEAD has GET's headers and no body") {
        HttpClient client(server.port());
        REQUIRE(client.send_raw("HEAD / HTTP/1.1\r\nHost: x\r\n\r\n"));
        auto head = client.read_response(true);
        REQUIRE(head.has_value());
        REQUIRE(head->status == 200);
        REQUIRE(*head->header("content-length") == "15");
        REQUIRE(head->body.empty());

        // The connection stays in sync: no stray body bytes.
        auto next = client.get("/docs/");
        REQUIRE(next.has_value());
        REQUIRE(next->body == "<html>Docs</html>");
    }

    SECTION("POST is 405 and its body is skipped") {
        HttpClient client(server.port());
        REQUIRE(client.send_raw("POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 5\r\n\r\nhello"));
        auto resp = client.read_response();
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 405);
        REQUIRE(*resp->header("allow") == "GET, HEAD");

        auto next = client.get("/");
        REQUIRE(next.has_value());
        REQUIRE(next->status == 200);
    }

    SECTION("directory redirect") {
        HttpClient client(server.port());
        auto resp = client.get("/docs");
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 301);
        REQUIRE(*resp->header("location") == "/docs/");
    }

    SECTION("conditional GET") {
        HttpClient client(server.port());
        auto resp = client.get("/", "If-Modified-Since: " + http::format_http_date(1700000000) + "\r\n");
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 304);
        REQUIRE(resp->header("content-length") == nullptr);
        REQUIRE(resp->body.empty());

        auto after = client.get("/");
        REQUIRE(after.has_value());
        REQUIRE(after->status == 200);
    }

    SECTION("gzip passthrough decodes to the original bytes") {
        HttpClient client(server.port());
        auto resp = client.get("/css/site.css", "Accept-Encoding: gzip\r\n");
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 200);
        REQUIRE(*resp->header("content-encoding") == "gzip");
        REQUIRE(resp->body.size() < site().css.size());
        REQUIRE(gunzip(resp->body) == site().css);

        auto plain = client.get("/css/site.css");
        REQUIRE(plain.has_value());
        REQUIRE(plain->header("content-encoding") == nullptr);
        REQUIRE(plain->body == site().css);
    }
}

TEST_CASE("HttpServer closes on malformed requests", "[server][http]") {
    server::HttpServer server(site().index, local_config());
    REQUIRE(server.start());

    SECTION("garbage is 400") {
        HttpClient client(server.port());
        REQUIRE(client.send_raw("this is not http\r\n\r\n"));
        auto resp = client.read_response();
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 400);
        REQUIRE(*resp->header("connection") == "close");
        REQUIRE(client.peer_closed());
    }

    SECTION("oversized head is 431") {
        HttpClient client(server.port());
        REQUIRE(client.send_raw("GET / HTTP/1.1\r\nX-Big: " + std::string(16 * 1024, 'a') + "\r\n\r\n"));
        auto resp = client.read_response();
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 431);
    }

    SECTION("traversal is 400") {
        HttpClient client(server.port());
        auto resp = client.get("/%2e%2e/%2e%2e/etc/passwd");
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 400);
    }
}

TEST_CASE("HttpServer keep-alive and pipelining", "[server][http]") {
    server::HttpServer server(site().index, local_config());
    REQUIRE(server.start());

    SECTION("pipelined responses come back in request order") {
        HttpClient client(server.port());
        REQUIRE(client.send_raw(
            "GET /docs/ HTTP/1.1\r\nHost: x\r\n\r\n"
            "GET /missing HTTP/1.1\r\nHost: x\r\n\r\n"
            "HEAD /index.html HTTP/1.1\r\nHost: x\r\n\r\n"
            "GET / HTTP/1.1\r\nHost: x\r\n\r\n"));

        auto r1 = client.read_response();
        auto r2 = client.read_response();
        auto r3 = client.read_response(true);
        auto r4 = client.read_response();
        REQUIRE((r1 && r2 && r3 && r4));
        REQUIRE(r1->body == "<html>Docs</html>");
        REQUIRE(r2->status == 404);
        REQUIRE(r3->status == 200);
        REQUIRE(r3->body.empty());
        REQUIRE(r4->body == "<html>Hi</html>");
    }

    SECTION("Connection: close ends the connection") {
        HttpClient client(server.port());
        auto resp = client.get("/", "Connection: close\r\n");
        REQUIRE(resp.has_value());
        REQUIRE(*resp->header("connection") == "close");
        REQUIRE(client.peer_closed());
    }

    SECTION("HTTP/1.0 without keep-alive is one request per connection") {
        HttpClient client(server.port());
        REQUIRE(client.send_raw("GET / HTTP/1.0\r\n\r\n"));
        auto resp = client.read_response();
        REQUIRE(resp.has_value());
        REQUIRE(resp->status == 200);
        REQUIRE(client.peer_closed());
    }

    SECTION("keep-alive disabled by config") {
        auto config = local_config();
        config.connection.keepAlive = false;
        server::HttpServer single(site().index, config);
        REQUIRE(single.start());

        HttpClient client(single.port());
        auto resp = client.get("/");
        REQUIRE(resp.has_value());
        REQUIRE(*resp->header("connection") == "close");
        REQUIRE(client.peer_closed());
    }
}

TEST_CASE("HttpServer closes idle connections", "[server][http]") {
    auto config = local_config();
    config.idleTimeoutMs = 200;
    server::HttpServer server(site().index, config);
    REQUIRE(server.start());

    HttpClient client(server.port());
    REQUIRE(client.connected());

    const auto begin = std::chrono::steady_clock::now();
    REQUIRE(client.peer_closed());
    REQUIRE(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5));
}

TEST_CASE("HttpServer answers 503 beyond the connection limit", "[server][http]") {
    auto config = local_config();
    config.maxConnections = 1;
    server::HttpServer server(site().index, config);
    REQUIRE(server.start());

    HttpClient first(server.port());
    auto ok = first.get("/");
    REQUIRE(ok.has_value());
    REQUIRE(ok->status == 200);
    REQUIRE(server.connection_count() == 1);

    // Answered on accept, before any request is read.
    HttpClient second(server.port());
    auto busy = second.read_response();
    REQUIRE(busy.has_value());
    REQUIRE(busy->status == 503);
    REQUIRE(second.peer_closed());

    // The first connection is unaffected.
    auto again = first.get("/docs/");
    REQUIRE(again.has_value());
    REQUIRE(again->status == 200);
}

TEST_CASE("HttpServer answers 500 for unreadable entries", "[server][http]") {
    vfs::ArchiveWriter writer;
    writer.set_compression(vfs::ArchiveWriter::CompressionPolicy::StoreOnly);
    writer.add_file("broken.txt", to_bytes("soon to be corrupted"));
    writer.add_file("fine.txt", to_bytes("fine"));
    auto image = writer.finalize();

    const std::uint64_t dataOffset = test_helpers::load_image(image)->find("broken.txt")->dataOffset;
    image[dataOffset] ^= 0xFF;
    auto index = test_helpers::load_image(image);

    server::HttpServer server(index, local_config());
    REQUIRE(server.start());

    HttpClient client(server.port());
    auto resp = client.get("/broken.txt");
    REQUIRE(resp.has_value());
    REQUIRE(resp->status == 500);

    auto fine = client.get("/fine.txt");
    REQUIRE(fine.has_value());
    REQUIRE(fine->body == "fine");
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("HttpServer serves 50 concurrent 10 MB downloads", "[server][concurrency]") {
    server::HttpServer server(site().index, local_config());
    REQUIRE(server.start());

    const std::uint32_t expectedCrc = vfs::codec::crc32(site().big);
    constexpr int kClients = 50;

    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    threads.reserve(kClients);

    for (int i = 0; i < kClients; ++i) {
        threads.emplace_back([&]() {
            HttpClient client(server.port(), 60);
            if (!client.connected()) return;
            if (!client.send_raw("GET /big.bin HTTP/1.1\r\nHost: x\r\n\r\n")) return;

            std::uint32_t crc = 0;
            std::size_t received = 0;
            auto resp = client.read_response(false, [&](const char* data, std::size_t n) {
                crc = vfs::codec::crc32(
                    std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data), n), crc);
                received += n;
            });

            if (resp && resp->status == 200 && received == kBigSize && crc == expectedCrc) {
                succeeded.fetch_add(1);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(succeeded.load() == kClients);
}
