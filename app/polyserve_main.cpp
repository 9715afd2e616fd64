// polyserve - self-serving static site executable.
// Serves the archive appended to its own binary over HTTP.

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/self_image.hpp"
#include "core/http_server.hpp"
#include "vfs/archive_error.hpp"
#include "vfs/archive_index.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#ifndef POLYSERVE_VERSION
#define POLYSERVE_VERSION "0.0.0-dev"
#endif

namespace {

using polyserve::core::LogLevel;
using polyserve::core::logf;

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_banner() {
    std::cout << "  polyserve v" << POLYSERVE_VERSION << "\n";
    std::cout << "  ============================================\n\n";
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --port <port>       Listen port (default: 8080, 0 = any free port)\n";
    std::cout << "  --addr <ip>         Listen address (default: 0.0.0.0)\n";
    std::cout << "  --verbose           Enable debug logging\n";
    std::cout << "  --quiet             Only log warnings and errors, no access log\n";
    std::cout << "  --log-file <path>   Also append log lines to <path>\n";
    std::cout << "  --list              Print the embedded files and exit\n";
    std::cout << "  --help              Show this help message\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --port 8080\n";
}

struct Args {
    std::optional<int> port;
    std::optional<std::string> address;
    std::optional<std::string> logFile;
    bool verbose = false;
    bool quiet = false;
    bool list = false;
    bool help = false;
    bool bad = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--port") == 0 && i + 1 < argc) {
            char* end = nullptr;
            const long port = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || port < 0 || port > 65535) {
                std::cerr << "[ERROR] Invalid port: " << argv[i] << "\n";
                args.bad = true;
            } else {
                args.port = static_cast<int>(port);
            }
        }
        else if (std::strcmp(arg, "--addr") == 0 && i + 1 < argc) {
            args.address = argv[++i];
        }
        else if (std::strcmp(arg, "--log-file") == 0 && i + 1 < argc) {
            args.logFile = argv[++i];
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else if (std::strcmp(arg, "--list") == 0) {
            args.list = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

void print_listing(const polyserve::vfs::ArchiveIndex& index) {
    for (const auto& entry : index.entries()) {
        std::cout << (entry.method == polyserve::vfs::Compression::Deflate ? "  deflate " : "  stored  ")
                  << entry.uncompressedSize << "\t" << entry.compressedSize << "\t" << entry.path
                  << "\n";
    }
    std::cout << index.entries().size() << " files, archive " << index.section_size()
              << " bytes at offset " << index.section_offset() << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    if (args.help) {
        print_banner();
        print_usage(argv[0]);
        return 0;
    }
    if (args.bad) {
        return 1;
    }

    const auto self = polyserve::core::executable_path(argc > 0 ? argv[0] : nullptr);
    if (!self) {
        logf(LogLevel::Fatal, "init", "cannot locate own executable");
        return 1;
    }

    // Index the archive before anything binds a socket.
    std::shared_ptr<const polyserve::vfs::ArchiveIndex> index;
    try {
        index = polyserve::vfs::ArchiveIndex::open(*self);
    } catch (const polyserve::vfs::ArchiveError& e) {
        logf(LogLevel::Fatal, "init", "%s: %s", self->string().c_str(), e.what());
        return 1;
    }

    if (args.list) {
        print_listing(*index);
        return 0;
    }

    print_banner();

    polyserve::core::Config config;
    if (auto embedded = index->extract(polyserve::core::kEmbeddedConfigPath)) {
        config.load_from_string(std::string(embedded->begin(), embedded->end()));
    }

    auto& settings = config.mutable_settings();
    if (args.port) settings.server.port = static_cast<std::uint16_t>(*args.port);
    if (args.address) settings.server.address = *args.address;
    if (args.logFile) settings.logging.file = *args.logFile;
    if (args.quiet) {
        settings.logging.level = LogLevel::Warning;
        settings.logging.access = false;
    } else if (args.verbose) {
        settings.logging.level = LogLevel::Debug;
    }

    polyserve::core::Logger::instance().init(settings.logging);

    logf(LogLevel::Info, "init", "%zu files, %llu byte archive at offset %llu",
         index->entries().size(), static_cast<unsigned long long>(index->section_size()),
         static_cast<unsigned long long>(index->section_offset()));

    polyserve::server::HttpServer::Config serverConfig;
    serverConfig.address = settings.server.address;
    serverConfig.port = settings.server.port;
    serverConfig.maxConnections = settings.server.max_connections;
    serverConfig.idleTimeoutMs = static_cast<std::uint32_t>(settings.server.idle_timeout_ms);
    serverConfig.connection.keepAlive = settings.server.keep_alive;
    serverConfig.connection.serverName = settings.server.server_name;
    serverConfig.router.indexDocument = settings.server.index_document;
    serverConfig.router.gzip = settings.server.gzip;

    polyserve::server::HttpServer server(index, serverConfig);
    if (!server.start()) {
        logf(LogLevel::Fatal, "init", "failed to start server on %s:%u",
             serverConfig.address.c_str(), static_cast<unsigned>(serverConfig.port));
        polyserve::core::Logger::instance().shutdown();
        return 1;
    }

    std::cout << "[INFO] Serving on http://" << serverConfig.address << ":" << server.port() << "/\n";
    std::cout << "[INFO] Press Ctrl+C to stop\n\n";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (g_running && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[INFO] Shutting down...\n";
    server.stop();
    polyserve::core::Logger::instance().shutdown();

    return 0;
}
