#pragma once

#include "logger.hpp"

#include <cstdint>
#include <string>

namespace polyserve::core {

// Name of the optional config entry inside the artifact's own archive.
inline constexpr const char* kEmbeddedConfigPath = ".polyserve.ini";

struct ServerConfig {
    std::uint16_t port{8080};
    std::string address{"0.0.0.0"};

    // Appended to request paths ending in '/'.
    std::string index_document{"index.html"};

    bool keep_alive{true};
    int idle_timeout_ms{60000};
    std::size_t max_connections{256};

    // Serve deflated entries as Content-Encoding: gzip when the client accepts it.
    bool gzip{true};

    std::string server_name{"polyserve"};
};

struct Settings {
    ServerConfig server{};
    LoggingConfig logging{};
};

class Config {
public:
    Config() = default;

    // INI text: "[section]" headers, "key = value" lines, '#' or ';' comments.
    void load_from_string(const std::string& text);
    bool load_from_file(const std::string& path);

    const Settings& get() const { return settings_; }
    Settings& mutable_settings() { return settings_; }

    const ServerConfig& server() const { return settings_.server; }
    const LoggingConfig& logging() const { return settings_.logging; }

    static LogLevel log_level_from_string(const std::string& v, LogLevel default_value);

private:
    Settings settings_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);
    static std::string strip_quotes(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace polyserve::core
