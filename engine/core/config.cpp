#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <unordered_map>

namespace polyserve::core {

namespace {

constexpr const char* kWhitespace = " \t\r\n\f\v";

// '#' and ';' open a comment at line start or after whitespace, so values
// such as "a;b" survive.
std::string strip_comment(const std::string& line) {
    for (std::size_t i = 0; i < line.size(); ++i) {
        if ((line[i] == '#' || line[i] == ';') &&
            (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])) != 0)) {
            return line.substr(0, i);
        }
    }
    return line;
}

} // namespace

std::string Config::trim(std::string s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string Config::to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Config::strip_quotes(std::string s) {
    s = trim(std::move(s));
    const bool quoted = s.size() >= 2 && s.front() == s.back() && (s.front() == '"' || s.front() == '\'');
    return quoted ? s.substr(1, s.size() - 2) : s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    static const std::unordered_map<std::string, bool> words = {
        {"1", true}, {"true", true}, {"yes", true}, {"on", true},
        {"0", false}, {"false", false}, {"no", false}, {"off", false},
    };
    const auto it = words.find(to_lower(trim(v)));
    return it == words.end() ? default_value : it->second;
}

int Config::parse_int(const std::string& v, int default_value) {
    const std::string s = trim(v);
    int out = 0;
    const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (s.empty() || ec != std::errc{} || end != s.data() + s.size()) {
        return default_value;
    }
    return out;
}

LogLevel Config::log_level_from_string(const std::string& v, LogLevel default_value) {
    const std::string s = to_lower(strip_quotes(v));

    // Numeric levels 1..7 are accepted as well.
    static const std::unordered_map<std::string, LogLevel> map = {
        {"all", LogLevel::Trace},
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warning}, {"warn", LogLevel::Warning},
        {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
        {"none", LogLevel::None}, {"off", LogLevel::None},
    };

    if (const auto it = map.find(s); it != map.end()) {
        return it->second;
    }

    const int n = parse_int(s, -1);
    if (n >= static_cast<int>(LogLevel::Trace) && n <= static_cast<int>(LogLevel::None)) {
        return static_cast<LogLevel>(n);
    }
    return default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);
    if (k.empty()) {
        return;
    }

    if (sec == "server") {
        auto& sv = settings_.server;
        if (k == "port") {
            const int port = parse_int(v, -1);
            if (port >= 0 && port <= 0xFFFF) sv.port = static_cast<std::uint16_t>(port);
        }
        else if (k == "address" || k == "addr") sv.address = v;
        else if (k == "index") sv.index_document = v;
        else if (k == "keep_alive") sv.keep_alive = parse_bool(v, sv.keep_alive);
        else if (k == "idle_timeout_ms") sv.idle_timeout_ms = std::max(0, parse_int(v, sv.idle_timeout_ms));
        else if (k == "max_connections") {
            const int n = parse_int(v, static_cast<int>(sv.max_connections));
            if (n > 0) sv.max_connections = static_cast<std::size_t>(n);
        }
        else if (k == "gzip") sv.gzip = parse_bool(v, sv.gzip);
        else if (k == "server_name") sv.server_name = v;
        return;
    }

    if (sec == "logging") {
        auto& lg = settings_.logging;
        if (k == "enabled") lg.enabled = parse_bool(v, lg.enabled);
        else if (k == "level") lg.level = log_level_from_string(v, lg.level);
        else if (k == "file") lg.file = v;
        else if (k == "access") lg.access = parse_bool(v, lg.access);
        return;
    }
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    std::string section;

    for (std::string raw; std::getline(in, raw);) {
        const std::string line = trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() == ']') {
                section = line.substr(1, line.size() - 2);
            }
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        apply_kv(section, line.substr(0, eq), line.substr(eq + 1));
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    load_from_string(std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));
    return true;
}

} // namespace polyserve::core
