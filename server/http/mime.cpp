#include "mime.hpp"

#include "vfs/path.hpp"

#include <unordered_map>

namespace polyserve::http::mime {

namespace {

const std::unordered_map<std::string, std::string>& mime_map() {
    static const std::unordered_map<std::string, std::string> m = {
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".css", "text/css; charset=utf-8"},
        {".js", "text/javascript; charset=utf-8"},
        {".mjs", "text/javascript; charset=utf-8"},
        {".json", "application/json"},
        {".map", "application/json"},
        {".xml", "application/xml"},
        {".rss", "application/rss+xml"},
        {".atom", "application/atom+xml"},
        {".txt", "text/plain; charset=utf-8"},
        {".md", "text/markdown; charset=utf-8"},
        {".csv", "text/csv; charset=utf-8"},
        {".svg", "image/svg+xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".avif", "image/avif"},
        {".ico", "image/x-icon"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf", "font/ttf"},
        {".otf", "font/otf"},
        {".pdf", "application/pdf"},
        {".wasm", "application/wasm"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mp3", "audio/mpeg"},
        {".ogg", "audio/ogg"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
    };
    return m;
}

} // namespace

std::string from_path(std::string_view path) {
    const auto& m = mime_map();
    auto it = m.find(vfs::path_extension(path));
    return (it != m.end()) ? it->second : "application/octet-stream";
}

} // namespace polyserve::http::mime
