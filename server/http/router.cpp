#include "router.hpp"

#include "gzip_frame.hpp"
#include "http_date.hpp"
#include "mime.hpp"

#include "core/config.hpp"
#include "vfs/path.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <system_error>

namespace polyserve::http {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

bool percent_decode(std::string_view in, std::string& out) {
    out.clear();
    out.reserve(in.size());

    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out += in[i];
            continue;
        }
        if (i + 2 >= in.size()) {
            return false;
        }
        const int hi = hex_value(in[i + 1]);
        const int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return true;
}

bool accepts_gzip(std::string_view acceptEncoding) {
    double gzipQ = -1.0;
    double starQ = -1.0;

    while (!acceptEncoding.empty()) {
        const auto comma = acceptEncoding.find(',');
        std::string_view item = acceptEncoding.substr(0, comma);
        acceptEncoding = (comma == std::string_view::npos) ? std::string_view{}
                                                           : acceptEncoding.substr(comma + 1);

        const auto semi = item.find(';');
        const std::string coding = lower(trim(item.substr(0, semi)));

        double q = 1.0;
        if (semi != std::string_view::npos) {
            std::string_view param = trim(item.substr(semi + 1));
            if (param.size() >= 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
                // from_chars ignores the C locale's decimal separator.
                const std::string_view value = trim(param.substr(2));
                const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), q);
                if (ec != std::errc{} || end != value.data() + value.size()) {
                    q = 0.0;
                }
            }
        }

        if (coding == "gzip" || coding == "x-gzip") {
            gzipQ = q;
        } else if (coding == "*") {
            starQ = q;
        }
    }

    return gzipQ > 0.0 || (gzipQ < 0.0 && starQ > 0.0);
}

Router::Router(std::shared_ptr<const vfs::ArchiveIndex> index, RouterOptions options)
    : index_(std::move(index)), options_(std::move(options)) {}

ResponseDescriptor Router::error(int status, bool headOnly) {
    ResponseDescriptor desc;
    desc.status = status;
    desc.contentType = "text/html; charset=utf-8";

    const std::string title = std::to_string(status) + " " + reason(status);
    desc.inlineBody = "<!doctype html>\n<html><head><title>" + title + "</title></head>"
                      "<body><h1>" + title + "</h1></body></html>\n";
    desc.contentLength = desc.inlineBody.size();
    desc.bodyKind = BodyKind::Inline;
    desc.headOnly = headOnly;
    return desc;
}

ResponseDescriptor Router::resolve(std::string_view method, std::string_view target) const {
    return resolve_impl(method, target, nullptr);
}

ResponseDescriptor Router::resolve(const Request& request) const {
    return resolve_impl(request.method, request.target, &request);
}

ResponseDescriptor Router::resolve_impl(std::string_view method, std::string_view target,
                                        const Request* request) const {
    const bool head = (method == "HEAD");
    if (method != "GET" && !head) {
        ResponseDescriptor desc = error(kMethodNotAllowed);
        desc.headers.emplace_back("Allow", "GET, HEAD");
        return desc;
    }

    // Split off query and fragment.
    std::string_view rawPath = target;
    std::string_view query;
    if (const auto hash = rawPath.find('#'); hash != std::string_view::npos) {
        rawPath = rawPath.substr(0, hash);
    }
    if (const auto q = rawPath.find('?'); q != std::string_view::npos) {
        query = rawPath.substr(q);
        rawPath = rawPath.substr(0, q);
    }

    std::string path;
    if (rawPath.empty() || rawPath.front() != '/' || !percent_decode(rawPath, path)) {
        return error(kBadRequest, head);
    }

    std::string lookup = path;
    if (lookup.back() == '/') {
        lookup += options_.indexDocument;
    }

    const auto normalized = vfs::normalize_path(lookup);
    if (!normalized) {
        return error(kBadRequest, head);
    }
    if (*normalized == core::kEmbeddedConfigPath) {
        return error(kNotFound, head);
    }

    const vfs::DirectoryEntry* entry = index_->find(*normalized);
    if (!entry) {
        // "/docs" -> "/docs/" when the directory has an index document.
        if (path.back() != '/' && index_->has_file(*normalized + "/" + options_.indexDocument)) {
            ResponseDescriptor desc = error(kMovedPermanently, head);
            desc.headers.emplace_back("Location", std::string(rawPath) + "/" + std::string(query));
            return desc;
        }
        return error(kNotFound, head);
    }

    ResponseDescriptor desc;
    desc.status = kOk;
    desc.contentType = mime::from_path(entry->path);
    desc.contentLength = entry->uncompressedSize;
    desc.bodyKind = BodyKind::Entry;
    desc.entry = entry;
    desc.headOnly = head;
    desc.headers.emplace_back("Last-Modified", format_http_date(entry->mtime));

    const bool deflated = entry->method == vfs::Compression::Deflate;
    if (deflated && options_.gzip) {
        desc.headers.emplace_back("Vary", "Accept-Encoding");
    }

    if (!request) {
        return desc;
    }

    if (const std::string* ims = request->header("if-modified-since")) {
        const auto since = parse_http_date(*ims);
        if (since && entry->mtime <= *since) {
            desc.status = kNotModified;
            desc.bodyKind = BodyKind::None;
            desc.contentLength = 0;
            return desc;
        }
    }

    if (deflated && options_.gzip) {
        const std::string* ae = request->header("accept-encoding");
        if (ae && accepts_gzip(*ae)) {
            desc.encoding = BodyEncoding::Gzip;
            desc.contentLength = gzip::kHeaderSize + entry->compressedSize + gzip::kTrailerSize;
            desc.headers.emplace_back("Content-Encoding", "gzip");
        }
    }

    return desc;
}

} // namespace polyserve::http
