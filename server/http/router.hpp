#pragma once

#include "request.hpp"
#include "status.hpp"

#include "vfs/archive_index.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyserve::http {

enum class BodyKind {
    None,    // No body (304).
    Inline,  // `inlineBody` (error pages).
    Entry,   // Streamed from the archive.
};

enum class BodyEncoding {
    Identity,  // Decoded entry bytes.
    Gzip,      // Stored deflate stream wrapped in gzip framing.
};

// Everything the listener needs to answer one request.
struct ResponseDescriptor {
    int status{kOk};
    std::string contentType;
    std::uint64_t contentLength{0};
    std::vector<std::pair<std::string, std::string>> headers;

    BodyKind bodyKind{BodyKind::None};
    std::string inlineBody;
    const vfs::DirectoryEntry* entry{nullptr};
    BodyEncoding encoding{BodyEncoding::Identity};

    // HEAD: send the head exactly as for GET but no body bytes.
    bool headOnly{false};
};

struct RouterOptions {
    std::string indexDocument{"index.html"};
    bool gzip{true};
};

// Maps (method, target) to a ResponseDescriptor using only the in-memory
// index. Never touches the image.
class Router {
public:
    explicit Router(std::shared_ptr<const vfs::ArchiveIndex> index, RouterOptions options = {});

    ResponseDescriptor resolve(std::string_view method, std::string_view target) const;

    // As above, also honoring If-Modified-Since and Accept-Encoding.
    ResponseDescriptor resolve(const Request& request) const;

    // Small HTML error response for `status`.
    static ResponseDescriptor error(int status, bool headOnly = false);

    const vfs::ArchiveIndex& index() const { return *index_; }

private:
    ResponseDescriptor resolve_impl(std::string_view method, std::string_view target,
                                    const Request* request) const;

    std::shared_ptr<const vfs::ArchiveIndex> index_;
    RouterOptions options_;
};

// Decode %XX escapes. Returns false on a malformed escape.
bool percent_decode(std::string_view in, std::string& out);

// True if an Accept-Encoding value admits gzip.
bool accepts_gzip(std::string_view acceptEncoding);

} // namespace polyserve::http
