#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"

#include "vfs/archive_error.hpp"
#include "vfs/archive_index.hpp"
#include "vfs/pak_format.hpp"
#include "vfs/polyglot.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <utility>
#include <vector>

using namespace polyserve::vfs;
using test_helpers::load_image;
using test_helpers::make_archive;
using test_helpers::to_bytes;
using test_helpers::to_string;

namespace {

const test_helpers::FileList kSite = {
    {"index.html", "<html>Hi</html>"},
    {"css/site.css", std::string(2000, 'c')},
    {"img/logo.bin", "\x89PNG\r\n\x1a\n"},
    {"docs/index.html", "<html>Docs</html>"},
    {"docs/guide/intro.md", "# Intro\n"},
};

ArchiveErrc load_error(std::vector<std::uint8_t> image) {
    try {
        (void)load_image(std::move(image));
    } catch (const ArchiveError& e) {
        return e.code();
    }
    FAIL("expected ArchiveError");
    return ArchiveErrc::IoError;
}

Trailer trailer_of(const std::vector<std::uint8_t>& image) {
    return read_trailer(std::span<const std::uint8_t>(image).last(PAK_TRAILER_SIZE));
}

// Re-emit the directory of a bare archive after `edit`, with a matching
// checksum and trailer, so per-entry validation is what rejects it.
std::vector<std::uint8_t> forge_directory(const std::vector<std::uint8_t>& archive,
                                          const std::function<void(std::vector<DirectoryEntry>&)>& edit,
                                          const std::vector<std::uint8_t>& trailing = {}) {
    Trailer trailer = trailer_of(archive);
    std::vector<DirectoryEntry> entries = load_image(archive)->entries();
    edit(entries);

    polyserve::core::ByteWriter directory;
    for (const auto& entry : entries) {
        write_directory_entry(directory, entry);
    }
    directory.write_bytes(trailing);

    trailer.entryCount = static_cast<std::uint32_t>(entries.size());
    trailer.directoryCrc = codec::crc32(directory.data());
    trailer.directorySize = directory.size();
    trailer.sectionSize = trailer.directoryOffset + directory.size() + PAK_TRAILER_SIZE;

    polyserve::core::ByteWriter out;
    out.write_bytes(std::span<const std::uint8_t>(archive).first(trailer.directoryOffset));
    out.write_bytes(directory.data());
    write_trailer(out, trailer);
    return out.take();
}

std::string load_error_detail(std::vector<std::uint8_t> image) {
    try {
        (void)load_image(std::move(image));
    } catch (const ArchiveError& e) {
        REQUIRE(e.code() == ArchiveErrc::CorruptArchive);
        return e.what();
    }
    FAIL("expected ArchiveError");
    return {};
}

std::string read_all(BodyReader& body) {
    std::string out;
    std::vector<std::uint8_t> chunk(1000);
    while (!body.done()) {
        const std::size_t n = body.read(chunk);
        if (n == 0) break;
        out.append(reinterpret_cast<const char*>(chunk.data()), n);
    }
    return out;
}

} // namespace

TEST_CASE("ArchiveIndex round-trips every file", "[vfs][index]") {
    auto index = load_image(make_archive(kSite));

    REQUIRE(index->entries().size() == kSite.size());
    REQUIRE(index->section_offset() == 0);

    for (const auto& [path, content] : kSite) {
        INFO(path);
        auto data = index->extract(path);
        REQUIRE(data.has_value());
        REQUIRE(to_string(*data) == content);
    }

    REQUIRE_FALSE(index->extract("missing.txt").has_value());
    REQUIRE(index->find("css/site.css")->method == Compression::Deflate);
}

TEST_CASE("ArchiveIndex entries are sorted by path", "[vfs][index]") {
    auto index = load_image(make_archive(kSite));
    const auto& entries = index->entries();

    REQUIRE(std::is_sorted(entries.begin(), entries.end(),
                           [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.path < b.path; }));
    REQUIRE(entries.front().path == "css/site.css");
}

TEST_CASE("ArchiveIndex finds the archive behind any stub", "[vfs][index][polyglot]") {
    const auto archive = make_archive(kSite);

    for (std::size_t stubSize : {std::size_t{0}, std::size_t{1}, std::size_t{4096}, std::size_t{1048576}}) {
        DYNAMIC_SECTION("stub of " << stubSize << " bytes") {
            const auto stub = test_helpers::noise_bytes(stubSize, static_cast<std::uint32_t>(stubSize + 1));
            auto index = load_image(combine(stub, archive));

            REQUIRE(index->section_offset() == stubSize);
            REQUIRE(index->section_size() == archive.size());
            REQUIRE(index->entries().size() == kSite.size());
            for (const auto& [path, content] : kSite) {
                REQUIRE(to_string(*index->extract(path)) == content);
            }
        }
    }
}

TEST_CASE("ArchiveIndex ignores an archive embedded inside the stub", "[vfs][index][polyglot]") {
    // A stub that itself ends in a valid archive: only the outer one counts.
    const auto inner = make_archive({{"inner.txt", "inner"}});
    const auto outer = make_archive({{"outer.txt", "outer"}});

    auto index = load_image(combine(inner, outer));
    REQUIRE(index->entries().size() == 1);
    REQUIRE(index->has_file("outer.txt"));
    REQUIRE_FALSE(index->has_file("inner.txt"));
}

TEST_CASE("ArchiveIndex rejects corrupt images", "[vfs][index][corrupt]") {
    const auto archive = make_archive(kSite);
    const auto stub = to_bytes("#!/bin/sh\nexit 0\n");
    const auto image = combine(stub, archive);

    SECTION("too small for a trailer") {
        REQUIRE(load_error(std::vector<std::uint8_t>(10, 0)) == ArchiveErrc::CorruptArchive);
        REQUIRE(load_error({}) == ArchiveErrc::CorruptArchive);
    }

    SECTION("plain executable without an archive") {
        REQUIRE(load_error(test_helpers::noise_bytes(4096)) == ArchiveErrc::CorruptArchive);
    }

    SECTION("truncated trailer") {
        auto bad = image;
        bad.pop_back();
        REQUIRE(load_error(bad) == ArchiveErrc::CorruptArchive);
    }

    SECTION("flipped byte in the directory") {
        const Trailer trailer = trailer_of(image);
        const std::size_t sectionStart = image.size() - trailer.sectionSize;

        for (std::uint64_t off : {std::uint64_t{0}, trailer.directorySize / 2, trailer.directorySize - 1}) {
            auto bad = image;
            bad[sectionStart + trailer.directoryOffset + off] ^= 0x01;
            REQUIRE(load_error(bad) == ArchiveErrc::CorruptArchive);
        }
    }

    SECTION("section size larger than the file") {
        auto bad = image;
        // section_size is the last u64 of the trailer.
        bad[bad.size() - 1] = 0x7F;
        REQUIRE(load_error(bad) == ArchiveErrc::CorruptArchive);
    }

    SECTION("unsupported version") {
        auto bad = image;
        bad[bad.size() - PAK_TRAILER_SIZE + 4] = 99;
        REQUIRE(load_error(bad) == ArchiveErrc::CorruptArchive);
    }
}

TEST_CASE("ArchiveIndex validates every directory entry", "[vfs][index][corrupt]") {
    // Same-length paths keep record offsets valid when one is renamed.
    polyserve::vfs::ArchiveWriter writer;
    writer.set_compression(ArchiveWriter::CompressionPolicy::StoreOnly);
    writer.add_file("a.txt", to_bytes("alpha"));
    writer.add_file("b.txt", to_bytes("bravo"));
    const auto archive = writer.finalize();

    auto contains = [](const std::string& text, const std::string& part) {
        return text.find(part) != std::string::npos;
    };

    SECTION("an unchanged re-emitted directory still loads") {
        auto index = load_image(forge_directory(archive, [](auto&) {}));
        REQUIRE(to_string(*index->extract("b.txt")) == "bravo");
    }

    SECTION("entry data past the directory start") {
        auto image = forge_directory(archive, [](auto& entries) {
            entries[1].uncompressedSize += 10000;
            entries[1].compressedSize += 10000;
        });
        REQUIRE(contains(load_error_detail(image), "outside the archive section"));
    }

    SECTION("record offset that does not match the data offset") {
        auto image = forge_directory(archive, [](auto& entries) { entries[0].dataOffset += 1; });
        REQUIRE(contains(load_error_detail(image), "outside the archive section"));
    }

    SECTION("duplicate path") {
        auto image = forge_directory(archive, [](auto& entries) { entries[1].path = "a.txt"; });
        REQUIRE(contains(load_error_detail(image), "duplicate path 'a.txt'"));
    }

    SECTION("unsorted directory") {
        auto image = forge_directory(archive, [](auto& entries) { std::swap(entries[0], entries[1]); });
        REQUIRE(contains(load_error_detail(image), "not sorted"));
    }

    SECTION("unknown compression method") {
        auto image = forge_directory(archive, [](auto& entries) {
            entries[0].method = static_cast<Compression>(3);
        });
        REQUIRE(contains(load_error_detail(image), "unknown compression method"));
    }

    SECTION("stored entry with mismatched sizes") {
        auto image = forge_directory(archive, [](auto& entries) { entries[0].uncompressedSize += 1; });
        REQUIRE(contains(load_error_detail(image), "mismatched sizes"));
    }

    SECTION("path that is not canonical") {
        auto image = forge_directory(archive, [](auto& entries) { entries[0].path = "../ab"; });
        REQUIRE(contains(load_error_detail(image), "invalid path"));
    }

    SECTION("trailing bytes after the last entry") {
        auto image = forge_directory(archive, [](auto&) {}, {0x00, 0x01, 0x02});
        REQUIRE(contains(load_error_detail(image), "trailing bytes"));
    }

    SECTION("behind a stub as well") {
        auto image = combine(to_bytes("#!/bin/sh\n"),
                             forge_directory(archive, [](auto& entries) { entries[1].path = "a.txt"; }));
        REQUIRE(contains(load_error_detail(image), "duplicate path"));
    }
}

TEST_CASE("ArchiveIndex detects corrupt file data on read", "[vfs][index][corrupt]") {
    polyserve::vfs::ArchiveWriter writer;
    writer.set_compression(ArchiveWriter::CompressionPolicy::StoreOnly);
    writer.add_file("a.txt", to_bytes("hello world"));
    writer.add_file("b.txt", to_bytes("intact"));
    auto image = writer.finalize();

    // No stub, so entry offsets are image offsets.
    const std::uint64_t dataOffset = load_image(image)->find("a.txt")->dataOffset;
    image[dataOffset + 3] ^= 0x20;

    // The directory is intact, so the index still loads.
    auto index = load_image(image);

    REQUIRE_FALSE(index->extract("a.txt").has_value());
    REQUIRE(to_string(*index->extract("b.txt")) == "intact");

    BodyReader body = index->open_body(*index->find("a.txt"));
    try {
        (void)read_all(body);
        FAIL("expected checksum failure");
    } catch (const ArchiveError& e) {
        REQUIRE(e.code() == ArchiveErrc::CorruptArchive);
    }
}

TEST_CASE("BodyReader streams decoded and raw bytes", "[vfs][index]") {
    const std::string text(100000, 'z');
    auto index = load_image(make_archive({{"big.txt", text}}));
    const DirectoryEntry& entry = *index->find("big.txt");
    REQUIRE(entry.method == Compression::Deflate);

    SECTION("decoded") {
        BodyReader body = index->open_body(entry);
        REQUIRE(body.size() == text.size());
        REQUIRE(read_all(body) == text);
        REQUIRE(body.done());
    }

    SECTION("raw yields the stored deflate stream") {
        BodyReader body = index->open_raw(entry);
        REQUIRE(body.size() == entry.compressedSize);
        const std::string raw = read_all(body);
        REQUIRE(raw.size() == entry.compressedSize);

        std::vector<std::uint8_t> out(text.size() + 1);
        codec::Inflater inflater;
        std::span<const std::uint8_t> input(reinterpret_cast<const std::uint8_t*>(raw.data()), raw.size());
        std::size_t produced = 0;
        REQUIRE(inflater.inflate(input, out, produced) == codec::Inflater::Status::StreamEnd);
        REQUIRE(produced == text.size());
        REQUIRE(std::string(out.begin(), out.begin() + produced) == text);
    }
}

TEST_CASE("ArchiveIndex::open reads an artifact from disk", "[vfs][index]") {
    test_helpers::TempDir dir;
    const auto stub = test_helpers::noise_bytes(4096);
    const auto artifact = dir.path() / "site";

    write_combined(artifact, stub, make_archive(kSite));

    const auto perms = std::filesystem::status(artifact).permissions();
    REQUIRE((perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none);

    auto index = ArchiveIndex::open(artifact);
    REQUIRE(index->image_size() == std::filesystem::file_size(artifact));
    REQUIRE(index->section_offset() == stub.size());
    REQUIRE(to_string(*index->extract("index.html")) == "<html>Hi</html>");

    SECTION("missing file is an I/O error") {
        try {
            (void)ArchiveIndex::open(dir.path() / "nope");
            FAIL("expected ArchiveError");
        } catch (const ArchiveError& e) {
            REQUIRE(e.code() == ArchiveErrc::IoError);
        }
    }
}
