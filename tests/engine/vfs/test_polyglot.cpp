#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"

#include "core/file_util.hpp"
#include "vfs/archive_error.hpp"
#include "vfs/polyglot.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <vector>

using namespace polyserve::vfs;
using test_helpers::to_bytes;

namespace fs = std::filesystem;

TEST_CASE("combine concatenates stub and archive unchanged", "[vfs][polyglot]") {
    const auto stub = to_bytes("\x7f" "ELF stub bytes");
    const auto archive = test_helpers::make_archive({{"index.html", "<html>Hi</html>"}});

    const auto out = combine(stub, archive);
    REQUIRE(out.size() == stub.size() + archive.size());
    REQUIRE(std::equal(stub.begin(), stub.end(), out.begin()));
    REQUIRE(std::equal(archive.begin(), archive.end(), out.begin() + static_cast<std::ptrdiff_t>(stub.size())));

    SECTION("empty stub yields the bare archive") {
        REQUIRE(combine({}, archive) == archive);
    }
}

TEST_CASE("combine enforces the size limit", "[vfs][polyglot]") {
    const std::vector<std::uint8_t> stub(1000, 0x90);
    const auto archive = test_helpers::make_archive({{"a.txt", "a"}});
    const std::uint64_t total = stub.size() + archive.size();

    REQUIRE_NOTHROW(combine(stub, archive, kNoSizeLimit));
    REQUIRE_NOTHROW(combine(stub, archive, total));

    try {
        (void)combine(stub, archive, total - 1);
        FAIL("expected StubTooLarge");
    } catch (const ArchiveError& e) {
        REQUIRE(e.code() == ArchiveErrc::StubTooLarge);
    }
}

TEST_CASE("write_combined leaves nothing behind on failure", "[vfs][polyglot]") {
    test_helpers::TempDir dir;
    const std::vector<std::uint8_t> stub(1000, 0x90);
    const auto archive = test_helpers::make_archive({{"a.txt", "a"}});
    const fs::path output = dir.path() / "site";

    SECTION("size limit exceeded") {
        REQUIRE_THROWS_AS(write_combined(output, stub, archive, 10), ArchiveError);
        REQUIRE_FALSE(fs::exists(output));
        REQUIRE(fs::is_empty(dir.path()));
    }

    SECTION("unwritable destination") {
        const fs::path missing = dir.path() / "no" / "such" / "dir" / "site";
        try {
            write_combined(missing, stub, archive);
            FAIL("expected IoError");
        } catch (const ArchiveError& e) {
            REQUIRE(e.code() == ArchiveErrc::IoError);
        }
        REQUIRE(fs::is_empty(dir.path()));
    }

    SECTION("success replaces an existing file") {
        dir.create_file("site", "old contents");
        write_combined(output, stub, archive);

        auto written = polyserve::core::read_file(output);
        REQUIRE(written.has_value());
        REQUIRE(*written == combine(stub, archive));
        REQUIRE(std::distance(fs::directory_iterator(dir.path()), fs::directory_iterator{}) == 1);
    }
}
