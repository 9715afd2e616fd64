// pack_site - CLI tool for packing a static site into a self-serving executable.
//
// Usage:
//   pack_site --input <dir> --output <file> [--stub <polyserve>] [options]
//   pack_site --list <artifact>
//
// Options:
//   --input, -i <dir>     Site directory to pack.
//   --output, -o <file>   Output artifact path.
//   --stub <file>         Executable to prepend (normally polyserve itself).
//                         Without it only the bare archive section is written.
//   --exclude <pattern>   Pattern for files to exclude (can be repeated).
//   --store               Never compress.
//   --level <1-9>         Deflate level (default 9).
//   --mtime <seconds>     Use this modification time for every file.
//   --max-size <bytes>    Fail if the artifact would be larger.
//   --config <ini>        Embed a server config file.
//   --list <artifact>     Print the archive directory of an artifact and exit.
//   --verbose, -v         Print files being added.
//   --help, -h            Show this help message.

#include "core/config.hpp"
#include "core/file_util.hpp"
#include "vfs/archive_error.hpp"
#include "vfs/archive_index.hpp"
#include "vfs/archive_writer.hpp"
#include "vfs/polyglot.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

struct Options {
    fs::path inputDir;
    fs::path outputFile;
    fs::path stubFile;
    fs::path configFile;
    fs::path listFile;
    std::vector<std::string> excludePatterns;
    bool store{false};
    int level{9};
    std::optional<std::int64_t> mtime;
    std::uint64_t maxSize{polyserve::vfs::kNoSizeLimit};
    bool verbose{false};
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --input <dir> --output <file> [options]\n"
              << "       " << program << " --list <artifact>\n"
              << "\n"
              << "Options:\n"
              << "  --input, -i <dir>     Site directory to pack.\n"
              << "  --output, -o <file>   Output artifact path.\n"
              << "  --stub <file>         Executable to prepend (normally polyserve).\n"
              << "  --exclude <pattern>   Pattern for files to exclude (can be repeated).\n"
              << "  --store               Never compress.\n"
              << "  --level <1-9>         Deflate level (default 9).\n"
              << "  --mtime <seconds>     Use this modification time for every file.\n"
              << "  --max-size <bytes>    Fail if the artifact would be larger.\n"
              << "  --config <ini>        Embed a server config file.\n"
              << "  --list <artifact>     Print the archive directory of an artifact.\n"
              << "  --verbose, -v         Print files being added.\n"
              << "  --help, -h            Show this help message.\n";
}

template <typename T>
bool parse_number(const char* text, T& out) {
    const std::string_view s(text);
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](const char* what) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires " << what << ".\n";
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--input" || arg == "-i") {
            const char* v = value("a directory path");
            if (!v) return false;
            opts.inputDir = v;
        } else if (arg == "--output" || arg == "-o") {
            const char* v = value("a file path");
            if (!v) return false;
            opts.outputFile = v;
        } else if (arg == "--stub") {
            const char* v = value("a file path");
            if (!v) return false;
            opts.stubFile = v;
        } else if (arg == "--config") {
            const char* v = value("a file path");
            if (!v) return false;
            opts.configFile = v;
        } else if (arg == "--list") {
            const char* v = value("a file path");
            if (!v) return false;
            opts.listFile = v;
        } else if (arg == "--exclude") {
            const char* v = value("a pattern");
            if (!v) return false;
            opts.excludePatterns.push_back(v);
        } else if (arg == "--store") {
            opts.store = true;
        } else if (arg == "--level") {
            const char* v = value("a number");
            if (!v) return false;
            if (!parse_number(v, opts.level) || opts.level < 1 || opts.level > 9) {
                std::cerr << "Error: --level must be between 1 and 9.\n";
                return false;
            }
        } else if (arg == "--mtime") {
            const char* v = value("a number");
            if (!v) return false;
            std::int64_t mtime = 0;
            if (!parse_number(v, mtime)) {
                std::cerr << "Error: Invalid --mtime: " << v << "\n";
                return false;
            }
            opts.mtime = mtime;
        } else if (arg == "--max-size") {
            const char* v = value("a number");
            if (!v) return false;
            if (!parse_number(v, opts.maxSize)) {
                std::cerr << "Error: Invalid --max-size: " << v << "\n";
                return false;
            }
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    if (!opts.listFile.empty()) {
        return true;
    }
    if (opts.inputDir.empty()) {
        std::cerr << "Error: --input is required.\n";
        return false;
    }
    if (opts.outputFile.empty()) {
        std::cerr << "Error: --output is required.\n";
        return false;
    }

    return true;
}

bool matches_pattern(const std::string& filename, const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }

    if (pattern[0] == '*') {
        std::string suffix = pattern.substr(1);
        if (filename.length() >= suffix.length()) {
            return filename.compare(filename.length() - suffix.length(), suffix.length(), suffix) == 0;
        }
        return false;
    }

    return filename == pattern;
}

bool should_exclude(const std::string& relativePath, const std::vector<std::string>& patterns) {
    fs::path p(relativePath);
    std::string filename = p.filename().string();

    for (const auto& pattern : patterns) {
        if (matches_pattern(filename, pattern) || matches_pattern(relativePath, pattern)) {
            return true;
        }
    }
    return false;
}

int list_artifact(const fs::path& artifact) {
    auto index = polyserve::vfs::ArchiveIndex::open(artifact);

    std::uint64_t totalSize = 0;
    for (const auto& entry : index->entries()) {
        const char* method = entry.method == polyserve::vfs::Compression::Deflate ? "deflate" : "stored";
        std::cout << method << "\t" << entry.uncompressedSize << "\t" << entry.compressedSize
                  << "\t" << entry.path << "\n";
        totalSize += entry.uncompressedSize;
    }

    std::cout << index->entries().size() << " files, " << (totalSize / 1024) << " KB; archive "
              << index->section_size() << " bytes after a " << index->section_offset()
              << " byte stub\n";
    return 0;
}

int pack(const Options& opts) {
    std::error_code ec;
    if (!fs::is_directory(opts.inputDir, ec) || ec) {
        std::cerr << "Error: Input directory does not exist: " << opts.inputDir << "\n";
        return 1;
    }

    struct FileEntry {
        fs::path absolutePath;
        std::string archivePath;
    };
    std::vector<FileEntry> files;

    for (const auto& entry : fs::recursive_directory_iterator(opts.inputDir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }

        fs::path relativePath = fs::relative(entry.path(), opts.inputDir, ec);
        if (ec) {
            std::cerr << "Error: " << entry.path() << ": " << ec.message() << "\n";
            return 1;
        }

        std::string archivePath = relativePath.generic_string();

        if (should_exclude(archivePath, opts.excludePatterns)) {
            if (opts.verbose) {
                std::cout << "Excluding: " << archivePath << "\n";
            }
            continue;
        }

        files.push_back({entry.path(), archivePath});
    }
    if (ec) {
        std::cerr << "Error iterating directory: " << ec.message() << "\n";
        return 1;
    }

    std::sort(files.begin(), files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.archivePath < b.archivePath; });

    polyserve::vfs::ArchiveWriter writer;
    writer.set_compression(opts.store ? polyserve::vfs::ArchiveWriter::CompressionPolicy::StoreOnly
                                      : polyserve::vfs::ArchiveWriter::CompressionPolicy::Auto,
                           opts.level);
    writer.set_fixed_mtime(opts.mtime);

    for (const auto& file : files) {
        writer.add_file_from_disk(file.archivePath, file.absolutePath);
        if (opts.verbose) {
            std::cout << file.archivePath << "\n";
        }
    }

    if (!opts.configFile.empty()) {
        // Validate before embedding so a typo fails the build, not the server.
        polyserve::core::Config check;
        if (!check.load_from_file(opts.configFile.string())) {
            std::cerr << "Error: Cannot read config file: " << opts.configFile << "\n";
            return 1;
        }
        writer.add_file_from_disk(polyserve::core::kEmbeddedConfigPath, opts.configFile);
        if (opts.verbose) {
            std::cout << polyserve::core::kEmbeddedConfigPath << " (config)\n";
        }
    }

    const std::vector<std::uint8_t> archive = writer.finalize();

    std::vector<std::uint8_t> stub;
    if (!opts.stubFile.empty()) {
        auto data = polyserve::core::read_file(opts.stubFile);
        if (!data) {
            std::cerr << "Error: Cannot read stub: " << opts.stubFile << "\n";
            return 1;
        }
        stub = std::move(*data);
    }

    fs::path outputDir = opts.outputFile.parent_path();
    if (!outputDir.empty() && !fs::exists(outputDir, ec)) {
        fs::create_directories(outputDir, ec);
        if (ec) {
            std::cerr << "Error: Cannot create output directory: " << ec.message() << "\n";
            return 1;
        }
    }

    polyserve::vfs::write_combined(opts.outputFile, stub, archive, opts.maxSize);

    std::cout << "Packed " << writer.file_count() << " files into " << opts.outputFile << "\n";
    std::cout << "  Input size:   " << (writer.input_bytes() / 1024) << " KB\n";
    std::cout << "  Archive size: " << (archive.size() / 1024) << " KB\n";
    if (!stub.empty()) {
        std::cout << "  Stub size:    " << (stub.size() / 1024) << " KB\n";
    }

    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    try {
        if (!opts.listFile.empty()) {
            return list_artifact(opts.listFile);
        }
        return pack(opts);
    } catch (const polyserve::vfs::ArchiveError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
