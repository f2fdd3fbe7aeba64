#define _FILE_OFFSET_BITS 64

#include "crypto/sha256.hpp"
#include "io/atomic_file_writer.hpp"
#include "io/file_reader.hpp"
#include "nimage/checksum.hpp"
#include "nimage/image_builder.hpp"
#include "nimage/image_reader.hpp"
#include "util/build_manifest.hpp"
#include "util/logger.hpp"
#include "util/progress_sinks.hpp"

#include <cerrno>
#include <cinttypes>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

using namespace nimage;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s create -o <out> [-n <name>] [-j <workers>] [-l <level>] [-b <block>] [-m <manifest.json>]\n"
        "          [FILE:ROLE[:z]]...\n"
        "   %s check [-q] [-r] [-t] <image|->\n"
        "   %s extract -s <role[#n]> -o <out> <image|->\n"
        "   %s hash <file|->\n"
        "\n"
        "Roles: kernel, dtb, rootfs, config, other (repeatable)\n"
        "\n"
        "create options:\n"
        "  -o, --output       Output image path\n"
        "  -n, --name         Image name (at most 64 bytes)\n"
        "  -j, --workers      Compression threads (default: all cores)\n"
        "  -l, --level        zlib level 0..9 (default 6)\n"
        "  -b, --block-size   Compression block size in bytes (default 1048576)\n"
        "  -m, --manifest     JSON build manifest; its segments come before FILE:ROLE parts\n"
        "  A ':z' suffix on FILE:ROLE compresses that segment.\n"
        "\n"
        "check options:\n"
        "  -r, --report       Report every corrupt segment instead of stopping at the first\n"
        "  -t, --trailing     Accept bytes after the last segment\n"
        "  -q, --quiet        Print nothing; exit status only\n"
        "\n"
        "Common:\n"
        "  -v, --verbose      Debug logging\n"
        "  -h, --help         Show this help\n",
        argv0, argv0, argv0, argv0);
}

bool ParseUnsigned(const char* s, unsigned long long& out) {
    char* end = nullptr;
    errno = 0;
    out = std::strtoull(s, &end, 0);
    return end && end != s && *end == '\0' && errno == 0 && s[0] != '-';
}

// FILE:ROLE[:z]; the file part may itself contain ':'.
bool ParsePart(const std::string& arg, std::string& file, SegmentRole& role, bool& compress) {
    std::string rest = arg;
    compress = false;
    if (rest.size() > 2 && rest.compare(rest.size() - 2, 2, ":z") == 0) {
        compress = true;
        rest.resize(rest.size() - 2);
    }
    const auto colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    file = rest.substr(0, colon);
    return ParseSegmentRole(rest.substr(colon + 1), role);
}

std::unique_ptr<IReader> OpenSource(const std::string& path) {
    auto reader = std::make_unique<FileOrStdinReader>();
    if (auto r = FileOrStdinReader::Open(path, *reader); !r.ok) {
        LogError("%s", r.msg.c_str());
        return nullptr;
    }
    return reader;
}

int CmdCreate(int argc, char** argv) {
    std::string out;
    std::string manifest_path;
    std::optional<std::string> name;
    std::optional<unsigned long long> workers, level, block;

    static option long_opts[] = {
        {"output", required_argument, nullptr, 'o'},
        {"name", required_argument, nullptr, 'n'},
        {"workers", required_argument, nullptr, 'j'},
        {"level", required_argument, nullptr, 'l'},
        {"block-size", required_argument, nullptr, 'b'},
        {"manifest", required_argument, nullptr, 'm'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    bool quiet = false;
    int c;
    while ((c = getopt_long(argc, argv, "o:n:j:l:b:m:vqh", long_opts, nullptr)) != -1) {
        unsigned long long v = 0;
        switch (c) {
            case 'o': out = optarg; break;
            case 'n': name = optarg; break;
            case 'm': manifest_path = optarg; break;
            case 'v': Logger::Instance().SetLevel(LogLevel::Debug); break;
            case 'q':
                quiet = true;
                Logger::Instance().SetLevel(LogLevel::Warn);
                break;
            case 'j':
            case 'l':
            case 'b':
                if (!ParseUnsigned(optarg, v)) {
                    std::fprintf(stderr, "Invalid -%c value: %s\n", c, optarg);
                    return 2;
                }
                (c == 'j' ? workers : c == 'l' ? level : block) = v;
                break;
            case 'h':
                PrintUsage("mknimage");
                return 0;
            default:
                PrintUsage("mknimage");
                return 2;
        }
    }

    if (out.empty()) {
        std::fprintf(stderr, "create: -o <out> is required\n");
        return 2;
    }

    ImageBuilder::Options opt;
    std::vector<ManifestSegment> parts;

    if (!manifest_path.empty()) {
        auto m = BuildManifestParser{}.LoadFromFile(manifest_path);
        if (!m) {
            std::fprintf(stderr, "ERROR: %s\n", m.error().c_str());
            return 1;
        }
        if (m->name) opt.name = *m->name;
        if (m->level) opt.level = *m->level;
        if (m->block_size) opt.block_size = *m->block_size;
        if (m->workers) opt.workers = *m->workers;
        parts = std::move(m->segments);
    }

    if (name) opt.name = *name;
    if (level) {
        if (*level > 9) {
            std::fprintf(stderr, "create: level must be 0..9\n");
            return 2;
        }
        opt.level = static_cast<int>(*level);
    }
    if (block) opt.block_size = static_cast<std::size_t>(*block);
    if (workers) {
        if (*workers > UINT_MAX) {
            std::fprintf(stderr, "create: workers out of range\n");
            return 2;
        }
        opt.workers = static_cast<unsigned>(*workers);
    }

    for (int i = optind; i < argc; ++i) {
        ManifestSegment part;
        if (!ParsePart(argv[i], part.file, part.role, part.compress)) {
            std::fprintf(stderr, "create: cannot parse part '%s' (expected FILE:ROLE[:z])\n", argv[i]);
            return 2;
        }
        parts.push_back(std::move(part));
    }

    if (parts.empty()) {
        std::fprintf(stderr, "create: no segments given\n");
        return 2;
    }

    ImageBuilder builder(opt);
    ConsoleProgressSink progress;
    if (!quiet && ::isatty(STDERR_FILENO)) builder.SetProgressSink(&progress);

    for (const auto& part : parts) {
        auto source = OpenSource(part.file);
        if (!source) return 1;
        SegmentOptions seg;
        seg.compress = part.compress;
        seg.load_address = part.load_address;
        seg.entry_point = part.entry_point;
        if (auto r = builder.AddSegment(part.role, std::move(source), seg); !r) {
            std::fprintf(stderr, "ERROR: %s: %s\n", part.file.c_str(), r.error().Describe().c_str());
            return 1;
        }
    }

    auto built = builder.BuildToFile(out);
    if (!built) {
        std::fprintf(stderr, "ERROR: %s\n", built.error().Describe().c_str());
        return 1;
    }

    const std::string digest = Sha256Hex(built->bytes);
    if (digest.empty()) {
        std::fprintf(stderr, "ERROR: cannot compute SHA-256 of %s\n", out.c_str());
        return 1;
    }
    std::printf("%s  %s\n", digest.c_str(), out.c_str());
    return 0;
}

void PrintTable(const ImageReader& reader) {
    const ImageHeader& h = reader.header();
    std::printf("name:     %s\n", h.name.c_str());
    std::printf("version:  %u.%u\n", h.version_major, h.version_minor);
    std::printf("size:     %" PRIu64 " bytes\n", h.total_image_size);
    std::printf("checksum: %016" PRIx64 "\n", h.header_checksum);
    std::printf("segments: %zu\n", h.segments.size());
    std::printf("  %-3s %-10s %-5s %12s %12s %12s %-16s %-18s %-18s\n",
                "#", "segment", "comp", "offset", "stored", "raw", "xxh64", "load", "entry");
    for (std::size_t i = 0; i < h.segments.size(); ++i) {
        const SegmentEntry& s = h.segments[i];
        std::printf("  %-3zu %-10s %-5s %12" PRIu64 " %12" PRIu64 " %12" PRIu64
                    " %016" PRIx64 " 0x%016" PRIx64 " 0x%016" PRIx64 "\n",
                    i,
                    h.KeyAt(i).Label().c_str(),
                    ToString(s.compression),
                    s.offset,
                    s.stored_length,
                    s.raw_length,
                    s.checksum,
                    s.load_address,
                    s.entry_point);
    }
}

int CmdCheck(int argc, char** argv) {
    bool quiet = false;
    ReaderOptions ropt;
    VerifyMode mode = VerifyMode::Strict;

    static option long_opts[] = {
        {"quiet", no_argument, nullptr, 'q'},
        {"report", no_argument, nullptr, 'r'},
        {"trailing", no_argument, nullptr, 't'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int c;
    while ((c = getopt_long(argc, argv, "qrtvh", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'q':
                quiet = true;
                Logger::Instance().SetLevel(LogLevel::None);
                break;
            case 'r': mode = VerifyMode::Report; break;
            case 't': ropt.allow_trailing_data = true; break;
            case 'v': Logger::Instance().SetLevel(LogLevel::Debug); break;
            case 'h':
                PrintUsage("mknimage");
                return 0;
            default:
                PrintUsage("mknimage");
                return 2;
        }
    }
    if (optind + 1 != argc) {
        std::fprintf(stderr, "check: expected exactly one image\n");
        return 2;
    }

    auto reader = ImageReader::OpenFile(argv[optind], ropt);
    if (!reader) {
        if (!quiet) std::fprintf(stderr, "ERROR: %s\n", reader.error().Describe().c_str());
        return 1;
    }
    if (!quiet) PrintTable(*reader);

    const VerifyReport report = reader->Verify(mode);
    bool ok = report.ok();

    // Payloads that pass their checksum must also inflate cleanly.
    if (!reader->rejected()) {
        for (std::size_t i = 0; i < reader->SegmentCount(); ++i) {
            if (!reader->VerifySegment(i)) continue;
            if (reader->header().segments[i].compression == CompressionKind::None) continue;
            if (auto raw = reader->GetSegmentAt(i); !raw) {
                ok = false;
                if (!quiet) std::printf("  %s: %s\n", reader->header().KeyAt(i).Label().c_str(),
                                        raw.error().Describe().c_str());
            }
        }
    }

    if (!quiet) {
        for (const auto& e : report.mismatches) {
            std::printf("  %s\n", e.Describe().c_str());
        }
        std::printf("%s: %zu segment(s) checked, %zu corrupt\n",
                    ok ? "OK" : "FAILED", report.checked, report.mismatches.size());
    }
    return ok ? 0 : 1;
}

int CmdExtract(int argc, char** argv) {
    std::string out;
    std::string key_arg;

    static option long_opts[] = {
        {"segment", required_argument, nullptr, 's'},
        {"output", required_argument, nullptr, 'o'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int c;
    while ((c = getopt_long(argc, argv, "s:o:vh", long_opts, nullptr)) != -1) {
        switch (c) {
            case 's': key_arg = optarg; break;
            case 'o': out = optarg; break;
            case 'v': Logger::Instance().SetLevel(LogLevel::Debug); break;
            case 'h':
                PrintUsage("mknimage");
                return 0;
            default:
                PrintUsage("mknimage");
                return 2;
        }
    }

    SegmentKey key;
    if (key_arg.empty() || !ParseSegmentKey(key_arg, key)) {
        std::fprintf(stderr, "extract: -s needs ROLE or other#N\n");
        return 2;
    }
    if (out.empty() || optind + 1 != argc) {
        std::fprintf(stderr, "extract: need -o <out> and one image\n");
        return 2;
    }

    auto reader = ImageReader::OpenFile(argv[optind]);
    if (!reader) {
        std::fprintf(stderr, "ERROR: %s\n", reader.error().Describe().c_str());
        return 1;
    }
    auto raw = reader->GetSegment(key);
    if (!raw) {
        std::fprintf(stderr, "ERROR: %s\n", raw.error().Describe().c_str());
        return 1;
    }

    AtomicFileWriter writer;
    auto r = AtomicFileWriter::Create(out, writer);
    if (r.ok) r = writer.WriteAll(*raw);
    if (r.ok) r = writer.Commit();
    if (!r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    LogInfo("extracted %s (%zu bytes) to %s", key.Label().c_str(), raw->size(), out.c_str());
    return 0;
}

int CmdHash(int argc, char** argv) {
    if (argc != 2) {
        std::fprintf(stderr, "hash: expected exactly one file\n");
        return 2;
    }
    FileOrStdinReader reader;
    if (auto r = FileOrStdinReader::Open(argv[1], reader); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    const auto digest = Xxh64(reader);
    if (!digest) {
        std::fprintf(stderr, "ERROR: read failed: %s\n", argv[1]);
        return 1;
    }
    std::printf("%016" PRIx64 "  %s\n", *digest, argv[1]);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help") {
        PrintUsage(argv[0]);
        return 0;
    }

    // Subcommand options start after the subcommand name.
    int sub_argc = argc - 1;
    char** sub_argv = argv + 1;
    optind = 1;

    if (cmd == "create") return CmdCreate(sub_argc, sub_argv);
    if (cmd == "check") return CmdCheck(sub_argc, sub_argv);
    if (cmd == "extract") return CmdExtract(sub_argc, sub_argv);
    if (cmd == "hash") return CmdHash(sub_argc, sub_argv);

    std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
    PrintUsage(argv[0]);
    return 2;
}
