#define _FILE_OFFSET_BITS 64

#include "crypto/sha256.hpp"
#include "io/file_reader.hpp"
#include "io/mapped_file.hpp"
#include "nimage/flasher.hpp"
#include "nimage/image_reader.hpp"
#include "util/flash_config.hpp"
#include "util/logger.hpp"
#include "util/progress_sinks.hpp"

#include <cerrno>
#include <cstdio>
#include <getopt.h>
#include <memory>
#include <span>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

using namespace nimage;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -i <image|-> -c <config.json> [--sha256 <hex>] [--no-readback]\n"
        "      [--progress-file <path>] [-v]\n"
        "\n"
        "Options:\n"
        "  -i, --input            nImage container, '-' for stdin\n"
        "  -c, --config           JSON flash config (targets in write order)\n"
        "  -s, --sha256           Published SHA-256 of the image; checked before parsing\n"
        "  -n, --no-readback      Skip read-back verification after each segment\n"
        "  -p, --progress-file    Write JSON progress to this file\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv0);
}

} // namespace

int main(int argc, char** argv) {
    std::string in;
    std::string config_path;
    std::string expected_sha;
    std::string progress_file;
    bool no_readback = false;

    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"config", required_argument, nullptr, 'c'},
        {"sha256", required_argument, nullptr, 's'},
        {"no-readback", no_argument, nullptr, 'n'},
        {"progress-file", required_argument, nullptr, 'p'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hi:c:s:np:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'i': in = optarg; break;
            case 'c': config_path = optarg; break;
            case 's': expected_sha = optarg; break;
            case 'n': no_readback = true; break;
            case 'p': progress_file = optarg; break;
            case 'v': Logger::Instance().SetLevel(LogLevel::Debug); break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (in.empty() || config_path.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    FlashConfig cfg;
    if (auto r = FlashConfig::LoadFromFile(config_path, cfg); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    if (no_readback) cfg.verify_readback = false;

    // Regular files are mapped rather than copied; stdin has to be read.
    MappedFile map;
    std::vector<std::uint8_t> bytes;
    bool mapped = false;
    if (in != "-") {
        auto r = MappedFile::Open(in, map);
        if (!r.ok && r.err != ENODEV) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
        mapped = r.ok;
    }
    if (!mapped) {
        if (auto r = ReadFileBytes(in, bytes); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
    }

    if (!expected_sha.empty()) {
        const std::string actual =
            Sha256Hex(mapped ? map.bytes() : std::span<const std::uint8_t>(bytes));
        if (actual.empty() || !Sha256Equal(actual, expected_sha)) {
            LogError("image SHA-256 mismatch: expected %s, got %s", expected_sha.c_str(), actual.c_str());
            return 1;
        }
        LogInfo("image SHA-256 ok (%s)", actual.c_str());
    }

    auto reader = mapped ? ImageReader::Open(std::move(map)) : ImageReader::Open(std::move(bytes));
    if (!reader) {
        LogError("%s", reader.error().Describe().c_str());
        return 1;
    }
    LogInfo("image '%s': %zu segment(s)", reader->header().name.c_str(), reader->SegmentCount());

    Flasher flasher(cfg);
    std::unique_ptr<IProgress> progress;
    if (!progress_file.empty()) {
        progress = std::make_unique<FileProgressSink>(progress_file);
    } else if (::isatty(STDERR_FILENO)) {
        progress = std::make_unique<ConsoleProgressSink>();
    }
    flasher.SetProgressSink(progress.get());

    auto report = flasher.Run(*reader);
    ClearProgressLine();
    if (!report) {
        LogError("flash failed: %s", report.error().Describe().c_str());
        return 1;
    }
    for (const auto& e : report->errors) {
        LogError("flash failed: %s", e.Describe().c_str());
    }
    if (!report->ok()) {
        return 1;
    }

    for (const auto& s : report->segments) {
        LogInfo("%s: %llu bytes, %u attempt(s)",
                s.key.Label().c_str(), (unsigned long long)s.bytes_written, s.attempts);
    }
    LogInfo("flash completed: %zu segment(s)", report->segments.size());
    return 0;
}
