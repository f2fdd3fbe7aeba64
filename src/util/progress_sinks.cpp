#include "util/progress_sinks.hpp"

#include "util/logger.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <string>

namespace nimage {

namespace {
std::atomic_bool g_progress_line_active{false};

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    const auto pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;

    os << "{"
       << "\"stage\":\"" << std::string(e.stage) << "\","
       << "\"segment\":\"" << std::string(e.segment) << "\","
       << "\"segment_percent\":" << Percent(e.seg_done, e.seg_total) << ","
       << "\"overall_percent\":" << Percent(e.overall_done, e.overall_total) << "}";
    os.close();

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        LogDebug("progress file %s not updated", path_.c_str());
    }
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const int seg_pct = Percent(e.seg_done, e.seg_total);
    const int all_pct = Percent(e.overall_done, e.overall_total);

    std::string key(e.stage);
    key.push_back(':');
    key.append(e.segment);
    if (key != last_key_) {
        finished_ = false;
        last_key_ = key;
    }
    if (finished_) return;

    if (e.overall_total > 0) {
        std::fprintf(stderr,
                     "\r%.*s [%.*s] %3d%% | image %3d%%",
                     (int)e.stage.size(), e.stage.data(),
                     (int)e.segment.size(), e.segment.data(),
                     seg_pct,
                     all_pct);
    } else {
        std::fprintf(stderr,
                     "\r%.*s [%.*s] %3d%%",
                     (int)e.stage.size(), e.stage.data(),
                     (int)e.segment.size(), e.segment.data(),
                     seg_pct);
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.seg_total > 0 && e.seg_done >= e.seg_total) {
        std::fprintf(stderr, "\n");
        finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace nimage
