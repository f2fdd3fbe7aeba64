#pragma once

#include "util/progress.hpp"

#include <string>

namespace nimage {

// Rewrites a small JSON status file ({"stage","segment","segment_percent","overall_percent"})
// through a temp file + rename so readers never see a torn file.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
};

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string last_key_;
    bool finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace nimage
