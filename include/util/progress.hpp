#pragma once
#include <cstdint>
#include <string_view>

namespace nimage {

struct ProgressEvent {
    std::string_view stage;    // "compress", "write", "readback"
    std::string_view segment;  // e.g. "kernel", "other#1"
    std::uint64_t seg_done = 0;
    std::uint64_t seg_total = 0;

    std::uint64_t overall_done = 0;
    std::uint64_t overall_total = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace nimage
