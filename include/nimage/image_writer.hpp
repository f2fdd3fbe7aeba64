#pragma once

#include "io/io.hpp"
#include "nimage/error.hpp"
#include "nimage/image_reader.hpp"
#include "nimage/types.hpp"
#include "util/progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

namespace nimage {

struct WriteTarget {
    SegmentKey key;
    IBlockDevice* device = nullptr;  // not owned
    std::uint64_t offset = 0;
};

struct SegmentWriteResult {
    SegmentKey key;
    std::uint32_t attempts = 0;
    std::uint64_t bytes_written = 0;
};

struct WriteReport {
    std::vector<SegmentWriteResult> segments;  // successful writes, in plan order
    std::vector<Error> errors;

    bool ok() const { return errors.empty(); }
};

// Writes segments of a verified container to block devices, one at a time
// and in plan order.
//
// The writer assumes it is the only user of every device in the plan for
// the duration of Write(); callers must not run two writers against the
// same device.
class ImageWriter {
public:
    struct Options {
        std::uint32_t max_attempts = 3;
        std::chrono::milliseconds retry_backoff{200};  // doubled after each failed attempt
        bool verify_readback = true;
        bool stop_on_failure = true;
        std::size_t chunk_size = 256 * 1024;
    };

    ImageWriter();
    explicit ImageWriter(const Options& opt);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    // Verifies the container strictly and resolves the plan before touching
    // any device; those failures are returned as the error. A segment that
    // still fails after max_attempts (or fails to inflate) is returned as the
    // error when stop_on_failure is set, otherwise collected in the report.
    std::expected<WriteReport, Error> Write(ImageReader& reader, const std::vector<WriteTarget>& plan);

    const Options& options() const { return opt_; }

private:
    struct Attempt;

    Attempt WriteOnce(ImageReader& reader,
                      std::size_t index,
                      const WriteTarget& target,
                      std::uint64_t overall_base,
                      std::uint64_t overall_total);

    std::expected<SegmentWriteResult, Error> WriteSegment(ImageReader& reader,
                                                          std::size_t index,
                                                          const WriteTarget& target,
                                                          std::uint64_t overall_base,
                                                          std::uint64_t overall_total);

    void Emit(std::string_view stage,
              std::string_view segment,
              std::uint64_t seg_done,
              std::uint64_t seg_total,
              std::uint64_t overall_done,
              std::uint64_t overall_total);

    Options opt_;
    IProgress* progress_sink_ = nullptr;
};

} // namespace nimage
