#pragma once

#include "io/io.hpp"
#include "nimage/error.hpp"
#include "nimage/format.hpp"
#include "nimage/types.hpp"
#include "util/progress.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace nimage {

struct SegmentOptions {
    bool compress = false;
    std::uint64_t load_address = 0;  // kernel / other only
    std::uint64_t entry_point = 0;   // kernel / other only
};

struct BuiltImage {
    ImageHeader header;
    std::vector<std::uint8_t> bytes;
};

// Assembles a container from an ordered list of byte sources.
//
// Segments keep the order in which they were added. Sources are drained by
// Build(), so a builder produces one image.
class ImageBuilder {
public:
    struct Options {
        std::string name;                  // at most 64 bytes
        int level = 6;
        std::size_t block_size = 1024 * 1024;
        unsigned workers = 0;              // 0 => hardware concurrency
        // Compressed form is kept only when stored + margin <= raw.
        std::uint64_t compression_margin = 0;
        std::uint64_t max_segment_size = 4ull * 1024 * 1024 * 1024;
    };

    ImageBuilder();
    explicit ImageBuilder(Options opt);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    // Rejects the input right away when it would break table limits or role rules.
    std::expected<void, Error> AddSegment(SegmentRole role,
                                          std::unique_ptr<IReader> source,
                                          const SegmentOptions& seg_opt = {});

    std::expected<BuiltImage, Error> Build();

    // Builds and writes the image through a temporary file that is renamed
    // onto path only once everything is on disk.
    std::expected<BuiltImage, Error> BuildToFile(const std::string& path);

    std::size_t SegmentCount() const { return inputs_.size(); }
    const Options& options() const { return opt_; }

private:
    struct Input {
        SegmentRole role;
        std::unique_ptr<IReader> source;
        SegmentOptions opt;
        std::string label;
    };

    Options opt_;
    std::vector<Input> inputs_;
    IProgress* progress_sink_ = nullptr;
    bool consumed_ = false;
};

} // namespace nimage
