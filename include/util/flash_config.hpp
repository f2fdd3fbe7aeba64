#pragma once

#include "nimage/image_writer.hpp"
#include "nimage/types.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nimage {

struct FlashTarget {
    SegmentKey key;
    std::string device;
    std::uint64_t offset = 0;
};

// Write plan and writer tuning for nimage-flash. Target order is write order.
struct FlashConfig {
    std::vector<FlashTarget> targets;
    std::uint32_t max_attempts = 3;
    std::uint64_t retry_backoff_ms = 200;
    bool verify_readback = true;
    bool stop_on_failure = true;
    std::size_t chunk_size = 256 * 1024;

    ImageWriter::Options ToWriterOptions() const;

    static Result LoadFromFile(const std::string& path, FlashConfig& out);
    static Result Parse(const std::string& json_input, FlashConfig& out);
};

} // namespace nimage
