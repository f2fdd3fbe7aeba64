#pragma once

#include "io/io.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <zlib.h>

namespace nimage {

// Streaming inflate of one or more concatenated gzip members.
// Read returns -1 on corrupt or truncated input; Error() then describes it.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source,
                        std::optional<std::uint64_t> raw_size = std::nullopt);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    // Implementation of IReader
    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return raw_size_; }

    const std::string& Error() const { return error_; }

  private:
    ssize_t Fail(std::string msg);
    bool Refill();

    std::unique_ptr<IReader> source_;
    std::optional<std::uint64_t> raw_size_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool member_open_ = false;
    bool source_drained_ = false;
    bool failed_ = false;
    std::string error_;
};

} // namespace nimage
