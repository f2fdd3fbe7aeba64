#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>

namespace nimage {

// Sequential byte source. Read returns bytes read, 0 at end of stream, -1 on error.
class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

// Sequential byte sink.
class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

// Random-access destination (partition, flash region, image file).
// A device handle is owned by exactly one ImageWriter run at a time.
class IBlockDevice {
public:
    virtual ~IBlockDevice() = default;
    virtual Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) = 0;
    // Fills out completely or fails.
    virtual Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) = 0;
    virtual Result Sync() = 0;
    virtual const std::string& Name() const = 0;
};

} // namespace nimage
