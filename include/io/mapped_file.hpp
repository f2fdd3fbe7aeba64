#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace nimage {

// Read-only, private mapping of a whole regular file. Pages are faulted in on
// access, so multi-gigabyte containers are not copied into memory.
// Open() fails with ENODEV for anything that is not a regular file.
class MappedFile {
  public:
    static Result Open(const std::string& path, MappedFile& out);

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;
    ~MappedFile();

    std::span<const std::uint8_t> bytes() const {
        return {static_cast<const std::uint8_t*>(addr_), size_};
    }
    std::size_t size() const { return size_; }

  private:
    void Unmap();

    void* addr_ = nullptr;
    std::size_t size_ = 0;
};

} // namespace nimage
