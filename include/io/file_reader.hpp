#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace nimage {

class FileOrStdinReader final : public IReader {
public:
    static Result Open(std::string path, FileOrStdinReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Drains reader into out. Fails with EFBIG once more than limit bytes are seen.
Result ReadAllBytes(IReader& reader, std::uint64_t limit, std::vector<std::uint8_t>& out);

// Reads a whole file ("-" for stdin).
Result ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out);

} // namespace nimage
