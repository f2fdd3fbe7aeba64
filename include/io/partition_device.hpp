#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace nimage {

// IBlockDevice over a block device node or a regular file.
// Regular files are created if missing but never truncated, so several
// targets can share one file at different offsets.
class PartitionDevice final : public IBlockDevice {
  public:
    struct Options {
        // O_SYNC on the descriptor; slower, but data is on the media when WriteAt returns.
        bool sync_writes = false;
    };

    static Result Open(std::string path, PartitionDevice& out);
    static Result Open(std::string path, const Options& opt, PartitionDevice& out);

    Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) override;
    Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) override;
    Result Sync() override;
    const std::string& Name() const override { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace nimage
