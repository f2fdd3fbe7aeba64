#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace nimage {

// zlib compressor that splits the input into fixed-size blocks and deflates
// each one into its own gzip member; members are concatenated in block order.
// Block boundaries depend only on block_size, so the output is identical for
// every worker count.
class BlockCompressor {
public:
    static constexpr std::size_t kMinBlockSize = 4 * 1024;
    static constexpr std::size_t kMaxBlockSize = 64 * 1024 * 1024;

    struct Options {
        int level = 6;                          // zlib level 0..9
        std::size_t block_size = 1024 * 1024;
        unsigned workers = 0;                   // 0 => std::thread::hardware_concurrency()
    };

    BlockCompressor();
    explicit BlockCompressor(const Options& opt);

    // Checks level and block size.
    static std::expected<void, std::string> ValidateOptions(const Options& opt);

    std::expected<std::vector<std::uint8_t>, std::string> Compress(
        std::span<const std::uint8_t> raw) const;

    // Threads actually used for an input of the given size.
    unsigned WorkersFor(std::size_t raw_size) const;

    const Options& options() const { return opt_; }

private:
    Options opt_;
};

struct DecompressFailure {
    bool length_mismatch = false;  // stream is valid but inflates to the wrong size
    std::string msg;
};

// Inflates a concatenation of gzip members and requires exactly raw_length bytes out.
std::expected<std::vector<std::uint8_t>, DecompressFailure> DecompressBlocks(
    std::span<const std::uint8_t> stored, std::uint64_t raw_length);

} // namespace nimage
