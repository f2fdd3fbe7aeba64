#include "nimage/compressor.hpp"

#include "io/gzip_reader.hpp"
#include "io/span_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <new>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <zlib.h>

namespace nimage {

namespace {

std::expected<std::vector<std::uint8_t>, std::string> DeflateMember(
    std::span<const std::uint8_t> block, int level) {
    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    // 16 + MAX_WBITS selects the gzip wrapper; mtime stays 0 so output is reproducible.
    if (deflateInit2(&strm, level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::unexpected("deflateInit2 failed");
    }

    std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(block.size())) + 32);
    strm.next_in = const_cast<Bytef*>(block.data());
    strm.avail_in = static_cast<uInt>(block.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    const int ret = deflate(&strm, Z_FINISH);
    const uLong produced = strm.total_out;
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return std::unexpected("deflate did not finish (zlib code " + std::to_string(ret) + ")");
    }
    out.resize(static_cast<size_t>(produced));
    return out;
}

} // namespace

BlockCompressor::BlockCompressor() : BlockCompressor(Options{}) {}

BlockCompressor::BlockCompressor(const Options& opt) : opt_(opt) {}

std::expected<void, std::string> BlockCompressor::ValidateOptions(const Options& opt) {
    if (opt.level < 0 || opt.level > 9) {
        return std::unexpected("compression level " + std::to_string(opt.level) +
                               " out of range 0..9");
    }
    if (opt.block_size < kMinBlockSize || opt.block_size > kMaxBlockSize) {
        return std::unexpected("block size " + std::to_string(opt.block_size) + " out of range " +
                               std::to_string(kMinBlockSize) + ".." +
                               std::to_string(kMaxBlockSize));
    }
    return {};
}

unsigned BlockCompressor::WorkersFor(std::size_t raw_size) const {
    const std::size_t blocks = (raw_size + opt_.block_size - 1) / opt_.block_size;
    unsigned workers = opt_.workers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<unsigned>(std::max<std::size_t>(1, std::min<std::size_t>(workers, blocks)));
}

std::expected<std::vector<std::uint8_t>, std::string> BlockCompressor::Compress(
    std::span<const std::uint8_t> raw) const {
    if (auto v = ValidateOptions(opt_); !v) {
        return std::unexpected(v.error());
    }
    if (raw.empty()) {
        return std::vector<std::uint8_t>{};
    }

    const std::size_t block_count = (raw.size() + opt_.block_size - 1) / opt_.block_size;
    std::vector<std::vector<std::uint8_t>> members(block_count);
    std::vector<std::string> errors(block_count);
    std::atomic<std::size_t> next{0};
    std::atomic_bool failed{false};

    auto work = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= block_count) return;
            const std::size_t off = i * opt_.block_size;
            const std::size_t len = std::min(opt_.block_size, raw.size() - off);
            auto member = DeflateMember(raw.subspan(off, len), opt_.level);
            if (!member) {
                errors[i] = member.error();
                failed.store(true, std::memory_order_relaxed);
                return;
            }
            members[i] = std::move(*member);
        }
    };

    const unsigned workers = WorkersFor(raw.size());
    LogDebug("compressing %zu bytes in %zu block(s) with %u worker(s)",
             raw.size(), block_count, workers);

    if (workers == 1) {
        work();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        std::string spawn_error;
        try {
            for (unsigned t = 0; t < workers; ++t) {
                pool.emplace_back(work);
            }
        } catch (const std::system_error& e) {
            spawn_error = std::string("cannot start compression worker: ") + e.what();
            failed.store(true, std::memory_order_relaxed);
        }
        for (auto& th : pool) {
            th.join();
        }
        if (!spawn_error.empty()) {
            return std::unexpected(spawn_error);
        }
    }

    for (std::size_t i = 0; i < block_count; ++i) {
        if (!errors[i].empty()) {
            return std::unexpected("block " + std::to_string(i) + ": " + errors[i]);
        }
    }

    std::size_t total = 0;
    for (const auto& m : members) total += m.size();
    std::vector<std::uint8_t> out;
    out.reserve(total);
    for (const auto& m : members) {
        out.insert(out.end(), m.begin(), m.end());
    }
    return out;
}

std::expected<std::vector<std::uint8_t>, DecompressFailure> DecompressBlocks(
    std::span<const std::uint8_t> stored, std::uint64_t raw_length) {
    std::unique_ptr<GzipReader> reader;
    try {
        reader = std::make_unique<GzipReader>(std::make_unique<SpanReader>(stored), raw_length);
    } catch (const std::exception& e) {
        return std::unexpected(DecompressFailure{false, std::string("inflate init failed: ") + e.what()});
    }

    // raw_length comes from the header; grow with the stream instead of trusting it.
    constexpr std::size_t kChunk = 1024 * 1024;
    std::vector<std::uint8_t> out;
    std::uint64_t pos = 0;
    try {
        out.reserve(static_cast<size_t>(std::min<std::uint64_t>(raw_length, 16 * kChunk)));
        while (pos < raw_length) {
            const auto want = static_cast<size_t>(std::min<std::uint64_t>(raw_length - pos, kChunk));
            out.resize(static_cast<size_t>(pos) + want);
            const ssize_t n = reader->Read(std::span<std::uint8_t>(out.data() + pos, want));
            if (n < 0) return std::unexpected(DecompressFailure{false, reader->Error()});
            if (n == 0) {
                return std::unexpected(DecompressFailure{
                    true, "stream ended after " + std::to_string(pos) + " of " +
                              std::to_string(raw_length) + " bytes"});
            }
            pos += static_cast<std::uint64_t>(n);
            out.resize(static_cast<size_t>(pos));
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(DecompressFailure{
            false, "out of memory after " + std::to_string(pos) + " of " + std::to_string(raw_length) +
                       " bytes"});
    } catch (const std::length_error&) {
        return std::unexpected(DecompressFailure{
            false, "raw length " + std::to_string(raw_length) + " exceeds addressable memory"});
    }

    std::uint8_t extra = 0;
    const ssize_t n = reader->Read(std::span<std::uint8_t>(&extra, 1));
    if (n < 0) return std::unexpected(DecompressFailure{false, reader->Error()});
    if (n > 0) {
        return std::unexpected(DecompressFailure{
            true, "stream inflates to more than " + std::to_string(raw_length) + " bytes"});
    }
    return out;
}

} // namespace nimage
