#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace nimage {

GzipReader::GzipReader(std::unique_ptr<IReader> source, std::optional<std::uint64_t> raw_size)
    : source_(std::move(source)), raw_size_(raw_size), in_buffer_(64 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Fail(std::string msg) {
    failed_ = true;
    error_ = std::move(msg);
    return -1;
}

bool GzipReader::Refill() {
    const ssize_t n = source_->Read(in_buffer_);
    if (n < 0) {
        Fail("source read failed");
        return false;
    }
    if (n == 0) {
        source_drained_ = true;
        return true;
    }
    strm_.avail_in = static_cast<uInt>(n);
    strm_.next_in = in_buffer_.data();
    return true;
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (failed_) return -1;
    if (out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0 && !source_drained_) {
            if (!Refill()) return -1;
        }

        if (strm_.avail_in == 0 && source_drained_) {
            // A member that started but never reached its trailer is truncated.
            if (member_open_) {
                return Fail("truncated gzip stream");
            }
            break;
        }

        member_open_ = true;
        const int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            // Members are concatenated; the next one starts right after this trailer.
            member_open_ = false;
            if (inflateReset(&strm_) != Z_OK) {
                return Fail("inflateReset failed");
            }
            continue;
        }

        // Z_BUF_ERROR is not fatal; it just means we need more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return Fail(std::string("inflate: ") + (strm_.msg ? strm_.msg : "corrupt data"));
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace nimage
