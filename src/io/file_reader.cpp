#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <sys/stat.h>
#include <unistd.h>

namespace nimage {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        out.size_ = std::nullopt;
        return Result::Ok();
    }

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open input: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileOrStdinReader::TotalSize() const { return size_; }

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result ReadAllBytes(IReader& reader, std::uint64_t limit, std::vector<std::uint8_t>& out) {
    out.clear();
    if (auto hint = reader.TotalSize(); hint.has_value()) {
        if (*hint > limit) {
            return Result::Fail(EFBIG,
                                "input is " + std::to_string(*hint) + " bytes, limit is " +
                                    std::to_string(limit));
        }
        out.reserve(static_cast<size_t>(*hint));
    }

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            const int e = errno;
            return Result::Fail(e, std::string("read failed (") + std::strerror(e) + ")");
        }
        if (out.size() + static_cast<std::uint64_t>(n) > limit) {
            return Result::Fail(EFBIG, "input exceeds limit of " + std::to_string(limit) + " bytes");
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

Result ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out) {
    FileOrStdinReader reader;
    if (auto r = FileOrStdinReader::Open(path, reader); !r.ok) {
        return r;
    }
    auto r = ReadAllBytes(reader, std::numeric_limits<std::uint64_t>::max(), out);
    if (!r.ok) {
        return Result::Fail(r.err, path + ": " + r.msg);
    }
    return Result::Ok();
}

} // namespace nimage
