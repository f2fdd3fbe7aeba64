// partition_device.cpp - positional I/O on a block device/partition path.

#include "io/partition_device.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace nimage {

namespace {

std::string ErrnoText(const char* what, int e) {
    return std::string(what) + " (" + std::strerror(e) + ")";
}

} // namespace

Result PartitionDevice::Open(std::string path, PartitionDevice& out) {
    return Open(std::move(path), Options{}, out);
}

Result PartitionDevice::Open(std::string path, const Options& opt, PartitionDevice& out) {
    out.path_ = std::move(path);

    // Read access is needed for read-back verification.
    int flags = O_RDWR | O_CLOEXEC;
    if (!IsDevPath(out.path_)) {
        flags |= O_CREAT;
    }
    if (opt.sync_writes) {
        flags |= O_SYNC;
    }
    int fd = ::open(out.path_.c_str(), flags, 0644);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open device: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result PartitionDevice::WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();
    auto pos = static_cast<off_t>(offset);

    while (rem > 0) {
        ssize_t n = ::pwrite(fd_.Get(), p, rem, pos);
        if (n > 0) {
            p += static_cast<size_t>(n);
            pos += static_cast<off_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = (n == 0) ? ENOSPC : errno;
        return Result::Fail(e, path_ + ": " + ErrnoText("write failed", e));
    }

    return Result::Ok();
}

Result PartitionDevice::ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) {
    size_t rem = out.size();
    std::uint8_t* p = out.data();
    auto pos = static_cast<off_t>(offset);

    while (rem > 0) {
        ssize_t n = ::pread(fd_.Get(), p, rem, pos);
        if (n > 0) {
            p += static_cast<size_t>(n);
            pos += static_cast<off_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            return Result::Fail(EIO, path_ + ": short read at offset " + std::to_string(pos));
        }
        return Result::Fail(errno, path_ + ": " + ErrnoText("read failed", errno));
    }

    return Result::Ok();
}

Result PartitionDevice::Sync() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, path_ + ": " + ErrnoText("fsync failed", errno));
    }
    return Result::Ok();
}

} // namespace nimage
