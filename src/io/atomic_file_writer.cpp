#include "io/atomic_file_writer.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace nimage {

Result AtomicFileWriter::Create(std::string path, AtomicFileWriter& out) {
    out.Discard();
    out.path_ = std::move(path);
    out.committed_ = false;

    std::vector<char> tmpl(out.path_.begin(), out.path_.end());
    const char suffix[] = ".tmp-XXXXXX";
    tmpl.insert(tmpl.end(), suffix, suffix + sizeof(suffix));

    const int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        return Result::Fail(errno,
                            "cannot create temporary file for " + out.path_ + " (" +
                                std::strerror(errno) + ")");
    }
    // mkstemp creates 0600; an image is an ordinary artifact.
    if (::fchmod(fd, 0644) != 0) {
        LogWarn("fchmod %s failed (%s)", tmpl.data(), std::strerror(errno));
    }
    out.fd_.Reset(fd);
    out.temp_path_ = tmpl.data();
    return Result::Ok();
}

AtomicFileWriter::AtomicFileWriter(AtomicFileWriter&& other) noexcept { *this = std::move(other); }

AtomicFileWriter& AtomicFileWriter::operator=(AtomicFileWriter&& other) noexcept {
    if (this != &other) {
        Discard();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        temp_path_ = std::move(other.temp_path_);
        committed_ = other.committed_;
        other.temp_path_.clear();
    }
    return *this;
}

AtomicFileWriter::~AtomicFileWriter() { Discard(); }

void AtomicFileWriter::Discard() {
    fd_.Close();
    if (!committed_ && !temp_path_.empty()) {
        ::unlink(temp_path_.c_str());
    }
    temp_path_.clear();
}

Result AtomicFileWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (!fd_.Valid()) return Result::Fail(EBADF, "output not open");

    size_t rem = in.size();
    const std::uint8_t* p = in.data();
    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno, "Write failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

Result AtomicFileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

Result AtomicFileWriter::Commit() {
    if (!fd_.Valid()) return Result::Fail(EBADF, "output not open");

    if (auto r = FsyncNow(); !r.ok) return r;
    if (!fd_.CloseChecked()) {
        return Result::Fail(errno, "close failed (" + std::string(std::strerror(errno)) + ")");
    }
    if (std::rename(temp_path_.c_str(), path_.c_str()) != 0) {
        return Result::Fail(errno,
                            "rename " + temp_path_ + " -> " + path_ + " failed (" +
                                std::strerror(errno) + ")");
    }
    committed_ = true;
    temp_path_.clear();
    return Result::Ok();
}

} // namespace nimage
