#include "io/mapped_file.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nimage {

Result MappedFile::Open(const std::string& path, MappedFile& out) {
    out.Unmap();

    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return Result::Fail(errno, "Failed to open input: " + path + " (" + std::strerror(errno) + ")");
    }

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) {
        return Result::Fail(errno, "fstat " + path + " failed (" + std::strerror(errno) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(ENODEV, path + " is not a regular file");
    }
    if (st.st_size == 0) {
        return Result::Ok();
    }

    void* addr = ::mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd.Get(), 0);
    if (addr == MAP_FAILED) {
        return Result::Fail(errno, "mmap " + path + " failed (" + std::strerror(errno) + ")");
    }
    // Sequential scan for checksums, then sequential reads for the writer.
    if (::madvise(addr, static_cast<size_t>(st.st_size), MADV_SEQUENTIAL) != 0) {
        LogDebug("madvise %s failed (%s)", path.c_str(), std::strerror(errno));
    }

    out.addr_ = addr;
    out.size_ = static_cast<size_t>(st.st_size);
    return Result::Ok();
}

MappedFile::MappedFile(MappedFile&& other) noexcept { *this = std::move(other); }

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
    if (this != &other) {
        Unmap();
        addr_ = other.addr_;
        size_ = other.size_;
        other.addr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

MappedFile::~MappedFile() { Unmap(); }

void MappedFile::Unmap() {
    if (addr_ != nullptr) {
        ::munmap(addr_, size_);
    }
    addr_ = nullptr;
    size_ = 0;
}

} // namespace nimage
