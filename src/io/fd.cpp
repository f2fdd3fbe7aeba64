#include "io/fd.hpp"

#include <unistd.h>

namespace nimage {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

bool Fd::CloseChecked() {
    if (fd_ < 0 || fd_ == STDIN_FILENO) {
        fd_ = -1;
        return true;
    }
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
}

void Fd::Close() {
    if (fd_ >= 0 && fd_ != STDIN_FILENO) {
        ::close(fd_);
    }
    fd_ = -1;
}

} // namespace nimage
