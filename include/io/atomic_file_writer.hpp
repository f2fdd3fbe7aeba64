#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <string>

namespace nimage {

// Writes to "<path>.tmp-XXXXXX" and renames onto path on Commit().
// Destroying an uncommitted writer unlinks the temporary file, so a failed
// build never leaves a partial output behind.
class AtomicFileWriter final : public IWriter {
public:
    static Result Create(std::string path, AtomicFileWriter& out);

    AtomicFileWriter() = default;
    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
    AtomicFileWriter(AtomicFileWriter&& other) noexcept;
    AtomicFileWriter& operator=(AtomicFileWriter&& other) noexcept;
    ~AtomicFileWriter() override;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    // fsync, close, rename into place.
    Result Commit();

    const std::string& TempPath() const { return temp_path_; }

private:
    void Discard();

    Fd fd_;
    std::string path_;
    std::string temp_path_;
    bool committed_ = false;
};

} // namespace nimage
