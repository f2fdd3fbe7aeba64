#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/nimage_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

class MemoryReader final : public nimage::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

// Fails on the first Read with EIO.
class FailingReader final : public nimage::IReader {
  public:
    ssize_t Read(std::span<std::uint8_t>) override {
        errno = EIO;
        return -1;
    }
};

inline std::string ReadAll(nimage::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

// Compressible: short repeating text with a slowly changing counter.
inline std::vector<std::uint8_t> TextBytes(size_t n) {
    std::vector<std::uint8_t> out;
    out.reserve(n);
    size_t line = 0;
    while (out.size() < n) {
        const std::string s = "segment payload line " + std::to_string(line++ / 16) + "\n";
        for (char c : s) {
            if (out.size() == n) break;
            out.push_back(static_cast<std::uint8_t>(c));
        }
    }
    return out;
}

// Incompressible.
inline std::vector<std::uint8_t> RandomBytes(size_t n, std::uint32_t seed = 1) {
    std::mt19937 rng(seed);
    std::vector<std::uint8_t> out(n);
    for (auto& b : out) b = static_cast<std::uint8_t>(rng() & 0xFF);
    return out;
}

inline void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data) {
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) throw std::runtime_error("cannot write " + path);
    os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline void WriteFile(const std::string& path, const std::string& text) {
    WriteFile(path, std::vector<std::uint8_t>(text.begin(), text.end()));
}

inline std::vector<std::uint8_t> ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) throw std::runtime_error("cannot read " + path);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

struct WriteCall {
    std::string device;
    std::uint64_t offset = 0;
    std::size_t length = 0;
};

// In-memory IBlockDevice with injectable faults.
class MemoryDevice final : public nimage::IBlockDevice {
  public:
    explicit MemoryDevice(std::string name, std::vector<WriteCall>* log = nullptr)
        : name_(std::move(name)), log_(log) {}

    nimage::Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) override {
        ++write_calls;
        if (log_) log_->push_back(WriteCall{name_, offset, in.size()});
        if (always_fail_writes || fail_writes > 0) {
            if (fail_writes > 0) --fail_writes;
            return nimage::Result::Fail(EIO, "injected write failure");
        }
        const auto end = static_cast<size_t>(offset + in.size());
        if (data.size() < end) data.resize(end, 0);
        std::copy(in.begin(), in.end(), data.begin() + static_cast<std::ptrdiff_t>(offset));
        return nimage::Result::Ok();
    }

    nimage::Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) override {
        ++read_calls;
        if (offset + out.size() > data.size()) {
            return nimage::Result::Fail(EIO, "read past end");
        }
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), out.size(), out.begin());
        if (corrupt_reads > 0 && !out.empty()) {
            --corrupt_reads;
            out[0] ^= 0xFF;
        }
        return nimage::Result::Ok();
    }

    nimage::Result Sync() override {
        ++sync_calls;
        return nimage::Result::Ok();
    }

    const std::string& Name() const override { return name_; }

    std::vector<std::uint8_t> data;
    int fail_writes = 0;
    bool always_fail_writes = false;
    int corrupt_reads = 0;

    int write_calls = 0;
    int read_calls = 0;
    int sync_calls = 0;

  private:
    std::string name_;
    std::vector<WriteCall>* log_;
};

} // namespace testutil
