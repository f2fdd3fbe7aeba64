#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace nimage {

// XXH64 with seed 0, the digest used for header and segment checksums.
std::uint64_t Xxh64(std::span<const std::uint8_t> data);

// Streams reader to the end. nullopt on read error.
std::optional<std::uint64_t> Xxh64(IReader& reader);

class Xxh64Hasher {
public:
    Xxh64Hasher();
    Xxh64Hasher(const Xxh64Hasher&) = delete;
    Xxh64Hasher& operator=(const Xxh64Hasher&) = delete;
    Xxh64Hasher(Xxh64Hasher&&) noexcept;
    Xxh64Hasher& operator=(Xxh64Hasher&&) noexcept;
    ~Xxh64Hasher();

    void Update(std::span<const std::uint8_t> data);
    // Digest of everything fed so far; the hasher stays usable.
    std::uint64_t Digest() const;
    void Reset();

    std::uint64_t TotalLength() const { return total_; }

private:
    struct StateDeleter {
        void operator()(void* state) const;
    };
    std::unique_ptr<void, StateDeleter> state_;
    std::uint64_t total_ = 0;
};

} // namespace nimage
