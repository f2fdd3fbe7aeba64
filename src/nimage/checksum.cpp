#include "nimage/checksum.hpp"

#include <xxhash.h>

#include <new>
#include <vector>

namespace nimage {

namespace {

XXH64_state_t* AsState(void* p) { return static_cast<XXH64_state_t*>(p); }

} // namespace

std::uint64_t Xxh64(std::span<const std::uint8_t> data) {
    return static_cast<std::uint64_t>(XXH64(data.data(), data.size(), 0));
}

std::optional<std::uint64_t> Xxh64(IReader& reader) {
    Xxh64Hasher hasher;
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return std::nullopt;
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return hasher.Digest();
}

void Xxh64Hasher::StateDeleter::operator()(void* state) const {
    XXH64_freeState(AsState(state));
}

Xxh64Hasher::Xxh64Hasher() : state_(XXH64_createState()) {
    if (!state_) throw std::bad_alloc();
    Reset();
}

Xxh64Hasher::Xxh64Hasher(Xxh64Hasher&&) noexcept = default;
Xxh64Hasher& Xxh64Hasher::operator=(Xxh64Hasher&&) noexcept = default;
Xxh64Hasher::~Xxh64Hasher() = default;

void Xxh64Hasher::Update(std::span<const std::uint8_t> data) {
    if (data.empty()) return;
    XXH64_update(AsState(state_.get()), data.data(), data.size());
    total_ += data.size();
}

std::uint64_t Xxh64Hasher::Digest() const {
    return static_cast<std::uint64_t>(XXH64_digest(AsState(state_.get())));
}

void Xxh64Hasher::Reset() {
    XXH64_reset(AsState(state_.get()), 0);
    total_ = 0;
}

} // namespace nimage
