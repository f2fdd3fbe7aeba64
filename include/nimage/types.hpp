#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace nimage {

// On-disk role_tag values.
enum class SegmentRole : std::uint8_t {
    Invalid = 0,
    Kernel  = 1,
    Dtb     = 2,
    Rootfs  = 3,
    Config  = 4,
    Other   = 5,
};

// On-disk compression_kind values.
enum class CompressionKind : std::uint8_t {
    None = 0,
    Zlib = 1,
};

const char* ToString(SegmentRole role);
const char* ToString(CompressionKind kind);

// Accepts the names produced by ToString ("kernel", "dtb", ...).
bool ParseSegmentRole(std::string_view s, SegmentRole& out);

bool IsValidRole(std::uint8_t raw);
bool IsValidCompression(std::uint8_t raw);

// Only "other" may appear more than once in an image.
inline bool IsRepeatableRole(SegmentRole role) { return role == SegmentRole::Other; }

// load_address / entry_point are meaningful for these roles and must be zero elsewhere.
inline bool RoleCarriesLoadInfo(SegmentRole role) {
    return role == SegmentRole::Kernel || role == SegmentRole::Other;
}

// Addresses a segment as (role, n-th occurrence of that role in table order).
struct SegmentKey {
    SegmentRole role = SegmentRole::Invalid;
    std::uint32_t ordinal = 0;

    // "kernel", "other#2"
    std::string Label() const;

    bool operator==(const SegmentKey&) const = default;
};

// Parses "ROLE" or "ROLE#ORDINAL".
bool ParseSegmentKey(std::string_view s, SegmentKey& out);

} // namespace nimage
