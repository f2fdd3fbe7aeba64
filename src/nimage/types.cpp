#include "nimage/types.hpp"

#include <charconv>

namespace nimage {

const char* ToString(SegmentRole role) {
    switch (role) {
        case SegmentRole::Kernel: return "kernel";
        case SegmentRole::Dtb:    return "dtb";
        case SegmentRole::Rootfs: return "rootfs";
        case SegmentRole::Config: return "config";
        case SegmentRole::Other:  return "other";
        default:                  return "invalid";
    }
}

const char* ToString(CompressionKind kind) {
    switch (kind) {
        case CompressionKind::None: return "none";
        case CompressionKind::Zlib: return "zlib";
    }
    return "unknown";
}

bool ParseSegmentRole(std::string_view s, SegmentRole& out) {
    if (s == "kernel") out = SegmentRole::Kernel;
    else if (s == "dtb") out = SegmentRole::Dtb;
    else if (s == "rootfs") out = SegmentRole::Rootfs;
    else if (s == "config") out = SegmentRole::Config;
    else if (s == "other") out = SegmentRole::Other;
    else return false;
    return true;
}

bool IsValidRole(std::uint8_t raw) {
    return raw >= static_cast<std::uint8_t>(SegmentRole::Kernel) &&
           raw <= static_cast<std::uint8_t>(SegmentRole::Other);
}

bool IsValidCompression(std::uint8_t raw) {
    return raw <= static_cast<std::uint8_t>(CompressionKind::Zlib);
}

std::string SegmentKey::Label() const {
    std::string out = ToString(role);
    if (ordinal != 0 || IsRepeatableRole(role)) {
        out += "#" + std::to_string(ordinal);
    }
    return out;
}

bool ParseSegmentKey(std::string_view s, SegmentKey& out) {
    const auto hash = s.find('#');
    SegmentKey key;
    if (!ParseSegmentRole(s.substr(0, hash), key.role)) return false;
    if (hash != std::string_view::npos) {
        const auto num = s.substr(hash + 1);
        if (num.empty()) return false;
        const auto [ptr, ec] = std::from_chars(num.data(), num.data() + num.size(), key.ordinal);
        if (ec != std::errc{} || ptr != num.data() + num.size()) return false;
        if (key.ordinal != 0 && !IsRepeatableRole(key.role)) return false;
    }
    out = key;
    return true;
}

} // namespace nimage
