#pragma once

#include "nimage/error.hpp"
#include "nimage/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace nimage {

// Wire format constants. All integers are little-endian.
inline constexpr std::array<std::uint8_t, 4> kMagic{'n', 'I', 'M', 'G'};
inline constexpr std::uint16_t kVersionMajor = 1;
inline constexpr std::uint16_t kVersionMinor = 0;

inline constexpr std::size_t kHeaderSize = 128;
inline constexpr std::size_t kSegmentEntrySize = 64;
inline constexpr std::size_t kMaxSegments = 16;
inline constexpr std::size_t kNameLength = 64;
inline constexpr std::uint64_t kSegmentAlignment = 16;
// Deflate never expands more than ~1032:1; a larger raw_length is forged.
inline constexpr std::uint64_t kMaxInflateRatio = 1032;

// Byte range of header_checksum inside the fixed header.
inline constexpr std::size_t kChecksumOffset = 8;
inline constexpr std::size_t kChecksumSize = 8;

struct SegmentEntry {
    SegmentRole role = SegmentRole::Invalid;
    CompressionKind compression = CompressionKind::None;
    std::uint64_t offset = 0;
    std::uint64_t stored_length = 0;
    std::uint64_t raw_length = 0;
    std::uint64_t checksum = 0;  // XXH64 of the stored bytes
    std::uint64_t load_address = 0;
    std::uint64_t entry_point = 0;

    std::uint64_t End() const { return offset + stored_length; }
};

struct ImageHeader {
    std::uint16_t version_major = kVersionMajor;
    std::uint16_t version_minor = kVersionMinor;
    std::uint64_t header_checksum = 0;
    std::string name;
    std::uint64_t total_image_size = 0;
    std::vector<SegmentEntry> segments;

    // Fixed header plus segment table.
    std::size_t HeaderRegionSize() const;

    // Index of the segment addressed by key, if present.
    std::optional<std::size_t> Find(const SegmentKey& key) const;
    // (role, ordinal) of the segment at index.
    SegmentKey KeyAt(std::size_t index) const;
};

constexpr std::uint64_t AlignUp(std::uint64_t v, std::uint64_t align) {
    return (v + align - 1) / align * align;
}

constexpr std::size_t HeaderRegionSize(std::size_t segment_count) {
    return kHeaderSize + segment_count * kSegmentEntrySize;
}

// XXH64 of region with the header_checksum bytes treated as zero.
std::uint64_t ComputeHeaderChecksum(std::span<const std::uint8_t> region);

// Encodes the header region exactly as given, header_checksum included.
std::vector<std::uint8_t> EncodeHeader(const ImageHeader& header);

// Encodes with the checksum zeroed, computes it, stores it in header and
// returns the final encoding.
std::vector<std::uint8_t> SerializeHeader(ImageHeader& header);

// Decodes the header region at the start of image: magic, major version,
// segment count, header checksum, reserved bytes, role and compression codes.
std::expected<ImageHeader, Error> ParseHeader(std::span<const std::uint8_t> image);

// Layout invariants that need no payload bytes: alignment, ordering and
// overlap, length rules, role uniqueness, load metadata, total size against
// image_size.
std::expected<void, Error> ValidateStructure(const ImageHeader& header,
                                             std::uint64_t image_size,
                                             bool allow_trailing_data = false);

// Alignment gaps between the header region and segments must be zero.
std::expected<void, Error> CheckPadding(const ImageHeader& header,
                                        std::span<const std::uint8_t> image);

} // namespace nimage
