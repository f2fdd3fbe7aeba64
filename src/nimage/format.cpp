#include "nimage/format.hpp"

#include "nimage/checksum.hpp"

#include <algorithm>
#include <cstring>

namespace nimage {

namespace {

// Fixed header field offsets.
constexpr std::size_t kOffMagic = 0;
constexpr std::size_t kOffVersionMajor = 4;
constexpr std::size_t kOffVersionMinor = 6;
constexpr std::size_t kOffChecksum = kChecksumOffset;
constexpr std::size_t kOffSegmentCount = 16;
constexpr std::size_t kOffFlags = 20;
constexpr std::size_t kOffTotalSize = 24;
constexpr std::size_t kOffName = 32;
constexpr std::size_t kOffReserved = kOffName + kNameLength;

// Segment entry field offsets.
constexpr std::size_t kEntRole = 0;
constexpr std::size_t kEntCompression = 1;
constexpr std::size_t kEntReserved0 = 2;
constexpr std::size_t kEntOffset = 8;
constexpr std::size_t kEntStored = 16;
constexpr std::size_t kEntRaw = 24;
constexpr std::size_t kEntChecksum = 32;
constexpr std::size_t kEntLoad = 40;
constexpr std::size_t kEntEntry = 48;
constexpr std::size_t kEntReserved1 = 56;

static_assert(kOffReserved + 32 == kHeaderSize);
static_assert(kEntReserved1 + 8 == kSegmentEntrySize);

void PutLe16(std::uint8_t* p, std::uint16_t v) {
    p[0] = static_cast<std::uint8_t>(v);
    p[1] = static_cast<std::uint8_t>(v >> 8);
}

void PutLe32(std::uint8_t* p, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) p[i] = static_cast<std::uint8_t>(v >> (8 * i));
}

void PutLe64(std::uint8_t* p, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) p[i] = static_cast<std::uint8_t>(v >> (8 * i));
}

std::uint16_t GetLe16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t GetLe32(const std::uint8_t* p) {
    std::uint32_t v = 0;
    for (int i = 3; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

std::uint64_t GetLe64(const std::uint8_t* p) {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

bool AllZero(const std::uint8_t* p, std::size_t n) {
    return std::all_of(p, p + n, [](std::uint8_t b) { return b == 0; });
}

std::string SegmentLabel(const ImageHeader& h, std::size_t i) {
    return "segment " + std::to_string(i) + " (" + h.KeyAt(i).Label() + ")";
}

} // namespace

std::size_t ImageHeader::HeaderRegionSize() const {
    return nimage::HeaderRegionSize(segments.size());
}

std::optional<std::size_t> ImageHeader::Find(const SegmentKey& key) const {
    std::uint32_t seen = 0;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].role != key.role) continue;
        if (seen == key.ordinal) return i;
        ++seen;
    }
    return std::nullopt;
}

SegmentKey ImageHeader::KeyAt(std::size_t index) const {
    SegmentKey key{segments.at(index).role, 0};
    for (std::size_t i = 0; i < index; ++i) {
        if (segments[i].role == key.role) ++key.ordinal;
    }
    return key;
}

std::uint64_t ComputeHeaderChecksum(std::span<const std::uint8_t> region) {
    std::vector<std::uint8_t> copy(region.begin(), region.end());
    if (copy.size() >= kChecksumOffset + kChecksumSize) {
        std::memset(copy.data() + kChecksumOffset, 0, kChecksumSize);
    }
    return Xxh64(copy);
}

std::vector<std::uint8_t> EncodeHeader(const ImageHeader& header) {
    std::vector<std::uint8_t> out(HeaderRegionSize(header.segments.size()), 0);
    std::uint8_t* p = out.data();

    std::memcpy(p + kOffMagic, kMagic.data(), kMagic.size());
    PutLe16(p + kOffVersionMajor, header.version_major);
    PutLe16(p + kOffVersionMinor, header.version_minor);
    PutLe64(p + kOffChecksum, header.header_checksum);
    PutLe32(p + kOffSegmentCount, static_cast<std::uint32_t>(header.segments.size()));
    PutLe32(p + kOffFlags, 0);
    PutLe64(p + kOffTotalSize, header.total_image_size);
    std::memcpy(p + kOffName, header.name.data(), std::min(header.name.size(), kNameLength));

    for (std::size_t i = 0; i < header.segments.size(); ++i) {
        const SegmentEntry& s = header.segments[i];
        std::uint8_t* e = p + kHeaderSize + i * kSegmentEntrySize;
        e[kEntRole] = static_cast<std::uint8_t>(s.role);
        e[kEntCompression] = static_cast<std::uint8_t>(s.compression);
        PutLe64(e + kEntOffset, s.offset);
        PutLe64(e + kEntStored, s.stored_length);
        PutLe64(e + kEntRaw, s.raw_length);
        PutLe64(e + kEntChecksum, s.checksum);
        PutLe64(e + kEntLoad, s.load_address);
        PutLe64(e + kEntEntry, s.entry_point);
    }
    return out;
}

std::vector<std::uint8_t> SerializeHeader(ImageHeader& header) {
    header.header_checksum = 0;
    std::vector<std::uint8_t> out = EncodeHeader(header);
    header.header_checksum = Xxh64(out);
    PutLe64(out.data() + kOffChecksum, header.header_checksum);
    return out;
}

std::expected<ImageHeader, Error> ParseHeader(std::span<const std::uint8_t> image) {
    if (image.size() < kHeaderSize) {
        return std::unexpected(FormatError(Errc::Truncated,
            "image is " + std::to_string(image.size()) + " bytes, shorter than the header"));
    }
    const std::uint8_t* p = image.data();

    if (std::memcmp(p + kOffMagic, kMagic.data(), kMagic.size()) != 0) {
        return std::unexpected(FormatError(Errc::BadMagic, "not an nImage container"));
    }

    ImageHeader h;
    h.version_major = GetLe16(p + kOffVersionMajor);
    h.version_minor = GetLe16(p + kOffVersionMinor);
    if (h.version_major != kVersionMajor) {
        return std::unexpected(FormatError(Errc::UnsupportedVersion,
            "unsupported format version " + std::to_string(h.version_major) + "." +
            std::to_string(h.version_minor)));
    }

    const std::uint32_t count = GetLe32(p + kOffSegmentCount);
    if (count > kMaxSegments) {
        return std::unexpected(FormatError(Errc::TooManySegments,
            "segment count " + std::to_string(count) + " exceeds " + std::to_string(kMaxSegments)));
    }

    const std::size_t region = HeaderRegionSize(count);
    if (image.size() < region) {
        return std::unexpected(FormatError(Errc::Truncated, "segment table is truncated"));
    }

    h.header_checksum = GetLe64(p + kOffChecksum);
    const std::uint64_t actual = ComputeHeaderChecksum(image.first(region));
    if (actual != h.header_checksum) {
        Error e = FormatError(Errc::BadHeaderChecksum, "header checksum mismatch");
        e.expected = h.header_checksum;
        e.actual = actual;
        return std::unexpected(std::move(e));
    }

    if (GetLe32(p + kOffFlags) != 0 || !AllZero(p + kOffReserved, kHeaderSize - kOffReserved)) {
        return std::unexpected(FormatError(Errc::ReservedNotZero, "header flags/reserved bytes are not zero"));
    }

    h.total_image_size = GetLe64(p + kOffTotalSize);
    const char* name = reinterpret_cast<const char*>(p + kOffName);
    h.name.assign(name, strnlen(name, kNameLength));

    h.segments.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint8_t* e = p + kHeaderSize + i * kSegmentEntrySize;
        if (!IsValidRole(e[kEntRole])) {
            return std::unexpected(FormatError(Errc::BadRole,
                "segment " + std::to_string(i) + " has unknown role " + std::to_string(e[kEntRole])));
        }
        if (!IsValidCompression(e[kEntCompression])) {
            return std::unexpected(FormatError(Errc::BadCompression,
                "segment " + std::to_string(i) + " has unknown compression " +
                std::to_string(e[kEntCompression])));
        }
        if (!AllZero(e + kEntReserved0, kEntOffset - kEntReserved0) ||
            !AllZero(e + kEntReserved1, kSegmentEntrySize - kEntReserved1)) {
            return std::unexpected(FormatError(Errc::ReservedNotZero,
                "segment " + std::to_string(i) + " reserved bytes are not zero"));
        }

        SegmentEntry s;
        s.role = static_cast<SegmentRole>(e[kEntRole]);
        s.compression = static_cast<CompressionKind>(e[kEntCompression]);
        s.offset = GetLe64(e + kEntOffset);
        s.stored_length = GetLe64(e + kEntStored);
        s.raw_length = GetLe64(e + kEntRaw);
        s.checksum = GetLe64(e + kEntChecksum);
        s.load_address = GetLe64(e + kEntLoad);
        s.entry_point = GetLe64(e + kEntEntry);
        h.segments.push_back(s);
    }
    return h;
}

std::expected<void, Error> ValidateStructure(const ImageHeader& h,
                                             std::uint64_t image_size,
                                             bool allow_trailing_data) {
    if (h.version_major != kVersionMajor) {
        return std::unexpected(FormatError(Errc::UnsupportedVersion, "unsupported format version"));
    }
    if (h.segments.size() > kMaxSegments) {
        return std::unexpected(FormatError(Errc::TooManySegments, "too many segments"));
    }
    if (h.name.size() > kNameLength) {
        return std::unexpected(FormatError(Errc::NameTooLong, "image name exceeds 64 bytes"));
    }

    std::uint64_t cursor = h.HeaderRegionSize();
    bool seen[8] = {};

    for (std::size_t i = 0; i < h.segments.size(); ++i) {
        const SegmentEntry& s = h.segments[i];
        const auto raw_role = static_cast<std::uint8_t>(s.role);
        if (!IsValidRole(raw_role)) {
            return std::unexpected(FormatError(Errc::BadRole, "segment " + std::to_string(i) + " has unknown role"));
        }
        if (!IsValidCompression(static_cast<std::uint8_t>(s.compression))) {
            return std::unexpected(FormatError(Errc::BadCompression,
                "segment " + std::to_string(i) + " has unknown compression"));
        }
        if (seen[raw_role] && !IsRepeatableRole(s.role)) {
            return std::unexpected(FormatError(Errc::DuplicateRole,
                std::string("role ") + ToString(s.role) + " appears more than once"));
        }
        seen[raw_role] = true;

        if (s.offset % kSegmentAlignment != 0) {
            return std::unexpected(FormatError(Errc::Misaligned, SegmentLabel(h, i) + " is not 16-byte aligned"));
        }
        if (s.offset < cursor) {
            return std::unexpected(FormatError(Errc::Overlap,
                SegmentLabel(h, i) + " overlaps the header or the previous segment"));
        }
        if (s.stored_length > UINT64_MAX - s.offset) {
            return std::unexpected(FormatError(Errc::Overlap, SegmentLabel(h, i) + " extends past the address space"));
        }

        if (s.compression == CompressionKind::None) {
            if (s.raw_length != s.stored_length) {
                return std::unexpected(FormatError(Errc::LengthMismatch,
                    SegmentLabel(h, i) + " is uncompressed but raw and stored lengths differ"));
            }
        } else if (s.stored_length == 0 || s.raw_length < s.stored_length) {
            return std::unexpected(FormatError(Errc::LengthMismatch,
                SegmentLabel(h, i) + " compressed lengths are inconsistent"));
        }
        if (s.compression != CompressionKind::None &&
            s.stored_length <= UINT64_MAX / kMaxInflateRatio &&
            s.raw_length > s.stored_length * kMaxInflateRatio) {
            Error e = FormatError(Errc::LengthMismatch,
                SegmentLabel(h, i) + " claims more raw bytes than its stored bytes can inflate to");
            e.expected = s.stored_length * kMaxInflateRatio;
            e.actual = s.raw_length;
            return std::unexpected(std::move(e));
        }

        if (!RoleCarriesLoadInfo(s.role) && (s.load_address != 0 || s.entry_point != 0)) {
            return std::unexpected(FormatError(Errc::LoadMetadataNotAllowed,
                SegmentLabel(h, i) + " carries load metadata"));
        }
        cursor = s.End();
    }

    if (h.total_image_size != cursor) {
        Error e = FormatError(Errc::SizeMismatch, "total_image_size does not match segment layout");
        e.expected = cursor;
        e.actual = h.total_image_size;
        return std::unexpected(std::move(e));
    }
    if (image_size < h.total_image_size) {
        Error e = FormatError(Errc::Truncated,
            "image is " + std::to_string(image_size) + " bytes, header declares " +
            std::to_string(h.total_image_size));
        e.expected = h.total_image_size;
        e.actual = image_size;
        return std::unexpected(std::move(e));
    }
    if (image_size > h.total_image_size && !allow_trailing_data) {
        Error e = FormatError(Errc::TrailingData,
            std::to_string(image_size - h.total_image_size) + " bytes follow the last segment");
        e.expected = h.total_image_size;
        e.actual = image_size;
        return std::unexpected(std::move(e));
    }
    return {};
}

std::expected<void, Error> CheckPadding(const ImageHeader& h, std::span<const std::uint8_t> image) {
    std::uint64_t cursor = h.HeaderRegionSize();
    for (std::size_t i = 0; i < h.segments.size(); ++i) {
        const SegmentEntry& s = h.segments[i];
        if (s.offset > image.size() || cursor > s.offset) {
            return std::unexpected(FormatError(Errc::Truncated, "padding before " + SegmentLabel(h, i) + " is out of range"));
        }
        if (!AllZero(image.data() + cursor, static_cast<std::size_t>(s.offset - cursor))) {
            return std::unexpected(FormatError(Errc::NonZeroPadding, "non-zero padding before " + SegmentLabel(h, i)));
        }
        cursor = s.End();
    }
    return {};
}

} // namespace nimage
