#include "nimage/error.hpp"

#include <cinttypes>
#include <cstdio>

namespace nimage {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Format:     return "format";
        case ErrorKind::Build:      return "build";
        case ErrorKind::Verify:     return "verify";
        case ErrorKind::Decompress: return "decompress";
        case ErrorKind::Write:      return "write";
        case ErrorKind::Usage:      return "usage";
    }
    return "unknown";
}

const char* ToString(Errc code) {
    switch (code) {
        case Errc::None:                   return "none";
        case Errc::Truncated:              return "truncated";
        case Errc::BadMagic:               return "bad magic";
        case Errc::UnsupportedVersion:     return "unsupported version";
        case Errc::TooManySegments:        return "too many segments";
        case Errc::BadHeaderChecksum:      return "bad header checksum";
        case Errc::ReservedNotZero:        return "reserved field not zero";
        case Errc::BadRole:                return "bad role";
        case Errc::BadCompression:         return "bad compression kind";
        case Errc::DuplicateRole:          return "duplicate role";
        case Errc::Misaligned:             return "misaligned segment";
        case Errc::Overlap:                return "overlapping segments";
        case Errc::LengthMismatch:         return "length mismatch";
        case Errc::LoadMetadataNotAllowed: return "load metadata not allowed";
        case Errc::NonZeroPadding:         return "non-zero padding";
        case Errc::SizeMismatch:           return "size mismatch";
        case Errc::TrailingData:           return "trailing data";
        case Errc::NameTooLong:            return "name too long";
        case Errc::SourceTooLarge:         return "source too large";
        case Errc::SourceReadFailure:      return "source read failure";
        case Errc::CompressionFailure:     return "compression failure";
        case Errc::OutputFailure:          return "output failure";
        case Errc::ChecksumMismatch:       return "checksum mismatch";
        case Errc::CorruptStream:          return "corrupt compressed stream";
        case Errc::RawLengthMismatch:      return "raw length mismatch";
        case Errc::DeviceOpenFailed:       return "device open failed";
        case Errc::DeviceWriteFailed:      return "device write failed";
        case Errc::DeviceSyncFailed:       return "device sync failed";
        case Errc::ReadBackFailed:         return "read-back failed";
        case Errc::ReadBackMismatch:       return "read-back mismatch";
        case Errc::InputUnreadable:        return "input unreadable";
        case Errc::SegmentNotFound:        return "segment not found";
        case Errc::ContainerRejected:      return "container rejected";
        case Errc::InvalidPlan:            return "invalid write plan";
    }
    return "unknown";
}

std::string Error::Describe() const {
    return std::string(ToString(kind)) + " error: " + msg;
}

Error FormatError(Errc code, std::string msg) {
    Error e;
    e.kind = ErrorKind::Format;
    e.code = code;
    e.msg = std::move(msg);
    return e;
}

Error BuildError(Errc code, std::string msg, std::optional<SegmentRole> role) {
    Error e;
    e.kind = ErrorKind::Build;
    e.code = code;
    e.msg = std::move(msg);
    e.role = role;
    return e;
}

Error VerifyError(SegmentRole role, std::size_t index, std::uint64_t expected, std::uint64_t actual) {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "segment %zu (%s) checksum mismatch: expected 0x%016" PRIx64
                  " actual 0x%016" PRIx64,
                  index, ToString(role), expected, actual);
    Error e;
    e.kind = ErrorKind::Verify;
    e.code = Errc::ChecksumMismatch;
    e.msg = buf;
    e.role = role;
    e.segment_index = index;
    e.expected = expected;
    e.actual = actual;
    return e;
}

Error DecompressError(SegmentRole role, std::size_t index, Errc code, std::string msg) {
    Error e;
    e.kind = ErrorKind::Decompress;
    e.code = code;
    e.msg = "segment " + std::to_string(index) + " (" + ToString(role) + "): " + msg;
    e.role = role;
    e.segment_index = index;
    return e;
}

Error WriteError(SegmentRole role,
                 std::size_t index,
                 std::uint32_t attempts,
                 Errc code,
                 std::string msg) {
    Error e;
    e.kind = ErrorKind::Write;
    e.code = code;
    e.msg = "segment " + std::to_string(index) + " (" + ToString(role) + ") failed after " +
            std::to_string(attempts) + " attempt(s): " + msg;
    e.role = role;
    e.segment_index = index;
    e.attempts = attempts;
    return e;
}

Error UsageError(Errc code, std::string msg) {
    Error e;
    e.kind = ErrorKind::Usage;
    e.code = code;
    e.msg = std::move(msg);
    return e;
}

} // namespace nimage
