#pragma once

#include "nimage/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace nimage {

enum class ErrorKind {
    Format,      // structural damage; never retried
    Build,       // bad inputs or options; nothing was written
    Verify,      // stored-bytes checksum mismatch
    Decompress,  // payload passed its checksum but does not inflate cleanly
    Write,       // device I/O after retries
    Usage,       // caller asked for something the image does not have
};

enum class Errc {
    None = 0,

    // Format
    Truncated,
    BadMagic,
    UnsupportedVersion,
    TooManySegments,
    BadHeaderChecksum,
    ReservedNotZero,
    BadRole,
    BadCompression,
    DuplicateRole,
    Misaligned,
    Overlap,
    LengthMismatch,
    LoadMetadataNotAllowed,
    NonZeroPadding,
    SizeMismatch,
    TrailingData,

    // Build
    NameTooLong,
    SourceTooLarge,
    SourceReadFailure,
    CompressionFailure,
    OutputFailure,

    // Verify
    ChecksumMismatch,

    // Decompress
    CorruptStream,
    RawLengthMismatch,

    // Write
    DeviceOpenFailed,
    DeviceWriteFailed,
    DeviceSyncFailed,
    ReadBackFailed,
    ReadBackMismatch,

    // Usage
    InputUnreadable,
    SegmentNotFound,
    ContainerRejected,
    InvalidPlan,
};

// Error value shared by the builder, reader and writer. Fields that do not
// apply to a given kind stay at their defaults.
struct Error {
    ErrorKind kind = ErrorKind::Format;
    Errc code = Errc::None;
    std::string msg;

    std::optional<SegmentRole> role;
    std::optional<std::size_t> segment_index;
    std::uint64_t expected = 0;
    std::uint64_t actual = 0;
    std::uint32_t attempts = 0;

    const std::string& message() const { return msg; }
    // "<kind> error: <msg>"
    std::string Describe() const;
};

const char* ToString(ErrorKind kind);
const char* ToString(Errc code);

Error FormatError(Errc code, std::string msg);
Error BuildError(Errc code, std::string msg, std::optional<SegmentRole> role = std::nullopt);
Error VerifyError(SegmentRole role, std::size_t index, std::uint64_t expected, std::uint64_t actual);
Error DecompressError(SegmentRole role, std::size_t index, Errc code, std::string msg);
Error WriteError(SegmentRole role,
                 std::size_t index,
                 std::uint32_t attempts,
                 Errc code,
                 std::string msg);
Error UsageError(Errc code, std::string msg);

} // namespace nimage
