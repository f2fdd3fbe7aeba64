#pragma once

#include "io/io.hpp"
#include "io/mapped_file.hpp"
#include "nimage/error.hpp"
#include "nimage/format.hpp"
#include "nimage/types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace nimage {

enum class VerifyMode {
    Strict,  // first mismatch rejects the whole container
    Report,  // collect every mismatch; intact segments stay readable
};

struct ReaderOptions {
    bool allow_trailing_data = false;
};

struct VerifyReport {
    std::vector<Error> mismatches;
    std::size_t checked = 0;

    bool ok() const { return mismatches.empty(); }
};

// Parsed, structurally validated container, held in memory or mapped from a file.
//
// Open() performs every check that does not need payload checksums; segment
// checksums are computed by Verify() or lazily before a segment is handed out.
class ImageReader {
public:
    static std::expected<ImageReader, Error> Open(std::vector<std::uint8_t> bytes,
                                                  const ReaderOptions& opt = {});
    static std::expected<ImageReader, Error> Open(MappedFile map, const ReaderOptions& opt = {});
    // Maps regular files; "-" and other non-regular inputs are read into memory.
    static std::expected<ImageReader, Error> OpenFile(const std::string& path,
                                                      const ReaderOptions& opt = {});

    ImageReader(ImageReader&&) noexcept = default;
    ImageReader& operator=(ImageReader&&) noexcept = default;

    const ImageHeader& header() const { return header_; }
    std::span<const std::uint8_t> bytes() const { return bytes_; }
    std::size_t SegmentCount() const { return header_.segments.size(); }

    VerifyReport Verify(VerifyMode mode = VerifyMode::Strict);

    // Checks one segment's stored bytes; the outcome is remembered.
    std::expected<void, Error> VerifySegment(std::size_t index);

    // Set once strict verification has failed.
    bool rejected() const { return rejected_.has_value(); }

    std::optional<std::size_t> FindSegment(const SegmentKey& key) const { return header_.Find(key); }

    // Raw (decompressed) payload.
    std::expected<std::vector<std::uint8_t>, Error> GetSegment(const SegmentKey& key);
    std::expected<std::vector<std::uint8_t>, Error> GetSegmentAt(std::size_t index);

    // Streams over a verified segment. The reader must outlive the stream.
    std::expected<std::unique_ptr<IReader>, Error> OpenStoredStream(std::size_t index);
    std::expected<std::unique_ptr<IReader>, Error> OpenRawStream(std::size_t index);

    std::span<const std::uint8_t> StoredBytes(std::size_t index) const;

private:
    enum class SegmentState : std::uint8_t { Unchecked, Good, Corrupt };

    ImageReader() = default;

    std::expected<void, Error> Load(const ReaderOptions& opt);
    std::expected<void, Error> CheckUsable(std::size_t index);

    // bytes_ views either owned_ or mapped_; both keep their buffer across moves.
    std::vector<std::uint8_t> owned_;
    MappedFile mapped_;
    std::span<const std::uint8_t> bytes_;

    ImageHeader header_;
    std::vector<SegmentState> state_;
    std::vector<std::uint64_t> actual_;
    std::optional<Error> rejected_;
};

} // namespace nimage
