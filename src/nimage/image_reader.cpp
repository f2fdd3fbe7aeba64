#include "nimage/image_reader.hpp"

#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "io/span_reader.hpp"
#include "nimage/checksum.hpp"
#include "nimage/compressor.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <stdexcept>

namespace nimage {

std::expected<void, Error> ImageReader::Load(const ReaderOptions& opt) {
    auto header = ParseHeader(bytes_);
    if (!header) return std::unexpected(header.error());

    if (auto v = ValidateStructure(*header, bytes_.size(), opt.allow_trailing_data); !v) {
        return std::unexpected(v.error());
    }
    if (auto v = CheckPadding(*header, bytes_); !v) {
        return std::unexpected(v.error());
    }

    header_ = std::move(*header);
    state_.assign(header_.segments.size(), SegmentState::Unchecked);
    actual_.assign(header_.segments.size(), 0);

    LogDebug("opened image '%s': %zu segment(s), %llu bytes",
             header_.name.c_str(),
             header_.segments.size(),
             (unsigned long long)header_.total_image_size);
    return {};
}

std::expected<ImageReader, Error> ImageReader::Open(std::vector<std::uint8_t> bytes,
                                                    const ReaderOptions& opt) {
    ImageReader r;
    r.owned_ = std::move(bytes);
    r.bytes_ = r.owned_;
    if (auto v = r.Load(opt); !v) return std::unexpected(v.error());
    return r;
}

std::expected<ImageReader, Error> ImageReader::Open(MappedFile map, const ReaderOptions& opt) {
    ImageReader r;
    r.mapped_ = std::move(map);
    r.bytes_ = r.mapped_.bytes();
    if (auto v = r.Load(opt); !v) return std::unexpected(v.error());
    return r;
}

std::expected<ImageReader, Error> ImageReader::OpenFile(const std::string& path,
                                                        const ReaderOptions& opt) {
    if (path != "-") {
        MappedFile map;
        auto m = MappedFile::Open(path, map);
        if (m.ok) return Open(std::move(map), opt);
        if (m.err != ENODEV) {
            return std::unexpected(UsageError(Errc::InputUnreadable, m.msg));
        }
    }

    std::vector<std::uint8_t> bytes;
    if (auto r = ReadFileBytes(path, bytes); !r.ok) {
        return std::unexpected(UsageError(Errc::InputUnreadable, r.msg));
    }
    return Open(std::move(bytes), opt);
}

std::span<const std::uint8_t> ImageReader::StoredBytes(std::size_t index) const {
    const SegmentEntry& s = header_.segments.at(index);
    return bytes_.subspan(static_cast<size_t>(s.offset),
                                                         static_cast<size_t>(s.stored_length));
}

std::expected<void, Error> ImageReader::VerifySegment(std::size_t index) {
    if (index >= header_.segments.size()) {
        return std::unexpected(UsageError(Errc::SegmentNotFound,
            "segment index " + std::to_string(index) + " out of range"));
    }
    const SegmentEntry& s = header_.segments[index];

    if (state_[index] == SegmentState::Unchecked) {
        actual_[index] = Xxh64(StoredBytes(index));
        state_[index] = actual_[index] == s.checksum ? SegmentState::Good : SegmentState::Corrupt;
    }
    if (state_[index] == SegmentState::Corrupt) {
        return std::unexpected(VerifyError(s.role, index, s.checksum, actual_[index]));
    }
    return {};
}

VerifyReport ImageReader::Verify(VerifyMode mode) {
    VerifyReport report;
    for (std::size_t i = 0; i < header_.segments.size(); ++i) {
        ++report.checked;
        auto v = VerifySegment(i);
        if (v) continue;

        LogError("%s: %s", header_.KeyAt(i).Label().c_str(), v.error().msg.c_str());
        report.mismatches.push_back(v.error());
        if (mode == VerifyMode::Strict) {
            rejected_ = v.error();
            break;
        }
    }
    return report;
}

std::expected<void, Error> ImageReader::CheckUsable(std::size_t index) {
    if (rejected_) {
        return std::unexpected(UsageError(Errc::ContainerRejected,
            "container rejected by strict verification: " + rejected_->msg));
    }
    return VerifySegment(index);
}

std::expected<std::vector<std::uint8_t>, Error> ImageReader::GetSegment(const SegmentKey& key) {
    const auto index = FindSegment(key);
    if (!index) {
        return std::unexpected(UsageError(Errc::SegmentNotFound, "no segment " + key.Label() + " in image"));
    }
    return GetSegmentAt(*index);
}

std::expected<std::vector<std::uint8_t>, Error> ImageReader::GetSegmentAt(std::size_t index) {
    if (auto v = CheckUsable(index); !v) return std::unexpected(v.error());

    const SegmentEntry& s = header_.segments[index];
    const auto stored = StoredBytes(index);
    if (s.compression == CompressionKind::None) {
        return std::vector<std::uint8_t>(stored.begin(), stored.end());
    }

    auto raw = DecompressBlocks(stored, s.raw_length);
    if (!raw) {
        Error e = DecompressError(s.role,
                                  index,
                                  raw.error().length_mismatch ? Errc::RawLengthMismatch : Errc::CorruptStream,
                                  raw.error().msg);
        e.expected = s.raw_length;
        LogError("%s", e.msg.c_str());
        return std::unexpected(std::move(e));
    }
    return std::move(*raw);
}

std::expected<std::unique_ptr<IReader>, Error> ImageReader::OpenStoredStream(std::size_t index) {
    if (auto v = CheckUsable(index); !v) return std::unexpected(v.error());
    return std::make_unique<SpanReader>(StoredBytes(index));
}

std::expected<std::unique_ptr<IReader>, Error> ImageReader::OpenRawStream(std::size_t index) {
    if (auto v = CheckUsable(index); !v) return std::unexpected(v.error());

    const SegmentEntry& s = header_.segments[index];
    auto stored = std::make_unique<SpanReader>(StoredBytes(index));
    if (s.compression == CompressionKind::None) {
        return std::unique_ptr<IReader>(std::move(stored));
    }
    try {
        return std::unique_ptr<IReader>(std::make_unique<GzipReader>(std::move(stored), s.raw_length));
    } catch (const std::runtime_error& e) {
        return std::unexpected(DecompressError(s.role, index, Errc::CorruptStream, e.what()));
    }
}

} // namespace nimage
