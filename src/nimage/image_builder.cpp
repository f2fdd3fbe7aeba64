#include "nimage/image_builder.hpp"

#include "io/atomic_file_writer.hpp"
#include "io/file_reader.hpp"
#include "nimage/checksum.hpp"
#include "nimage/compressor.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>

namespace nimage {

ImageBuilder::ImageBuilder() : ImageBuilder(Options{}) {}

ImageBuilder::ImageBuilder(Options opt) : opt_(std::move(opt)) {}

std::expected<void, Error> ImageBuilder::AddSegment(SegmentRole role,
                                                    std::unique_ptr<IReader> source,
                                                    const SegmentOptions& seg_opt) {
    if (!IsValidRole(static_cast<std::uint8_t>(role))) {
        return std::unexpected(BuildError(Errc::BadRole, "invalid segment role"));
    }
    if (!source) {
        return std::unexpected(BuildError(Errc::SourceReadFailure, "segment has no byte source", role));
    }
    if (inputs_.size() >= kMaxSegments) {
        return std::unexpected(BuildError(Errc::TooManySegments,
            "an image holds at most " + std::to_string(kMaxSegments) + " segments", role));
    }

    std::uint32_t ordinal = 0;
    for (const auto& in : inputs_) {
        if (in.role == role) ++ordinal;
    }
    if (ordinal > 0 && !IsRepeatableRole(role)) {
        return std::unexpected(BuildError(Errc::DuplicateRole,
            std::string("role ") + ToString(role) + " already present", role));
    }
    if (!RoleCarriesLoadInfo(role) && (seg_opt.load_address != 0 || seg_opt.entry_point != 0)) {
        return std::unexpected(BuildError(Errc::LoadMetadataNotAllowed,
            std::string("role ") + ToString(role) + " cannot carry load_address/entry_point", role));
    }

    inputs_.push_back(Input{role, std::move(source), seg_opt, SegmentKey{role, ordinal}.Label()});
    return {};
}

std::expected<BuiltImage, Error> ImageBuilder::Build() {
    if (consumed_) {
        return std::unexpected(BuildError(Errc::SourceReadFailure, "segment sources were already consumed"));
    }
    consumed_ = true;

    if (opt_.name.size() > kNameLength) {
        return std::unexpected(BuildError(Errc::NameTooLong,
            "image name is " + std::to_string(opt_.name.size()) + " bytes, limit is " +
            std::to_string(kNameLength)));
    }

    BlockCompressor::Options copt;
    copt.level = opt_.level;
    copt.block_size = opt_.block_size;
    copt.workers = opt_.workers;
    if (auto v = BlockCompressor::ValidateOptions(copt); !v) {
        return std::unexpected(BuildError(Errc::CompressionFailure, v.error()));
    }
    const BlockCompressor compressor(copt);

    std::uint64_t overall_total = 0;
    for (const auto& in : inputs_) {
        const auto size = in.source->TotalSize();
        if (!size) {
            overall_total = 0;
            break;
        }
        overall_total += *size;
    }
    std::uint64_t overall_done = 0;

    BuiltImage out;
    out.header.name = opt_.name;
    std::vector<std::vector<std::uint8_t>> payloads;
    payloads.reserve(inputs_.size());

    for (auto& in : inputs_) {
        std::vector<std::uint8_t> raw;
        const Result rd = ReadAllBytes(*in.source, opt_.max_segment_size, raw);
        in.source.reset();
        if (!rd.ok) {
            if (rd.err == EFBIG) {
                return std::unexpected(BuildError(Errc::SourceTooLarge,
                    in.label + ": source exceeds " + std::to_string(opt_.max_segment_size) + " bytes", in.role));
            }
            return std::unexpected(BuildError(Errc::SourceReadFailure, in.label + ": " + rd.msg, in.role));
        }

        SegmentEntry entry;
        entry.role = in.role;
        entry.raw_length = raw.size();
        entry.load_address = in.opt.load_address;
        entry.entry_point = in.opt.entry_point;

        std::vector<std::uint8_t> stored;
        if (in.opt.compress && !raw.empty()) {
            auto packed = compressor.Compress(raw);
            if (!packed) {
                return std::unexpected(BuildError(Errc::CompressionFailure, in.label + ": " + packed.error(), in.role));
            }
            if (raw.size() >= opt_.compression_margin &&
                packed->size() <= raw.size() - opt_.compression_margin) {
                entry.compression = CompressionKind::Zlib;
                stored = std::move(*packed);
            } else {
                LogWarn("%s: compressed size %zu does not beat raw size %zu, storing uncompressed",
                        in.label.c_str(), packed->size(), raw.size());
                stored = std::move(raw);
            }
        } else {
            stored = std::move(raw);
        }

        entry.stored_length = stored.size();
        entry.checksum = Xxh64(stored);
        LogInfo("%s: raw=%llu stored=%llu (%s)",
                in.label.c_str(),
                (unsigned long long)entry.raw_length,
                (unsigned long long)entry.stored_length,
                ToString(entry.compression));

        overall_done += entry.raw_length;
        if (progress_sink_) {
            ProgressEvent ev;
            ev.stage = "compress";
            ev.segment = in.label;
            ev.seg_done = entry.raw_length;
            ev.seg_total = entry.raw_length;
            ev.overall_done = overall_done;
            ev.overall_total = overall_total;
            progress_sink_->OnProgress(ev);
        }

        out.header.segments.push_back(entry);
        payloads.push_back(std::move(stored));
    }

    std::uint64_t cursor = out.header.HeaderRegionSize();
    for (auto& seg : out.header.segments) {
        seg.offset = AlignUp(cursor, kSegmentAlignment);
        cursor = seg.End();
    }
    out.header.total_image_size = cursor;

    const std::vector<std::uint8_t> region = SerializeHeader(out.header);
    out.bytes.assign(static_cast<size_t>(out.header.total_image_size), 0);
    std::memcpy(out.bytes.data(), region.data(), region.size());
    for (std::size_t i = 0; i < payloads.size(); ++i) {
        if (!payloads[i].empty()) {
            std::memcpy(out.bytes.data() + out.header.segments[i].offset,
                        payloads[i].data(),
                        payloads[i].size());
        }
    }

    if (auto v = ValidateStructure(out.header, out.bytes.size()); !v) {
        return std::unexpected(BuildError(Errc::OutputFailure, "produced an invalid layout: " + v.error().msg));
    }

    LogInfo("built image '%s': %zu segment(s), %llu bytes",
            out.header.name.c_str(),
            out.header.segments.size(),
            (unsigned long long)out.header.total_image_size);
    return out;
}

std::expected<BuiltImage, Error> ImageBuilder::BuildToFile(const std::string& path) {
    auto built = Build();
    if (!built) return built;

    AtomicFileWriter writer;
    auto r = AtomicFileWriter::Create(path, writer);
    if (!r.ok) return std::unexpected(BuildError(Errc::OutputFailure, r.msg));

    r = writer.WriteAll(built->bytes);
    if (!r.ok) return std::unexpected(BuildError(Errc::OutputFailure, r.msg));

    r = writer.Commit();
    if (!r.ok) return std::unexpected(BuildError(Errc::OutputFailure, r.msg));

    return built;
}

} // namespace nimage
