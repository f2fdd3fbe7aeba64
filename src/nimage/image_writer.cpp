#include "nimage/image_writer.hpp"

#include "nimage/checksum.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <thread>

namespace nimage {

struct ImageWriter::Attempt {
    bool ok = false;
    bool retryable = true;
    Error error;
    std::uint64_t bytes = 0;
};

ImageWriter::ImageWriter() : ImageWriter(Options{}) {}

ImageWriter::ImageWriter(const Options& opt) : opt_(opt) {}

void ImageWriter::Emit(std::string_view stage,
                       std::string_view segment,
                       std::uint64_t seg_done,
                       std::uint64_t seg_total,
                       std::uint64_t overall_done,
                       std::uint64_t overall_total) {
    if (!progress_sink_) return;
    ProgressEvent ev;
    ev.stage = stage;
    ev.segment = segment;
    ev.seg_done = seg_done;
    ev.seg_total = seg_total;
    ev.overall_done = overall_done;
    ev.overall_total = overall_total;
    progress_sink_->OnProgress(ev);
}

ImageWriter::Attempt ImageWriter::WriteOnce(ImageReader& reader,
                                            std::size_t index,
                                            const WriteTarget& target,
                                            std::uint64_t overall_base,
                                            std::uint64_t overall_total) {
    const SegmentEntry& seg = reader.header().segments[index];
    const std::string label = target.key.Label();
    IBlockDevice& dev = *target.device;
    Attempt a;

    auto fail = [&](Errc code, std::string msg) {
        a.ok = false;
        a.error = WriteError(seg.role, index, 0, code, dev.Name() + ": " + msg);
        return a;
    };

    auto stream = reader.OpenRawStream(index);
    if (!stream) {
        a.retryable = false;
        a.error = stream.error();
        return a;
    }

    Xxh64Hasher hasher;
    std::vector<std::uint8_t> buf(opt_.chunk_size);
    std::uint64_t done = 0;

    while (true) {
        const ssize_t n = (*stream)->Read(buf);
        if (n == 0) break;
        if (n < 0) {
            a.retryable = false;
            a.error = DecompressError(seg.role, index, Errc::CorruptStream, "payload does not inflate");
            return a;
        }
        if (done + static_cast<std::uint64_t>(n) > seg.raw_length) {
            a.retryable = false;
            a.error = DecompressError(seg.role, index, Errc::RawLengthMismatch,
                                      "payload inflates past " + std::to_string(seg.raw_length) + " bytes");
            return a;
        }

        const auto chunk = std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n));
        if (auto r = dev.WriteAt(target.offset + done, chunk); !r.ok) {
            return fail(Errc::DeviceWriteFailed, r.msg);
        }
        hasher.Update(chunk);
        done += static_cast<std::uint64_t>(n);
        Emit("write", label, done, seg.raw_length, overall_base + done, overall_total);
    }

    if (done != seg.raw_length) {
        a.retryable = false;
        a.error = DecompressError(seg.role, index, Errc::RawLengthMismatch,
                                  "payload inflates to " + std::to_string(done) + " of " +
                                      std::to_string(seg.raw_length) + " bytes");
        return a;
    }

    if (auto r = dev.Sync(); !r.ok) {
        return fail(Errc::DeviceSyncFailed, r.msg);
    }

    if (opt_.verify_readback) {
        Xxh64Hasher back;
        std::uint64_t pos = 0;
        while (pos < done) {
            const auto len = static_cast<size_t>(std::min<std::uint64_t>(buf.size(), done - pos));
            const auto out = std::span<std::uint8_t>(buf.data(), len);
            if (auto r = dev.ReadAt(target.offset + pos, out); !r.ok) {
                return fail(Errc::ReadBackFailed, r.msg);
            }
            back.Update(out);
            pos += len;
            Emit("readback", label, pos, done, overall_base + done, overall_total);
        }
        if (back.Digest() != hasher.Digest()) {
            a = fail(Errc::ReadBackMismatch, "read-back checksum differs from written data");
            a.error.expected = hasher.Digest();
            a.error.actual = back.Digest();
            return a;
        }
    }

    a.ok = true;
    a.bytes = done;
    return a;
}

std::expected<SegmentWriteResult, Error> ImageWriter::WriteSegment(ImageReader& reader,
                                                                   std::size_t index,
                                                                   const WriteTarget& target,
                                                                   std::uint64_t overall_base,
                                                                   std::uint64_t overall_total) {
    const SegmentEntry& seg = reader.header().segments[index];
    const std::string label = target.key.Label();
    auto backoff = opt_.retry_backoff;
    Attempt last;

    for (std::uint32_t attempt = 1; attempt <= opt_.max_attempts; ++attempt) {
        last = WriteOnce(reader, index, target, overall_base, overall_total);
        if (last.ok) {
            LogInfo("%s: wrote %llu bytes to %s at offset %llu (attempt %u)",
                    label.c_str(),
                    (unsigned long long)last.bytes,
                    target.device->Name().c_str(),
                    (unsigned long long)target.offset,
                    attempt);
            return SegmentWriteResult{target.key, attempt, last.bytes};
        }
        if (!last.retryable) {
            return std::unexpected(last.error);
        }

        LogWarn("%s: attempt %u/%u failed: %s",
                label.c_str(), attempt, opt_.max_attempts, last.error.msg.c_str());
        if (attempt < opt_.max_attempts && backoff.count() > 0) {
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    Error e = WriteError(seg.role, index, opt_.max_attempts, last.error.code, last.error.msg);
    e.expected = last.error.expected;
    e.actual = last.error.actual;
    return std::unexpected(std::move(e));
}

std::expected<WriteReport, Error> ImageWriter::Write(ImageReader& reader,
                                                     const std::vector<WriteTarget>& plan) {
    if (opt_.max_attempts == 0) {
        return std::unexpected(UsageError(Errc::InvalidPlan, "max_attempts must be at least 1"));
    }
    if (opt_.chunk_size == 0) {
        return std::unexpected(UsageError(Errc::InvalidPlan, "chunk_size must be non-zero"));
    }

    const VerifyReport verify = reader.Verify(VerifyMode::Strict);
    if (!verify.ok()) {
        LogError("refusing to write: container failed verification");
        return std::unexpected(verify.mismatches.front());
    }

    std::vector<std::size_t> indices;
    indices.reserve(plan.size());
    std::uint64_t overall_total = 0;
    for (const auto& target : plan) {
        const auto index = reader.FindSegment(target.key);
        if (!index) {
            return std::unexpected(UsageError(Errc::SegmentNotFound,
                "write plan names " + target.key.Label() + ", which the image does not contain"));
        }
        if (!target.device) {
            return std::unexpected(UsageError(Errc::InvalidPlan,
                "write plan entry " + target.key.Label() + " has no device"));
        }
        indices.push_back(*index);
        overall_total += reader.header().segments[*index].raw_length;
    }

    WriteReport report;
    std::uint64_t overall_base = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        auto res = WriteSegment(reader, indices[i], plan[i], overall_base, overall_total);
        overall_base += reader.header().segments[indices[i]].raw_length;
        if (res) {
            report.segments.push_back(*res);
            continue;
        }

        LogError("%s: %s; device %s may be in an inconsistent state",
                 plan[i].key.Label().c_str(),
                 res.error().msg.c_str(),
                 plan[i].device->Name().c_str());
        if (opt_.stop_on_failure) {
            return std::unexpected(res.error());
        }
        report.errors.push_back(res.error());
    }
    return report;
}

} // namespace nimage
