#include "io/partition_device.hpp"
#include "nimage/checksum.hpp"
#include "nimage/image_builder.hpp"
#include "nimage/image_reader.hpp"
#include "nimage/image_writer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace nimage {

namespace {

std::unique_ptr<IReader> Mem(std::vector<std::uint8_t> data) {
    return std::make_unique<testutil::MemoryReader>(std::move(data));
}

class RecordingProgress final : public IProgress {
  public:
    void OnProgress(const ProgressEvent& e) override {
        events.push_back({std::string(e.stage), std::string(e.segment), e.seg_done, e.seg_total,
                          e.overall_done, e.overall_total});
    }

    struct Event {
        std::string stage;
        std::string segment;
        std::uint64_t seg_done, seg_total, overall_done, overall_total;
    };
    std::vector<Event> events;
};

class ImageWriterTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ImageBuilder::Options opt;
        opt.block_size = 4096;
        opt.workers = 2;
        ImageBuilder b(opt);
        SegmentOptions z;
        z.compress = true;
        ASSERT_TRUE(b.AddSegment(SegmentRole::Kernel, Mem(kernel), z));
        ASSERT_TRUE(b.AddSegment(SegmentRole::Rootfs, Mem(rootfs)));
        auto built = b.Build();
        ASSERT_TRUE(built.has_value());
        image = std::move(built->bytes);
    }

    ImageReader Open(std::vector<std::uint8_t> bytes) {
        auto r = ImageReader::Open(std::move(bytes));
        EXPECT_TRUE(r.has_value());
        return std::move(*r);
    }

    static ImageWriter::Options Fast() {
        ImageWriter::Options opt;
        opt.retry_backoff = std::chrono::milliseconds(0);
        opt.chunk_size = 1000;
        return opt;
    }

    std::vector<std::uint8_t> kernel = testutil::TextBytes(20000);
    std::vector<std::uint8_t> rootfs = testutil::RandomBytes(9000, 21);
    std::vector<std::uint8_t> image;
};

bool RangeEquals(const std::vector<std::uint8_t>& dev, std::uint64_t offset, const std::vector<std::uint8_t>& want) {
    if (dev.size() < offset + want.size()) return false;
    return std::memcmp(dev.data() + offset, want.data(), want.size()) == 0;
}

} // namespace

TEST_F(ImageWriterTest, WritesRawBytesAtTargetOffsets) {
    auto reader = Open(image);
    testutil::MemoryDevice boot("boot");
    testutil::MemoryDevice root("root");

    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {
        WriteTarget{{SegmentRole::Kernel, 0}, &boot, 512},
        WriteTarget{{SegmentRole::Rootfs, 0}, &root, 0},
    });
    ASSERT_TRUE(report.has_value()) << report.error().Describe();
    EXPECT_TRUE(report->ok());
    ASSERT_EQ(report->segments.size(), 2u);
    EXPECT_EQ(report->segments[0].bytes_written, kernel.size());
    EXPECT_EQ(report->segments[0].attempts, 1u);
    EXPECT_EQ(report->segments[1].key, (SegmentKey{SegmentRole::Rootfs, 0}));

    EXPECT_TRUE(RangeEquals(boot.data, 512, kernel));
    EXPECT_TRUE(RangeEquals(root.data, 0, rootfs));
    EXPECT_GE(boot.sync_calls, 1);
    EXPECT_GE(boot.read_calls, 1);
}

TEST_F(ImageWriterTest, FollowsPlanOrder) {
    auto reader = Open(image);
    std::vector<testutil::WriteCall> log;
    testutil::MemoryDevice dev_a("A", &log);
    testutil::MemoryDevice dev_b("B", &log);

    // Rootfs (B) first, kernel (A) last.
    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {
        WriteTarget{{SegmentRole::Rootfs, 0}, &dev_b, 0},
        WriteTarget{{SegmentRole::Kernel, 0}, &dev_a, 0},
    });
    ASSERT_TRUE(report.has_value());

    std::size_t last_b = 0;
    std::size_t first_a = log.size();
    for (std::size_t i = 0; i < log.size(); ++i) {
        if (log[i].device == "B") last_b = i;
        if (log[i].device == "A" && first_a == log.size()) first_a = i;
    }
    ASSERT_LT(first_a, log.size());
    EXPECT_LT(last_b, first_a);
}

TEST_F(ImageWriterTest, RetriesTransientWriteFailures) {
    auto reader = Open(image);
    testutil::MemoryDevice dev("flaky");
    dev.fail_writes = 2;

    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {WriteTarget{{SegmentRole::Kernel, 0}, &dev, 0}});
    ASSERT_TRUE(report.has_value()) << report.error().Describe();
    EXPECT_TRUE(report->errors.empty());
    ASSERT_EQ(report->segments.size(), 1u);
    EXPECT_EQ(report->segments[0].attempts, 3u);
    EXPECT_TRUE(RangeEquals(dev.data, 0, kernel));
}

TEST_F(ImageWriterTest, PersistentFailureStopsTheSequence) {
    auto reader = Open(image);
    testutil::MemoryDevice bad("bad");
    bad.always_fail_writes = true;
    testutil::MemoryDevice good("good");

    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {
        WriteTarget{{SegmentRole::Kernel, 0}, &bad, 0},
        WriteTarget{{SegmentRole::Rootfs, 0}, &good, 0},
    });
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Write);
    EXPECT_EQ(report.error().code, Errc::DeviceWriteFailed);
    EXPECT_EQ(report.error().attempts, 3u);
    EXPECT_EQ(report.error().role, std::optional<SegmentRole>(SegmentRole::Kernel));
    EXPECT_EQ(bad.write_calls, 3);
    EXPECT_EQ(good.write_calls, 0);
}

TEST_F(ImageWriterTest, ContinuesWhenAskedAndReportsFailures) {
    auto reader = Open(image);
    testutil::MemoryDevice bad("bad");
    bad.always_fail_writes = true;
    testutil::MemoryDevice good("good");

    ImageWriter::Options opt = Fast();
    opt.stop_on_failure = false;
    opt.max_attempts = 2;
    ImageWriter writer(opt);
    auto report = writer.Write(reader, {
        WriteTarget{{SegmentRole::Kernel, 0}, &bad, 0},
        WriteTarget{{SegmentRole::Rootfs, 0}, &good, 0},
    });
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->ok());
    ASSERT_EQ(report->errors.size(), 1u);
    EXPECT_EQ(report->errors[0].attempts, 2u);
    ASSERT_EQ(report->segments.size(), 1u);
    EXPECT_EQ(report->segments[0].key.role, SegmentRole::Rootfs);
    EXPECT_TRUE(RangeEquals(good.data, 0, rootfs));
}

TEST_F(ImageWriterTest, ReadBackMismatchIsRetried) {
    auto reader = Open(image);
    testutil::MemoryDevice dev("bitrot");
    dev.corrupt_reads = 1;

    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {WriteTarget{{SegmentRole::Rootfs, 0}, &dev, 0}});
    ASSERT_TRUE(report.has_value()) << report.error().Describe();
    EXPECT_EQ(report->segments[0].attempts, 2u);
}

TEST_F(ImageWriterTest, PersistentReadBackMismatchFails) {
    auto reader = Open(image);
    testutil::MemoryDevice dev("bitrot");
    dev.corrupt_reads = 100;

    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {WriteTarget{{SegmentRole::Rootfs, 0}, &dev, 0}});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, Errc::ReadBackMismatch);
    EXPECT_EQ(report.error().attempts, 3u);
}

TEST_F(ImageWriterTest, ReadBackCanBeDisabled) {
    auto reader = Open(image);
    testutil::MemoryDevice dev("dev");
    dev.corrupt_reads = 100;

    ImageWriter::Options opt = Fast();
    opt.verify_readback = false;
    ImageWriter writer(opt);
    auto report = writer.Write(reader, {WriteTarget{{SegmentRole::Rootfs, 0}, &dev, 0}});
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(dev.read_calls, 0);
}

TEST_F(ImageWriterTest, CorruptContainerIsNeverWritten) {
    auto bytes = image;
    bytes[bytes.size() - 1] ^= 0x01;  // last rootfs byte
    auto reader = Open(std::move(bytes));
    testutil::MemoryDevice dev("dev");

    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {WriteTarget{{SegmentRole::Kernel, 0}, &dev, 0}});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Verify);
    EXPECT_EQ(dev.write_calls, 0);
}

TEST_F(ImageWriterTest, UnknownSegmentWritesNothing) {
    auto reader = Open(image);
    testutil::MemoryDevice dev("dev");

    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {
        WriteTarget{{SegmentRole::Kernel, 0}, &dev, 0},
        WriteTarget{{SegmentRole::Dtb, 0}, &dev, 65536},
    });
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Usage);
    EXPECT_EQ(report.error().code, Errc::SegmentNotFound);
    EXPECT_EQ(dev.write_calls, 0);
}

TEST_F(ImageWriterTest, InvalidOptionsRejected) {
    auto reader = Open(image);
    testutil::MemoryDevice dev("dev");

    ImageWriter::Options opt = Fast();
    opt.max_attempts = 0;
    auto report = ImageWriter(opt).Write(reader, {WriteTarget{{SegmentRole::Kernel, 0}, &dev, 0}});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, Errc::InvalidPlan);

    report = ImageWriter(Fast()).Write(reader, {WriteTarget{{SegmentRole::Kernel, 0}, nullptr, 0}});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, Errc::InvalidPlan);
}

TEST_F(ImageWriterTest, UndecodablePayloadIsNotRetried) {
    const std::vector<std::uint8_t> payload(64, 0xAB);
    ImageHeader h;
    SegmentEntry e;
    e.role = SegmentRole::Kernel;
    e.compression = CompressionKind::Zlib;
    e.offset = HeaderRegionSize(1);
    e.stored_length = payload.size();
    e.raw_length = 1024;
    e.checksum = Xxh64(payload);
    h.segments.push_back(e);
    h.total_image_size = e.End();
    const auto region = SerializeHeader(h);
    std::vector<std::uint8_t> bytes(static_cast<size_t>(h.total_image_size), 0);
    std::memcpy(bytes.data(), region.data(), region.size());
    std::memcpy(bytes.data() + e.offset, payload.data(), payload.size());

    auto reader = Open(std::move(bytes));
    testutil::MemoryDevice dev("dev");
    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {WriteTarget{{SegmentRole::Kernel, 0}, &dev, 0}});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Decompress);
    EXPECT_EQ(dev.write_calls, 0);
}

TEST_F(ImageWriterTest, EmitsProgress) {
    auto reader = Open(image);
    testutil::MemoryDevice dev("dev");
    RecordingProgress progress;

    ImageWriter writer(Fast());
    writer.SetProgressSink(&progress);
    auto report = writer.Write(reader, {
        WriteTarget{{SegmentRole::Kernel, 0}, &dev, 0},
        WriteTarget{{SegmentRole::Rootfs, 0}, &dev, 65536},
    });
    ASSERT_TRUE(report.has_value());
    ASSERT_FALSE(progress.events.empty());

    const auto& last = progress.events.back();
    EXPECT_EQ(last.segment, "rootfs");
    EXPECT_EQ(last.stage, "readback");
    EXPECT_EQ(last.seg_done, rootfs.size());
    EXPECT_EQ(last.overall_done, last.overall_total);
    EXPECT_EQ(last.overall_total, kernel.size() + rootfs.size());
}

TEST_F(ImageWriterTest, WritesThroughPartitionDevice) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/disk.img";

    PartitionDevice disk;
    auto opened = PartitionDevice::Open(path, disk);
    ASSERT_TRUE(opened.ok) << opened.msg;

    auto reader = Open(image);
    ImageWriter writer(Fast());
    auto report = writer.Write(reader, {
        WriteTarget{{SegmentRole::Kernel, 0}, &disk, 4096},
        WriteTarget{{SegmentRole::Rootfs, 0}, &disk, 65536},
    });
    ASSERT_TRUE(report.has_value()) << report.error().Describe();

    const auto contents = testutil::ReadFile(path);
    EXPECT_TRUE(RangeEquals(contents, 4096, kernel));
    EXPECT_TRUE(RangeEquals(contents, 65536, rootfs));
}

} // namespace nimage
