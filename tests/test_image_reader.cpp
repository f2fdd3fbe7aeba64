#include "nimage/checksum.hpp"
#include "nimage/image_builder.hpp"
#include "nimage/image_reader.hpp"
#include "testing.hpp"
#include "util/logger.hpp"

#include <gtest/gtest.h>
#include <cstring>
#include <memory>
#include <vector>

namespace nimage {

namespace {

std::unique_ptr<IReader> Mem(std::vector<std::uint8_t> data) {
    return std::make_unique<testutil::MemoryReader>(std::move(data));
}

struct Fixture {
    std::vector<std::uint8_t> kernel = testutil::TextBytes(3000);
    std::vector<std::uint8_t> rootfs = testutil::RandomBytes(300, 11);
    std::vector<std::uint8_t> other = testutil::RandomBytes(50, 12);
    BuiltImage image;
};

Fixture MakeImage() {
    Fixture f;
    ImageBuilder::Options opt;
    opt.name = "reader";
    opt.block_size = 4096;
    opt.workers = 1;
    ImageBuilder b(opt);
    SegmentOptions z;
    z.compress = true;
    EXPECT_TRUE(b.AddSegment(SegmentRole::Kernel, Mem(f.kernel), z));
    EXPECT_TRUE(b.AddSegment(SegmentRole::Rootfs, Mem(f.rootfs)));
    EXPECT_TRUE(b.AddSegment(SegmentRole::Other, Mem(f.other)));
    auto built = b.Build();
    EXPECT_TRUE(built.has_value());
    f.image = std::move(*built);
    return f;
}

std::size_t PayloadByte(const BuiltImage& img, std::size_t index) {
    return static_cast<std::size_t>(img.header.segments[index].offset + img.header.segments[index].stored_length / 2);
}

} // namespace

TEST(ImageReaderTest, OpenAndVerifyIntactImage) {
    auto f = MakeImage();
    auto reader = ImageReader::Open(f.image.bytes);
    ASSERT_TRUE(reader.has_value()) << reader.error().Describe();

    EXPECT_EQ(reader->SegmentCount(), 3u);
    EXPECT_EQ(reader->header().header_checksum, f.image.header.header_checksum);

    const auto report = reader->Verify(VerifyMode::Strict);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.checked, 3u);
    EXPECT_FALSE(reader->rejected());
}

TEST(ImageReaderTest, AnySingleBitFlipIsDetected) {
    auto f = MakeImage();
    const auto& clean = f.image.bytes;

    // Thousands of expected mismatches; keep stderr quiet.
    const LogLevel saved = Logger::Instance().Level();
    Logger::Instance().SetLevel(LogLevel::None);

    for (std::size_t byte = 0; byte < clean.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            auto damaged = clean;
            damaged[byte] ^= static_cast<std::uint8_t>(1u << bit);

            auto reader = ImageReader::Open(std::move(damaged));
            if (!reader) {
                EXPECT_EQ(reader.error().kind, ErrorKind::Format) << "byte " << byte << " bit " << bit;
                continue;
            }
            const auto report = reader->Verify(VerifyMode::Report);
            EXPECT_EQ(report.mismatches.size(), 1u) << "byte " << byte << " bit " << bit;
        }
    }
    Logger::Instance().SetLevel(saved);
}

TEST(ImageReaderTest, ReportModeIsolatesCorruptSegment) {
    auto f = MakeImage();
    auto bytes = f.image.bytes;
    bytes[PayloadByte(f.image, 1)] ^= 0x40;

    auto reader = ImageReader::Open(std::move(bytes));
    ASSERT_TRUE(reader.has_value());

    const auto report = reader->Verify(VerifyMode::Report);
    ASSERT_EQ(report.mismatches.size(), 1u);
    EXPECT_EQ(report.checked, 3u);
    const Error& e = report.mismatches[0];
    EXPECT_EQ(e.code, Errc::ChecksumMismatch);
    EXPECT_EQ(e.role, std::optional<SegmentRole>(SegmentRole::Rootfs));
    EXPECT_EQ(e.segment_index, std::optional<std::size_t>(1));
    EXPECT_EQ(e.expected, f.image.header.segments[1].checksum);
    EXPECT_NE(e.actual, e.expected);
    EXPECT_FALSE(reader->rejected());

    auto kernel = reader->GetSegment({SegmentRole::Kernel, 0});
    ASSERT_TRUE(kernel.has_value());
    EXPECT_EQ(*kernel, f.kernel);
    auto other = reader->GetSegment({SegmentRole::Other, 0});
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(*other, f.other);

    auto rootfs = reader->GetSegment({SegmentRole::Rootfs, 0});
    ASSERT_FALSE(rootfs.has_value());
    EXPECT_EQ(rootfs.error().kind, ErrorKind::Verify);
}

TEST(ImageReaderTest, StrictModeStopsAtFirstMismatchAndRejectsAll) {
    auto f = MakeImage();
    auto bytes = f.image.bytes;
    bytes[PayloadByte(f.image, 0)] ^= 0x01;
    bytes[PayloadByte(f.image, 2)] ^= 0x01;

    auto strict = ImageReader::Open(bytes);
    ASSERT_TRUE(strict.has_value());
    const auto s = strict->Verify(VerifyMode::Strict);
    ASSERT_EQ(s.mismatches.size(), 1u);
    EXPECT_EQ(s.mismatches[0].segment_index, std::optional<std::size_t>(0));
    EXPECT_TRUE(strict->rejected());

    auto intact = strict->GetSegment({SegmentRole::Rootfs, 0});
    ASSERT_FALSE(intact.has_value());
    EXPECT_EQ(intact.error().kind, ErrorKind::Usage);
    EXPECT_EQ(intact.error().code, Errc::ContainerRejected);

    auto report = ImageReader::Open(bytes);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->Verify(VerifyMode::Report).mismatches.size(), 2u);
}

TEST(ImageReaderTest, LazyVerificationGuardsGetSegment) {
    auto f = MakeImage();
    auto bytes = f.image.bytes;
    bytes[PayloadByte(f.image, 2)] ^= 0x80;

    auto reader = ImageReader::Open(std::move(bytes));
    ASSERT_TRUE(reader.has_value());
    auto other = reader->GetSegmentAt(2);
    ASSERT_FALSE(other.has_value());
    EXPECT_EQ(other.error().kind, ErrorKind::Verify);
    EXPECT_TRUE(reader->GetSegmentAt(0).has_value());
}

TEST(ImageReaderTest, TrailingDataNeedsOptIn) {
    auto f = MakeImage();
    auto bytes = f.image.bytes;
    bytes.insert(bytes.end(), {0xDE, 0xAD, 0xBE, 0xEF});

    auto strict = ImageReader::Open(bytes);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, Errc::TrailingData);

    ReaderOptions opt;
    opt.allow_trailing_data = true;
    auto lenient = ImageReader::Open(bytes, opt);
    ASSERT_TRUE(lenient.has_value());
    EXPECT_TRUE(lenient->Verify().ok());
    EXPECT_EQ(*lenient->GetSegment({SegmentRole::Kernel, 0}), f.kernel);
}

TEST(ImageReaderTest, TruncatedImageRejected) {
    auto f = MakeImage();
    auto bytes = f.image.bytes;
    bytes.pop_back();

    auto reader = ImageReader::Open(std::move(bytes));
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, Errc::Truncated);
}

TEST(ImageReaderTest, MissingSegmentIsUsageError) {
    auto f = MakeImage();
    auto reader = ImageReader::Open(f.image.bytes);
    ASSERT_TRUE(reader.has_value());

    auto dtb = reader->GetSegment({SegmentRole::Dtb, 0});
    ASSERT_FALSE(dtb.has_value());
    EXPECT_EQ(dtb.error().kind, ErrorKind::Usage);
    EXPECT_EQ(dtb.error().code, Errc::SegmentNotFound);

    EXPECT_EQ(reader->GetSegment({SegmentRole::Other, 1}).error().code, Errc::SegmentNotFound);
    EXPECT_EQ(reader->GetSegmentAt(3).error().code, Errc::SegmentNotFound);
}

TEST(ImageReaderTest, UndecodablePayloadIsDecompressError) {
    // Hand-made container whose compressed payload has a valid checksum but is not gzip.
    const std::vector<std::uint8_t> payload(48, 0xAB);

    ImageHeader h;
    h.name = "garbage";
    SegmentEntry e;
    e.role = SegmentRole::Kernel;
    e.compression = CompressionKind::Zlib;
    e.offset = HeaderRegionSize(1);
    e.stored_length = payload.size();
    e.raw_length = 4096;
    e.checksum = Xxh64(payload);
    h.segments.push_back(e);
    h.total_image_size = e.End();

    const auto region = SerializeHeader(h);
    std::vector<std::uint8_t> bytes(static_cast<size_t>(h.total_image_size), 0);
    std::memcpy(bytes.data(), region.data(), region.size());
    std::memcpy(bytes.data() + e.offset, payload.data(), payload.size());

    auto reader = ImageReader::Open(std::move(bytes));
    ASSERT_TRUE(reader.has_value()) << reader.error().Describe();
    EXPECT_TRUE(reader->Verify().ok());

    auto raw = reader->GetSegment({SegmentRole::Kernel, 0});
    ASSERT_FALSE(raw.has_value());
    EXPECT_EQ(raw.error().kind, ErrorKind::Decompress);
    EXPECT_EQ(raw.error().code, Errc::CorruptStream);
}

TEST(ImageReaderTest, ForgedRawLengthIsRejectedAtOpen) {
    auto f = MakeImage();
    ImageHeader h = f.image.header;
    ASSERT_EQ(h.segments[0].compression, CompressionKind::Zlib);
    h.segments[0].raw_length = 1ull << 62;

    auto bytes = f.image.bytes;
    const auto region = SerializeHeader(h);
    std::memcpy(bytes.data(), region.data(), region.size());

    auto reader = ImageReader::Open(std::move(bytes));
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().kind, ErrorKind::Format);
    EXPECT_EQ(reader.error().code, Errc::LengthMismatch);
}

TEST(ImageReaderTest, OverstatedRawLengthIsDecompressError) {
    auto f = MakeImage();
    ImageHeader h = f.image.header;
    // Larger than the payload inflates to, but within what deflate could produce.
    h.segments[0].raw_length = h.segments[0].stored_length * kMaxInflateRatio;
    ASSERT_GT(h.segments[0].raw_length, f.kernel.size());

    auto bytes = f.image.bytes;
    const auto region = SerializeHeader(h);
    std::memcpy(bytes.data(), region.data(), region.size());

    auto reader = ImageReader::Open(std::move(bytes));
    ASSERT_TRUE(reader.has_value()) << reader.error().Describe();
    EXPECT_TRUE(reader->Verify(VerifyMode::Strict).ok());

    auto raw = reader->GetSegment({SegmentRole::Kernel, 0});
    ASSERT_FALSE(raw.has_value());
    EXPECT_EQ(raw.error().kind, ErrorKind::Decompress);
    EXPECT_EQ(raw.error().code, Errc::RawLengthMismatch);
}

TEST(ImageReaderTest, StreamsMatchStoredAndRawBytes) {
    auto f = MakeImage();
    auto reader = ImageReader::Open(f.image.bytes);
    ASSERT_TRUE(reader.has_value());

    auto raw = reader->OpenRawStream(0);
    ASSERT_TRUE(raw.has_value());
    const std::string inflated = testutil::ReadAll(**raw);
    EXPECT_EQ(inflated, std::string(f.kernel.begin(), f.kernel.end()));

    auto stored = reader->OpenStoredStream(0);
    ASSERT_TRUE(stored.has_value());
    const std::string packed = testutil::ReadAll(**stored);
    const auto expect = reader->StoredBytes(0);
    EXPECT_EQ(packed, std::string(expect.begin(), expect.end()));
}

TEST(ImageReaderTest, OpenFileReadsFromDisk) {
    auto f = MakeImage();
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Path() + "/img.nimg";
    testutil::WriteFile(p, f.image.bytes);

    auto reader = ImageReader::OpenFile(p);
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader->bytes().size(), f.image.bytes.size());

    auto missing = ImageReader::OpenFile(tmp.Path() + "/nope.nimg");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, Errc::InputUnreadable);
}

TEST(ImageReaderTest, GarbageFileIsFormatError) {
    auto reader = ImageReader::Open(testutil::RandomBytes(4096, 99));
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().kind, ErrorKind::Format);
    EXPECT_EQ(reader.error().code, Errc::BadMagic);
}

} // namespace nimage
