#include "util/build_manifest.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace nimage {

TEST(BuildManifestTest, ParsesFullManifest) {
    const std::string input = R"({
        "name": "board-a 1.4",
        "level": 9,
        "block_size": 65536,
        "workers": 4,
        "segments": [
            {"role": "kernel", "file": "zImage", "compress": true,
             "load_address": "0x80008000", "entry_point": 2147516416},
            {"role": "dtb", "file": "/abs/board.dtb"},
            {"role": "other", "file": "fw/a.bin"},
            {"role": "other", "file": "fw/b.bin"}
        ]
    })";

    auto m = BuildManifestParser{}.Parse(input, "/work");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->name, "board-a 1.4");
    EXPECT_EQ(m->level, 9);
    EXPECT_EQ(m->block_size, 65536u);
    EXPECT_EQ(m->workers, 4u);
    ASSERT_EQ(m->segments.size(), 4u);

    const auto& k = m->segments[0];
    EXPECT_EQ(k.role, SegmentRole::Kernel);
    EXPECT_EQ(k.file, "/work/zImage");
    EXPECT_TRUE(k.compress);
    EXPECT_EQ(k.load_address, 0x80008000u);
    EXPECT_EQ(k.entry_point, 0x80008000u);

    EXPECT_EQ(m->segments[1].file, "/abs/board.dtb");
    EXPECT_FALSE(m->segments[1].compress);
    EXPECT_EQ(m->segments[3].role, SegmentRole::Other);
    EXPECT_EQ(m->segments[3].file, "/work/fw/b.bin");
}

TEST(BuildManifestTest, OmittedFieldsStayUnset) {
    auto m = BuildManifestParser{}.Parse(R"({"segments": [{"role": "rootfs", "file": "r.img"}]})");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_FALSE(m->name.has_value());
    EXPECT_FALSE(m->level.has_value());
    EXPECT_FALSE(m->block_size.has_value());
    EXPECT_FALSE(m->workers.has_value());
    EXPECT_EQ(m->segments[0].file, "./r.img");
}

TEST(BuildManifestTest, RejectsBadInput) {
    BuildManifestParser p;
    EXPECT_EQ(p.Parse("  \n").error(), "Empty input");
    EXPECT_FALSE(p.Parse("{not json").has_value());
    EXPECT_FALSE(p.Parse("[1, 2]").has_value());
    EXPECT_FALSE(p.Parse(R"({"level": 12})").has_value());
    EXPECT_FALSE(p.Parse(R"({"workers": 4294967296})").has_value());
    EXPECT_TRUE(p.Parse(R"({"workers": 4294967295})").has_value());
    EXPECT_FALSE(p.Parse(R"({"name": 5})").has_value());
    EXPECT_FALSE(p.Parse(R"({"segments": {}})").has_value());

    auto no_role = p.Parse(R"({"segments": [{"file": "a"}]})");
    ASSERT_FALSE(no_role.has_value());
    EXPECT_NE(no_role.error().find("segments[0] missing role"), std::string::npos);

    auto bad_role = p.Parse(R"({"segments": [{"role": "bootloader", "file": "a"}]})");
    ASSERT_FALSE(bad_role.has_value());
    EXPECT_NE(bad_role.error().find("unknown role"), std::string::npos);

    auto no_file = p.Parse(R"({"segments": [{"role": "dtb"}]})");
    ASSERT_FALSE(no_file.has_value());
    EXPECT_NE(no_file.error().find("missing file"), std::string::npos);

    auto bad_addr = p.Parse(R"({"segments": [{"role": "kernel", "file": "k", "load_address": "80008000"}]})");
    ASSERT_FALSE(bad_addr.has_value());
    EXPECT_NE(bad_addr.error().find("load_address"), std::string::npos);
}

TEST(BuildManifestTest, LoadFromFileResolvesAgainstManifestDirectory) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/image.json";
    testutil::WriteFile(path, std::string(R"({"segments": [{"role": "kernel", "file": "Image"}]})"));

    auto m = BuildManifestParser{}.LoadFromFile(path);
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->segments[0].file, tmp.Path() + "/Image");

    auto missing = BuildManifestParser{}.LoadFromFile(tmp.Path() + "/none.json");
    EXPECT_FALSE(missing.has_value());
}

} // namespace nimage
