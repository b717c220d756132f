#include "io/file_source.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

class FileSourceTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FileSourceTests, OpenOK_AndSizeMatches) {
    const std::string p = MakePath("in.bin");
    const auto data = testutil::Pattern(12345);
    testutil::WriteFile(p, data);

    uplink::FileSource src;
    auto res = uplink::FileSource::Open(p, src);
    ASSERT_TRUE(res.is_ok()) << res.message();
    EXPECT_EQ(src.Size(), data.size());
    EXPECT_EQ(src.Path(), p);

    std::uint64_t current = 0;
    ASSERT_TRUE(src.CurrentSize(current).is_ok());
    EXPECT_EQ(current, data.size());
}

TEST_F(FileSourceTests, OpenNonexistent_Fails) {
    uplink::FileSource src;
    auto res = uplink::FileSource::Open(MakePath("nope.bin"), src);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind(), uplink::ErrorKind::InputValidation);
}

TEST_F(FileSourceTests, OpenDirectory_Fails) {
    const std::string d = MakePath("dir");
    ASSERT_EQ(::mkdir(d.c_str(), 0755), 0);

    uplink::FileSource src;
    auto res = uplink::FileSource::Open(d, src);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind(), uplink::ErrorKind::InputValidation);
}

TEST_F(FileSourceTests, ReadAtIsPositional) {
    const std::string p = MakePath("in2.bin");
    const auto data = testutil::Pattern(2 * 1024 * 1024 + 7);
    testutil::WriteFile(p, data);

    uplink::FileSource src;
    ASSERT_TRUE(uplink::FileSource::Open(p, src).is_ok());

    // Out of order on purpose; there is no shared cursor.
    std::vector<std::uint8_t> tail(7);
    ASSERT_TRUE(uplink::ReadExactAt(src, 2 * 1024 * 1024, tail).is_ok());
    EXPECT_TRUE(std::equal(tail.begin(), tail.end(), data.end() - 7));

    std::vector<std::uint8_t> head(4096);
    ASSERT_TRUE(uplink::ReadExactAt(src, 0, head).is_ok());
    EXPECT_TRUE(std::equal(head.begin(), head.end(), data.begin()));
}

TEST_F(FileSourceTests, ReadExactAtPastEnd_Fails) {
    const std::string p = MakePath("short.bin");
    testutil::WriteFile(p, std::string("abc"));

    uplink::FileSource src;
    ASSERT_TRUE(uplink::FileSource::Open(p, src).is_ok());

    std::vector<std::uint8_t> buf(10);
    auto res = uplink::ReadExactAt(src, 0, buf);
    EXPECT_FALSE(res.is_ok());
}

TEST_F(FileSourceTests, ReadWholeFile) {
    const std::string p = MakePath("thumb.png");
    testutil::WriteFile(p, std::string("\x89PNG....", 8));

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(uplink::ReadWholeFile(p, out).is_ok());
    EXPECT_EQ(out.size(), 8u);
    EXPECT_EQ(out[0], 0x89);

    EXPECT_FALSE(uplink::ReadWholeFile(MakePath("missing.png"), out).is_ok());
}

} // namespace
