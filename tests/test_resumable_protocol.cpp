#include "uplink/resumable_protocol.hpp"

#include <gtest/gtest.h>

namespace {

namespace rp = uplink::resumable;

TEST(ResumableProtocolTests, ContentRangeIsInclusive) {
    EXPECT_EQ(rp::ContentRange({0, 5242880}, 26214400), "bytes 0-5242879/26214400");
    EXPECT_EQ(rp::ContentRange({26214399, 1}, 26214400), "bytes 26214399-26214399/26214400");
}

TEST(ResumableProtocolTests, EmptyRangeIsStatusProbe) {
    EXPECT_EQ(rp::ContentRange({0, 0}, 0), "bytes */0");
    EXPECT_EQ(rp::ContentRange({100, 0}, 100), "bytes */100");
    EXPECT_EQ(rp::StatusProbeRange(42), "bytes */42");
}

TEST(ResumableProtocolTests, ParsesConfirmedBytes) {
    std::uint64_t n = 0;
    ASSERT_TRUE(rp::ParseConfirmedBytes("bytes=0-1048575", n));
    EXPECT_EQ(n, 1048576u);
    ASSERT_TRUE(rp::ParseConfirmedBytes("  bytes=0-0 ", n));
    EXPECT_EQ(n, 1u);
    ASSERT_TRUE(rp::ParseConfirmedBytes("Bytes=0-9", n));
    EXPECT_EQ(n, 10u);
}

TEST(ResumableProtocolTests, RejectsMalformedRange) {
    std::uint64_t n = 0;
    EXPECT_FALSE(rp::ParseConfirmedBytes("", n));
    EXPECT_FALSE(rp::ParseConfirmedBytes("bytes=", n));
    EXPECT_FALSE(rp::ParseConfirmedBytes("bytes=0", n));
    EXPECT_FALSE(rp::ParseConfirmedBytes("bytes=5-9", n));
    EXPECT_FALSE(rp::ParseConfirmedBytes("bytes=0-x", n));
    EXPECT_FALSE(rp::ParseConfirmedBytes("items=0-9", n));
}

TEST(ResumableProtocolTests, InitiateUrlAddsQuery) {
    EXPECT_EQ(rp::InitiateUrl("https://up.test/videos", {"snippet", "status"}),
              "https://up.test/videos?uploadType=resumable&part=snippet,status");
    EXPECT_EQ(rp::InitiateUrl("https://up.test/videos?alt=json", {}),
              "https://up.test/videos?alt=json&uploadType=resumable");
}

TEST(ResumableProtocolTests, ParsesResourceId) {
    auto id = rp::ParseResourceId(R"({"kind":"youtube#video","id":"dQw4w9WgXcQ"})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "dQw4w9WgXcQ");

    EXPECT_EQ(rp::ParseResourceId("{}").error().kind, uplink::ErrorKind::UploadFailed);
    EXPECT_EQ(rp::ParseResourceId("oops").error().kind, uplink::ErrorKind::UploadFailed);
}

TEST(ResumableProtocolTests, ExtractsApiErrorReason) {
    const std::string body =
        R"({"error":{"code":403,"message":"The request cannot be completed because you have exceeded your quota.","errors":[{"reason":"quotaExceeded","domain":"youtube.quota"}]}})";
    EXPECT_EQ(rp::ExtractApiErrorReason(body), "quotaExceeded");
    EXPECT_EQ(rp::ExtractApiErrorMessage(body),
              "The request cannot be completed because you have exceeded your quota.");

    EXPECT_EQ(rp::ExtractApiErrorReason("not json"), "");
    EXPECT_EQ(rp::ExtractApiErrorMessage("not json"), "not json");
}

} // namespace
