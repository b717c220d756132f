#include "testing.hpp"
#include "util/config.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

namespace {

using uplink::config::UploaderConfig;

class ScopedEnv {
  public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

  private:
    const char* name_;
};

TEST(ConfigTests, DefaultsAreValid) {
    UploaderConfig cfg;
    EXPECT_TRUE(cfg.Validate().is_ok());
    EXPECT_EQ(cfg.chunk_size_bytes, 20u * 1024 * 1024);
    EXPECT_EQ(cfg.max_retry_attempts, 5u);
    EXPECT_EQ(cfg.CredentialFilePath(), "data/tokens/credential.bin");
    EXPECT_EQ(cfg.KeyFilePath(), "data/tokens/.encryption_key");
}

TEST(ConfigTests, LoadFileReadsKnownKeys) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/uplink.json";
    testutil::WriteFile(path, R"({
        "ClientId": "cid",
        "ClientSecret": "secret",
        "TokenDir": "/var/lib/uplink",
        "Scopes": ["a", "b"],
        "ChunkSizeBytes": 524288,
        "BandwidthLimitBytesPerSec": 1000000,
        "MaxRetryAttempts": 7,
        "RetryBackoffMultiplier": 2,
        "LogLevel": "debug",
        "ApiUrl": "https://api.test/v3",
        "Unrelated": true
    })");

    UploaderConfig cfg;
    ASSERT_TRUE(cfg.LoadFile(path).is_ok());
    EXPECT_EQ(cfg.client_id, "cid");
    EXPECT_EQ(cfg.client_secret, "secret");
    EXPECT_EQ(cfg.token_dir, "/var/lib/uplink");
    EXPECT_EQ(cfg.scopes, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(cfg.chunk_size_bytes, 524288u);
    EXPECT_EQ(cfg.bandwidth_limit_bytes_per_sec, 1000000u);
    EXPECT_EQ(cfg.max_retry_attempts, 7u);
    EXPECT_DOUBLE_EQ(cfg.retry_backoff_multiplier, 2.0);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.api_url, "https://api.test/v3");
    EXPECT_EQ(cfg.upload_url, "https://www.googleapis.com/upload/youtube/v3/videos");
    EXPECT_TRUE(cfg.Validate().is_ok());
}

TEST(ConfigTests, LoadFileErrors) {
    testutil::TemporaryDirectory tmp;
    UploaderConfig cfg;

    EXPECT_EQ(cfg.LoadFile(tmp.Path() + "/missing.json").kind(), uplink::ErrorKind::InputValidation);

    const std::string bad = tmp.Path() + "/bad.json";
    testutil::WriteFile(bad, "{ not json");
    EXPECT_FALSE(cfg.LoadFile(bad).is_ok());

    testutil::WriteFile(bad, "[1, 2]");
    EXPECT_FALSE(cfg.LoadFile(bad).is_ok());

    testutil::WriteFile(bad, R"({"ChunkSizeBytes": "big"})");
    auto r = cfg.LoadFile(bad);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.message().find("ChunkSizeBytes"), std::string::npos);

    testutil::WriteFile(bad, R"({"MaxRetryAttempts": -1})");
    EXPECT_FALSE(cfg.LoadFile(bad).is_ok());

    testutil::WriteFile(bad, R"({"Scopes": ["a", 1]})");
    EXPECT_FALSE(cfg.LoadFile(bad).is_ok());
}

TEST(ConfigTests, EnvironmentOverridesFile) {
    ScopedEnv id("UPLINK_CLIENT_ID", "env-id");
    ScopedEnv dir("UPLINK_TOKEN_DIR", "/tmp/env-tokens");
    ScopedEnv bw("UPLINK_BANDWIDTH_LIMIT", "4096");
    ScopedEnv port("UPLINK_OAUTH_PORT", "9090");

    UploaderConfig cfg;
    cfg.client_id = "file-id";
    ASSERT_TRUE(cfg.ApplyEnvironment().is_ok());
    EXPECT_EQ(cfg.client_id, "env-id");
    EXPECT_EQ(cfg.token_dir, "/tmp/env-tokens");
    EXPECT_EQ(cfg.bandwidth_limit_bytes_per_sec, 4096u);
    EXPECT_EQ(cfg.redirect_uri, "http://localhost:9090");
}

TEST(ConfigTests, MalformedEnvironmentIsRejected) {
    {
        ScopedEnv bw("UPLINK_BANDWIDTH_LIMIT", "fast");
        UploaderConfig cfg;
        EXPECT_EQ(cfg.ApplyEnvironment().kind(), uplink::ErrorKind::InputValidation);
    }
    {
        ScopedEnv port("UPLINK_OAUTH_PORT", "70000");
        UploaderConfig cfg;
        EXPECT_FALSE(cfg.ApplyEnvironment().is_ok());
    }
}

TEST(ConfigTests, ValidateRejectsBadValues) {
    UploaderConfig cfg;
    cfg.chunk_size_bytes = 300 * 1024;
    EXPECT_EQ(cfg.Validate().kind(), uplink::ErrorKind::InputValidation);
    cfg.chunk_size_bytes = 0;
    EXPECT_FALSE(cfg.Validate().is_ok());
    cfg.chunk_size_bytes = uplink::config::kChunkGranularity;
    EXPECT_TRUE(cfg.Validate().is_ok());

    cfg.max_retry_attempts = 0;
    EXPECT_FALSE(cfg.Validate().is_ok());
    cfg = {};
    cfg.retry_max_delay_sec = 0.5;
    EXPECT_FALSE(cfg.Validate().is_ok());
    cfg = {};
    cfg.retry_backoff_multiplier = 0.9;
    EXPECT_FALSE(cfg.Validate().is_ok());
    cfg = {};
    cfg.log_level = "chatty";
    EXPECT_FALSE(cfg.Validate().is_ok());
    cfg = {};
    cfg.token_dir.clear();
    EXPECT_FALSE(cfg.Validate().is_ok());
}

} // namespace
