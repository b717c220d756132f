#include "util/config.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>

namespace uplink::config {

namespace {

const char* GetEnv(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

bool ParseU64(const char* s, std::uint64_t& out) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0' || *s == '-')
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace

Result UploaderConfig::LoadFile(const std::string& path) {
    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::InputValidation, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorKind::InputValidation, "Config: " + err + " in " + path);
    }

    LogDebug("Loaded config from %s", path.c_str());
    return Result::Ok();
}

Result UploaderConfig::ApplyEnvironment() {
    if (const char* v = GetEnv("UPLINK_CLIENT_ID")) client_id = v;
    if (const char* v = GetEnv("UPLINK_CLIENT_SECRET")) client_secret = v;
    if (const char* v = GetEnv("UPLINK_TOKEN_DIR")) token_dir = v;

    if (const char* v = GetEnv("UPLINK_BANDWIDTH_LIMIT")) {
        if (!ParseU64(v, bandwidth_limit_bytes_per_sec)) {
            return Result::Fail(ErrorKind::InputValidation,
                                std::string("Invalid UPLINK_BANDWIDTH_LIMIT: ") + v);
        }
    }
    if (const char* v = GetEnv("UPLINK_OAUTH_PORT")) {
        std::uint64_t port = 0;
        if (!ParseU64(v, port) || port == 0 || port > 65535) {
            return Result::Fail(ErrorKind::InputValidation,
                                std::string("Invalid UPLINK_OAUTH_PORT: ") + v);
        }
        redirect_uri = "http://localhost:" + std::to_string(port);
    }
    return Result::Ok();
}

Result UploaderConfig::Validate() const {
    if (chunk_size_bytes == 0 || chunk_size_bytes % kChunkGranularity != 0) {
        return Result::Fail(ErrorKind::InputValidation,
                            "ChunkSizeBytes must be a positive multiple of 262144");
    }
    if (max_retry_attempts == 0) {
        return Result::Fail(ErrorKind::InputValidation, "MaxRetryAttempts must be at least 1");
    }
    if (retry_initial_delay_sec < 0.0 || retry_max_delay_sec < retry_initial_delay_sec) {
        return Result::Fail(ErrorKind::InputValidation,
                            "RetryMaxDelaySec must be >= RetryInitialDelaySec >= 0");
    }
    if (retry_backoff_multiplier < 1.0) {
        return Result::Fail(ErrorKind::InputValidation, "RetryBackoffMultiplier must be >= 1.0");
    }
    if (connect_timeout_sec == 0 || request_timeout_sec == 0) {
        return Result::Fail(ErrorKind::InputValidation, "Timeouts must be positive");
    }
    if (token_dir.empty()) {
        return Result::Fail(ErrorKind::InputValidation, "TokenDir must not be empty");
    }
    if (upload_url.empty() || token_uri.empty() || api_url.empty()) {
        return Result::Fail(ErrorKind::InputValidation, "UploadUrl, TokenUri and ApiUrl are required");
    }
    LogLevel lvl{};
    if (!ParseLogLevel(log_level, lvl)) {
        return Result::Fail(ErrorKind::InputValidation, "Unknown LogLevel: " + log_level);
    }
    return Result::Ok();
}

} // namespace uplink::config
