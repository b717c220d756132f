#pragma once
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace uplink::config {

inline constexpr std::uint64_t kChunkGranularity = 256 * 1024ULL;

class UploaderConfig {
public:
    // OAuth client identity
    std::string client_id;
    std::string client_secret;
    std::string redirect_uri = "http://localhost:8080";
    std::vector<std::string> scopes = {
        "https://www.googleapis.com/auth/youtube.upload",
        "https://www.googleapis.com/auth/youtube",
    };

    // Endpoints
    std::string auth_uri = "https://accounts.google.com/o/oauth2/auth";
    std::string token_uri = "https://oauth2.googleapis.com/token";
    std::string upload_url = "https://www.googleapis.com/upload/youtube/v3/videos";
    std::string thumbnail_url = "https://www.googleapis.com/upload/youtube/v3/thumbnails/set";
    std::string api_url = "https://www.googleapis.com/youtube/v3";

    // Credential storage
    std::string token_dir = "data/tokens";
    std::uint32_t credential_safety_margin_sec = 60;

    // Transfer
    std::uint64_t chunk_size_bytes = 20 * 1024 * 1024ULL;
    std::uint64_t bandwidth_limit_bytes_per_sec = 0;
    std::uint32_t connect_timeout_sec = 30;
    std::uint32_t request_timeout_sec = 60;

    // Retry
    std::uint32_t max_retry_attempts = 5;
    double retry_initial_delay_sec = 1.0;
    double retry_max_delay_sec = 60.0;
    double retry_backoff_multiplier = 1.5;
    std::uint32_t max_session_restarts = 3;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    Result LoadFile(const std::string& path);

    // UPLINK_CLIENT_ID, UPLINK_CLIENT_SECRET, UPLINK_TOKEN_DIR,
    // UPLINK_BANDWIDTH_LIMIT, UPLINK_OAUTH_PORT
    Result ApplyEnvironment();

    Result Validate() const;

    std::string CredentialFilePath() const { return token_dir + "/credential.bin"; }
    std::string KeyFilePath() const { return token_dir + "/.encryption_key"; }
};

} // namespace uplink::config
