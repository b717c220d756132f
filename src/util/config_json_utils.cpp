#include "util/config_json_utils.hpp"

#include <fstream>
#include <limits>

namespace uplink::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

// Returns false and sets err only when the key exists with the wrong type.
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetU32IfPresent(const nlohmann::json& j, const char* key, std::uint32_t& out,
                     std::string& err) {
    std::uint64_t v = out;
    if (!GetU64IfPresent(j, key, v, err))
        return false;
    if (v > std::numeric_limits<std::uint32_t>::max()) {
        err = std::string(key) + " is out of range";
        return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool GetDoubleIfPresent(const nlohmann::json& j, const char* key, double& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_number()) {
        err = std::string(key) + " must be a number";
        return false;
    }
    out = it->get<double>();
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j, const char* key,
                             std::vector<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> items;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        items.push_back(item.get<std::string>());
    }
    out = std::move(items);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UploaderConfig& cfg, std::string& err) {
    GetStringIfPresent(j, "ClientId", cfg.client_id);
    GetStringIfPresent(j, "ClientSecret", cfg.client_secret);
    GetStringIfPresent(j, "RedirectUri", cfg.redirect_uri);
    GetStringIfPresent(j, "AuthUri", cfg.auth_uri);
    GetStringIfPresent(j, "TokenUri", cfg.token_uri);
    GetStringIfPresent(j, "UploadUrl", cfg.upload_url);
    GetStringIfPresent(j, "ThumbnailUrl", cfg.thumbnail_url);
    GetStringIfPresent(j, "ApiUrl", cfg.api_url);
    GetStringIfPresent(j, "TokenDir", cfg.token_dir);
    GetStringIfPresent(j, "LogLevel", cfg.log_level);
    GetStringIfPresent(j, "LogFile", cfg.log_file);

    return GetStringArrayIfPresent(j, "Scopes", cfg.scopes, err) &&
           GetU64IfPresent(j, "ChunkSizeBytes", cfg.chunk_size_bytes, err) &&
           GetU64IfPresent(j, "BandwidthLimitBytesPerSec", cfg.bandwidth_limit_bytes_per_sec, err) &&
           GetU32IfPresent(j, "ConnectTimeoutSec", cfg.connect_timeout_sec, err) &&
           GetU32IfPresent(j, "RequestTimeoutSec", cfg.request_timeout_sec, err) &&
           GetU32IfPresent(j, "MaxRetryAttempts", cfg.max_retry_attempts, err) &&
           GetDoubleIfPresent(j, "RetryInitialDelaySec", cfg.retry_initial_delay_sec, err) &&
           GetDoubleIfPresent(j, "RetryMaxDelaySec", cfg.retry_max_delay_sec, err) &&
           GetDoubleIfPresent(j, "RetryBackoffMultiplier", cfg.retry_backoff_multiplier, err) &&
           GetU32IfPresent(j, "MaxSessionRestarts", cfg.max_session_restarts, err) &&
           GetU32IfPresent(j, "CredentialSafetyMarginSec", cfg.credential_safety_margin_sec, err);
}

} // namespace uplink::config::detail
