#pragma once

#include "auth/credential_manager.hpp"
#include "io/byte_source.hpp"
#include "net/http.hpp"
#include "uplink/byte_range_chunker.hpp"
#include "uplink/progress.hpp"
#include "uplink/retry_policy.hpp"
#include "uplink/token_bucket_throttle.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace uplink {

enum class SessionPhase : int {
    Initiating,
    Uploading,
    Completing,
    Completed,
    Failed,
    Cancelled,
};

const char* SessionPhaseName(SessionPhase p);

enum class UploadStatus : int {
    Pending,
    InProgress,
    Completed,
    Failed,
    Cancelled,
};

const char* UploadStatusName(UploadStatus s);

// Live view of one remote session. Lives only as long as the UploadSession.
struct UploadSessionState {
    std::string session_url;
    std::uint64_t bytes_confirmed = 0;
    std::uint64_t chunk_size = 0;
    std::uint64_t throttle_rate = 0;
    int attempt = 0;
    int restarts = 0;
    long last_http_status = 0;
    SessionPhase phase = SessionPhase::Initiating;
    UploadStatus status = UploadStatus::Pending;
};

struct UploadSessionOptions {
    std::string upload_url;
    std::uint64_t chunk_size = 20 * 1024 * 1024ULL;
    std::uint64_t bandwidth_limit = 0;
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds request_timeout{60};
    RetryPolicy::Options retry;
    int max_session_restarts = 3;
};

// What to send. `source` is not owned and must outlive Run().
struct UploadPayload {
    IByteSource* source = nullptr;
    std::uint64_t total_bytes = 0;
    std::string media_type;
    std::string resource_json;
    std::vector<std::string> parts;
};

struct SessionOutcome {
    std::string resource_id;
    std::string response_body;
    std::uint64_t bytes_sent = 0;
    int restarts = 0;
};

// Drives Initiating -> Uploading -> Completing -> Completed for one payload.
// Single-threaded; the only shared collaborator is the token source.
class UploadSession {
public:
    UploadSession(IHttpTransport& transport,
                  IAccessTokenSource& tokens,
                  IClock& clock,
                  UploadSessionOptions opt);

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    // `progress` and `cancel` may be null. Cancellation is observed before
    // each request, never in the middle of one.
    Expected<SessionOutcome> Run(const UploadPayload& payload,
                                 IProgress* progress,
                                 const std::atomic_bool* cancel);

    const UploadSessionState& State() const { return state_; }

    // Whole-request limit for a chunk of `length` bytes: the base request
    // timeout plus one second per 64 KiB.
    std::chrono::seconds ChunkTimeout(std::uint64_t length) const;

private:
    Expected<std::string> Initiate(const UploadPayload& payload, const std::atomic_bool* cancel);
    Expected<SessionOutcome> Transfer(const UploadPayload& payload,
                                      IProgress* progress,
                                      const std::atomic_bool* cancel);
    Expected<SessionOutcome> Complete(const UploadPayload& payload,
                                      const HttpResponse& resp,
                                      IProgress* progress);

    // Sleeps for the retry delay, or returns the exhaustion error.
    Result Backoff(FailureClass cls, const HttpResponse& resp, const char* what);

    void Report(IProgress* progress, std::uint64_t confirmed, std::uint64_t total);
    void SetPhase(SessionPhase p);

    IHttpTransport& transport_;
    IAccessTokenSource& tokens_;
    IClock& clock_;
    UploadSessionOptions opt_;
    RetryPolicy retry_;

    UploadSessionState state_;
    SteadyTime started_{};
    std::unique_ptr<TokenBucketThrottle> throttle_;
    std::vector<std::uint8_t> buffer_;
};

} // namespace uplink
