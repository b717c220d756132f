#include "uplink/upload_session.hpp"

#include "io/file_source.hpp"
#include "uplink/resumable_protocol.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <exception>

namespace uplink {

namespace {

bool IsCancelled(const std::atomic_bool* cancel) {
    return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

bool IsFinal(const HttpResponse& resp) {
    return resp.Delivered() && (resp.status == 200 || resp.status == 201);
}

std::string Describe(const HttpResponse& resp) {
    if (!resp.Delivered()) {
        return std::string(NetErrorName(resp.net_error)) + ": " + resp.net_error_msg;
    }
    return "HTTP " + std::to_string(resp.status) + ": " +
           resumable::ExtractApiErrorMessage(resp.body);
}

std::string BearerHeader(const std::string& token) { return "Bearer " + token; }

} // namespace

const char* SessionPhaseName(SessionPhase p) {
    switch (p) {
        case SessionPhase::Initiating: return "initiating";
        case SessionPhase::Uploading:  return "uploading";
        case SessionPhase::Completing: return "completing";
        case SessionPhase::Completed:  return "completed";
        case SessionPhase::Failed:     return "failed";
        case SessionPhase::Cancelled:  return "cancelled";
    }
    return "unknown";
}

const char* UploadStatusName(UploadStatus s) {
    switch (s) {
        case UploadStatus::Pending:    return "pending";
        case UploadStatus::InProgress: return "in-progress";
        case UploadStatus::Completed:  return "completed";
        case UploadStatus::Failed:     return "failed";
        case UploadStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

UploadSession::UploadSession(IHttpTransport& transport,
                             IAccessTokenSource& tokens,
                             IClock& clock,
                             UploadSessionOptions opt)
    : transport_(transport), tokens_(tokens), clock_(clock), opt_(std::move(opt)),
      retry_(opt_.retry) {
    opt_.chunk_size = std::max<std::uint64_t>(opt_.chunk_size, 1);
    opt_.max_session_restarts = std::max(0, opt_.max_session_restarts);
    state_.chunk_size = opt_.chunk_size;
    state_.throttle_rate = opt_.bandwidth_limit;
}

std::chrono::seconds UploadSession::ChunkTimeout(std::uint64_t length) const {
    if (opt_.request_timeout.count() <= 0) return std::chrono::seconds(0);
    return opt_.request_timeout + std::chrono::seconds(length / (64 * 1024));
}

void UploadSession::SetPhase(SessionPhase p) {
    state_.phase = p;
    switch (p) {
        case SessionPhase::Initiating:
        case SessionPhase::Uploading:
        case SessionPhase::Completing:
            state_.status = UploadStatus::InProgress;
            break;
        case SessionPhase::Completed:
            state_.status = UploadStatus::Completed;
            break;
        case SessionPhase::Failed:
            state_.status = UploadStatus::Failed;
            break;
        case SessionPhase::Cancelled:
            state_.status = UploadStatus::Cancelled;
            break;
    }
}

void UploadSession::Report(IProgress* progress, std::uint64_t confirmed, std::uint64_t total) {
    if (!progress) return;
    ProgressEvent e;
    e.bytes_confirmed = confirmed;
    e.total_bytes = total;
    e.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.Now() - started_);
    try {
        progress->OnProgress(e);
    } catch (const std::exception& ex) {
        LogWarn("Progress sink threw, ignoring: %s", ex.what());
    } catch (...) {
        LogWarn("Progress sink threw a non-standard exception, ignoring");
    }
}

Result UploadSession::Backoff(FailureClass cls, const HttpResponse& resp, const char* what) {
    ++state_.attempt;
    const RetryDecision d = retry_.Decide(cls, state_.attempt);
    if (!d.retry) {
        const ErrorKind kind =
            cls == FailureClass::RateLimited ? ErrorKind::RateLimited : ErrorKind::UploadFailed;
        Error e(kind, std::string(what) + " failed after " + std::to_string(state_.attempt) +
                          " attempts: " + Describe(resp));
        e.WithAttempts(state_.attempt).WithHttpStatus(resp.status).WithOffset(state_.bytes_confirmed);
        return Result::Fail(std::move(e));
    }

    LogWarn("%s: %s (%s), retrying in %lld ms",
            what,
            Describe(resp).c_str(),
            d.reason.c_str(),
            static_cast<long long>(d.delay.count()));
    clock_.SleepFor(d.delay);
    return Result::Ok();
}

Expected<SessionOutcome> UploadSession::Run(const UploadPayload& payload,
                                            IProgress* progress,
                                            const std::atomic_bool* cancel) {
    state_ = UploadSessionState{};
    state_.chunk_size = opt_.chunk_size;
    state_.throttle_rate = opt_.bandwidth_limit;
    started_ = clock_.Now();

    if (payload.source == nullptr) {
        return Fail(ErrorKind::InputValidation, "upload has no source");
    }
    if (payload.source->Size() != payload.total_bytes) {
        SetPhase(SessionPhase::Failed);
        return Fail(ErrorKind::InputValidation,
                    "declared length " + std::to_string(payload.total_bytes) +
                        " does not match source length " +
                        std::to_string(payload.source->Size()));
    }

    throttle_ = std::make_unique<TokenBucketThrottle>(opt_.bandwidth_limit, opt_.chunk_size, clock_);
    buffer_.resize(static_cast<size_t>(std::min(opt_.chunk_size, payload.total_bytes)));

    while (true) {
        SetPhase(SessionPhase::Initiating);
        state_.session_url.clear();
        state_.bytes_confirmed = 0;
        state_.attempt = 0;

        auto url = Initiate(payload, cancel);
        if (!url) {
            SetPhase(url.error().kind == ErrorKind::Cancelled ? SessionPhase::Cancelled
                                                              : SessionPhase::Failed);
            return std::unexpected(url.error());
        }
        state_.session_url = *url;
        SetPhase(SessionPhase::Uploading);

        auto out = Transfer(payload, progress, cancel);
        if (out) {
            SetPhase(SessionPhase::Completed);
            return out;
        }

        Error err = out.error();
        if (err.kind == ErrorKind::SessionExpired) {
            if (state_.restarts >= opt_.max_session_restarts) {
                SetPhase(SessionPhase::Failed);
                Error e(ErrorKind::UploadFailed,
                        "upload session expired " + std::to_string(state_.restarts + 1) +
                            " times; giving up");
                e.WithHttpStatus(err.http_status).WithOffset(err.offset);
                return std::unexpected(std::move(e));
            }
            ++state_.restarts;
            LogWarn("Upload session expired at byte %llu (HTTP %ld); restarting (%d of %d)",
                    static_cast<unsigned long long>(err.offset),
                    err.http_status,
                    state_.restarts,
                    opt_.max_session_restarts);
            continue;
        }

        SetPhase(err.kind == ErrorKind::Cancelled ? SessionPhase::Cancelled : SessionPhase::Failed);
        return std::unexpected(std::move(err));
    }
}

Expected<std::string> UploadSession::Initiate(const UploadPayload& payload,
                                              const std::atomic_bool* cancel) {
    const std::string url = resumable::InitiateUrl(opt_.upload_url, payload.parts);
    state_.attempt = 0;

    while (true) {
        if (IsCancelled(cancel)) {
            return Fail(ErrorKind::Cancelled, "upload cancelled before the session started");
        }

        auto token = tokens_.AccessToken();
        if (!token) return std::unexpected(token.error());

        HttpRequest req;
        req.method = "POST";
        req.url = url;
        req.headers = {
            {"Authorization", BearerHeader(*token)},
            {"Content-Type", "application/json; charset=UTF-8"},
            {"X-Upload-Content-Length", std::to_string(payload.total_bytes)},
            {"X-Upload-Content-Type", payload.media_type},
        };
        req.body = AsBytes(payload.resource_json);
        req.connect_timeout = opt_.connect_timeout;
        req.total_timeout = opt_.request_timeout;

        LogDebug("Initiating resumable session (%llu bytes, %s)",
                 static_cast<unsigned long long>(payload.total_bytes),
                 payload.media_type.c_str());
        const HttpResponse resp = transport_.Perform(req);
        state_.last_http_status = resp.status;

        if (!resp.Delivered()) {
            return std::unexpected(
                Error(ErrorKind::UploadFailed, "session initiation failed: " + Describe(resp)));
        }
        if (resp.status == 200 || resp.status == 201) {
            auto location = resp.Header("Location");
            if (!location || location->empty()) {
                return std::unexpected(Error(ErrorKind::UploadFailed,
                                             "session initiation returned no Location header")
                                           .WithHttpStatus(resp.status));
            }
            LogInfo("Resumable session started");
            state_.attempt = 0;
            return *location;
        }
        if (resp.status == 401) {
            return std::unexpected(
                Error(ErrorKind::AuthRequired, "session initiation rejected: " + Describe(resp))
                    .WithHttpStatus(resp.status));
        }

        const FailureClass cls =
            RetryPolicy::Classify(resp, resumable::ExtractApiErrorReason(resp.body));
        if (cls == FailureClass::Fatal || (resp.status < 500 && cls != FailureClass::RateLimited)) {
            return std::unexpected(
                Error(ErrorKind::UploadFailed, "session initiation rejected: " + Describe(resp))
                    .WithHttpStatus(resp.status));
        }

        Result b = Backoff(cls, resp, "session initiation");
        if (!b.is_ok()) return std::unexpected(b.error);
    }
}

Expected<SessionOutcome> UploadSession::Transfer(const UploadPayload& payload,
                                                 IProgress* progress,
                                                 const std::atomic_bool* cancel) {
    const std::uint64_t total = payload.total_bytes;
    ByteRangeChunker chunker(total, opt_.chunk_size);

    while (true) {
        // Everything confirmed but no final response yet: ask for status.
        ByteRange range{total, 0};
        if (auto next = chunker.Next()) range = *next;

        while (true) {
            if (IsCancelled(cancel)) {
                return std::unexpected(Error(ErrorKind::Cancelled, "upload cancelled")
                                           .WithOffset(state_.bytes_confirmed));
            }

            std::span<const std::uint8_t> body;
            if (range.length > 0) {
                std::span<std::uint8_t> view(buffer_.data(), static_cast<size_t>(range.length));
                Result rd = ReadExactAt(*payload.source, range.offset, view);
                if (!rd.is_ok()) {
                    return std::unexpected(rd.error.WithOffset(range.offset));
                }
                throttle_->Acquire(range.length);
                body = view;
            }

            auto token = tokens_.AccessToken();
            if (!token) {
                Error e = token.error();
                return std::unexpected(e.WithOffset(state_.bytes_confirmed));
            }

            HttpRequest req;
            req.method = "PUT";
            req.url = state_.session_url;
            req.headers = {
                {"Authorization", BearerHeader(*token)},
                {"Content-Range", resumable::ContentRange(range, total)},
                {"Content-Type", payload.media_type},
            };
            req.body = body;
            req.connect_timeout = opt_.connect_timeout;
            req.total_timeout = ChunkTimeout(range.length);

            LogDebug("PUT %s (attempt %d)",
                     resumable::ContentRange(range, total).c_str(),
                     state_.attempt + 1);
            const HttpResponse resp = transport_.Perform(req);
            state_.last_http_status = resp.status;

            if (IsFinal(resp)) {
                return Complete(payload, resp, progress);
            }

            if (resp.Delivered() && resp.status == resumable::kResumeIncomplete) {
                std::uint64_t confirmed = 0;
                if (auto hdr = resp.Header("Range")) {
                    if (!resumable::ParseConfirmedBytes(*hdr, confirmed)) {
                        return std::unexpected(
                            Error(ErrorKind::UploadFailed, "unparsable Range header: " + *hdr)
                                .WithHttpStatus(resp.status)
                                .WithOffset(state_.bytes_confirmed));
                    }
                }
                if (confirmed < state_.bytes_confirmed || confirmed > range.End()) {
                    return std::unexpected(
                        Error(ErrorKind::UploadFailed,
                              "server confirmed " + std::to_string(confirmed) +
                                  " bytes; expected between " +
                                  std::to_string(state_.bytes_confirmed) + " and " +
                                  std::to_string(range.End()))
                            .WithHttpStatus(resp.status)
                            .WithOffset(state_.bytes_confirmed));
                }

                if (confirmed > state_.bytes_confirmed) {
                    if (confirmed < range.End()) {
                        LogInfo("Server kept %llu of %llu bytes sent; resuming at %llu",
                                static_cast<unsigned long long>(confirmed - range.offset),
                                static_cast<unsigned long long>(range.length),
                                static_cast<unsigned long long>(confirmed));
                    }
                    state_.bytes_confirmed = confirmed;
                    state_.attempt = 0;
                    chunker.Seek(confirmed);
                    Report(progress, confirmed, total);
                    break;
                }

                Result b = Backoff(FailureClass::Transient, resp, "chunk upload");
                if (!b.is_ok()) return std::unexpected(b.error);
                continue;
            }

            if (resp.Delivered() && (resp.status == 404 || resp.status == 410)) {
                return std::unexpected(Error(ErrorKind::SessionExpired, "upload session expired")
                                           .WithHttpStatus(resp.status)
                                           .WithOffset(state_.bytes_confirmed));
            }
            if (resp.Delivered() && resp.status == 401) {
                return std::unexpected(
                    Error(ErrorKind::AuthRequired, "chunk rejected: " + Describe(resp))
                        .WithHttpStatus(resp.status)
                        .WithOffset(state_.bytes_confirmed));
            }

            const std::string reason =
                resp.Delivered() ? resumable::ExtractApiErrorReason(resp.body) : std::string();
            const FailureClass cls = RetryPolicy::Classify(resp, reason);
            if (cls == FailureClass::Fatal) {
                return std::unexpected(
                    Error(ErrorKind::UploadFailed, "chunk rejected: " + Describe(resp))
                        .WithAttempts(state_.attempt + 1)
                        .WithHttpStatus(resp.status)
                        .WithOffset(state_.bytes_confirmed));
            }

            Result b = Backoff(cls, resp, "chunk upload");
            if (!b.is_ok()) return std::unexpected(b.error);
        }
    }
}

Expected<SessionOutcome> UploadSession::Complete(const UploadPayload& payload,
                                                 const HttpResponse& resp,
                                                 IProgress* progress) {
    SetPhase(SessionPhase::Completing);

    auto id = resumable::ParseResourceId(resp.body);
    if (!id) {
        Error e = id.error();
        return std::unexpected(e.WithHttpStatus(resp.status).WithOffset(state_.bytes_confirmed));
    }

    if (state_.bytes_confirmed < payload.total_bytes || payload.total_bytes == 0) {
        state_.bytes_confirmed = payload.total_bytes;
        Report(progress, payload.total_bytes, payload.total_bytes);
    }
    state_.attempt = 0;

    LogInfo("Upload complete: resource %s (%llu bytes, %d restart(s))",
            id->c_str(),
            static_cast<unsigned long long>(payload.total_bytes),
            state_.restarts);

    SessionOutcome out;
    out.resource_id = *id;
    out.response_body = resp.body;
    out.bytes_sent = payload.total_bytes;
    out.restarts = state_.restarts;
    return out;
}

} // namespace uplink
