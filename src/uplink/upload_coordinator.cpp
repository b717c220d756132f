#include "uplink/upload_coordinator.hpp"

#include "io/file_source.hpp"
#include "uplink/resumable_protocol.hpp"
#include "uplink/retry_policy.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

#include <cstdio>

namespace uplink {

namespace {

std::string HumanSize(std::uint64_t n) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f MiB", static_cast<double>(n) / (1024.0 * 1024.0));
    return buf;
}

} // namespace

UploadCoordinator::UploadCoordinator(CredentialLifecycleManager& credentials,
                                     IHttpTransport& transport,
                                     IClock& clock,
                                     CoordinatorOptions opt)
    : credentials_(credentials), transport_(transport), clock_(clock), opt_(std::move(opt)) {}

Expected<Credential> UploadCoordinator::AcquireCredential() { return credentials_.Acquire(); }

Expected<Credential> UploadCoordinator::BootstrapCredential(const std::string& authorization_code) {
    return credentials_.Bootstrap(authorization_code);
}

Result UploadCoordinator::RevokeCredential(bool forget_key) {
    return credentials_.Revoke(forget_key);
}

Expected<HttpResponse> UploadCoordinator::AuthorizedGet(const std::string& url, const char* what) {
    auto token = credentials_.AccessToken();
    if (!token) return std::unexpected(token.error());

    HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.headers = {
        {"Authorization", "Bearer " + *token},
        {"Accept", "application/json"},
    };
    req.connect_timeout = opt_.session.connect_timeout;
    req.total_timeout = opt_.session.request_timeout;

    HttpResponse resp = transport_.Perform(req);
    if (!resp.Delivered()) {
        return Fail(ErrorKind::Transient,
                    std::string(what) + ": " + NetErrorName(resp.net_error) + ": " +
                        resp.net_error_msg);
    }
    if (resp.status == 200) return resp;

    const std::string msg = std::string(what) + ": HTTP " + std::to_string(resp.status) + ": " +
                            resumable::ExtractApiErrorMessage(resp.body);
    ErrorKind kind = ErrorKind::UploadFailed;
    if (resp.status == 401) {
        kind = ErrorKind::AuthRequired;
    } else {
        switch (RetryPolicy::Classify(resp, resumable::ExtractApiErrorReason(resp.body))) {
            case FailureClass::RateLimited: kind = ErrorKind::RateLimited; break;
            case FailureClass::Transient:   kind = ErrorKind::Transient; break;
            case FailureClass::Fatal:       break;
        }
    }
    return std::unexpected(Error(kind, msg).WithHttpStatus(resp.status));
}

Expected<ChannelInfo> UploadCoordinator::GetChannelInfo() {
    auto resp = AuthorizedGet(ChannelsUrl(opt_.api_url), "channel lookup");
    if (!resp) {
        LogError("Failed to get channel info: %s", resp.error().msg.c_str());
        return std::unexpected(resp.error());
    }
    return ParseChannelInfo(resp->body);
}

Result UploadCoordinator::TestConnection() {
    auto ch = GetChannelInfo();
    if (!ch) {
        LogError("Connection test failed: %s", ch.error().msg.c_str());
        return Result::Fail(ch.error());
    }
    LogInfo("Connection test successful. Channel: %s", ch->title.c_str());
    return Result::Ok();
}

Expected<std::vector<VideoCategory>> UploadCoordinator::VideoCategories(const std::string& region_code) {
    auto resp = AuthorizedGet(VideoCategoriesUrl(opt_.api_url, region_code), "category listing");
    if (!resp) {
        if (resp.error().kind == ErrorKind::AuthRequired) return std::unexpected(resp.error());
        LogWarn("Failed to get video categories, using built-in list: %s", resp.error().msg.c_str());
        return DefaultVideoCategories();
    }
    auto cats = ParseVideoCategories(resp->body);
    if (!cats || cats->empty()) {
        LogWarn("Category listing unusable, using built-in list");
        return DefaultVideoCategories();
    }
    LogInfo("Retrieved %zu video categories", cats->size());
    return cats;
}

Expected<UploadOutcome> UploadCoordinator::Upload(UploadTarget target,
                                                  IProgress* progress,
                                                  const std::atomic_bool* cancel) {
    if (Result r = NormalizeMetadata(target.metadata); !r.is_ok()) {
        return std::unexpected(r.error);
    }

    FileSource source;
    if (Result r = FileSource::Open(target.path, source); !r.is_ok()) {
        return std::unexpected(r.error);
    }
    const std::uint64_t size = source.Size();
    if (size == 0) {
        return Fail(ErrorKind::InputValidation, "File is empty: " + target.path);
    }
    if (size > kMaxVideoBytes) {
        return Fail(ErrorKind::InputValidation,
                    "File too large: " + HumanSize(size) + " (limit 256 GiB)");
    }

    std::string media_type = Trim(target.media_type);
    if (media_type.empty()) {
        media_type = VideoMediaTypeForPath(target.path);
        if (media_type.empty()) {
            return Fail(ErrorKind::InputValidation,
                        "Unsupported video format '" + FileExtensionLower(target.path) +
                            "' (supported: .mp4 .mov .avi .flv .wmv .webm .mkv .mpeg .mpg)");
        }
    } else if (!IsAllowedVideoMediaType(media_type)) {
        return Fail(ErrorKind::InputValidation, "Unsupported media type: " + media_type);
    }

    if (target.declared_length && *target.declared_length != size) {
        return Fail(ErrorKind::InputValidation,
                    "Declared length " + std::to_string(*target.declared_length) +
                        " does not match file size " + std::to_string(size));
    }

    auto credential = credentials_.Acquire();
    if (!credential) return std::unexpected(credential.error());

    const VideoMetadata& md = target.metadata;
    if (md.altered_content != "No" || md.paid_promotion) {
        LogInfo("Altered content: %s, paid promotion: %s (set these in the web console after upload)",
                md.altered_content.c_str(),
                md.paid_promotion ? "yes" : "no");
    }

    // The file may have changed while we were authenticating.
    std::uint64_t current = 0;
    if (Result r = source.CurrentSize(current); !r.is_ok()) {
        return std::unexpected(r.error);
    }
    if (current != size) {
        return Fail(ErrorKind::InputValidation,
                    "File size changed from " + std::to_string(size) + " to " +
                        std::to_string(current) + " before upload");
    }

    UploadPayload payload;
    payload.source = &source;
    payload.total_bytes = size;
    payload.media_type = media_type;
    payload.resource_json = BuildVideoResourceJson(md);
    payload.parts = VideoResourceParts(md);

    LogInfo("Starting upload: %s (%s, %s)",
            target.path.c_str(),
            HumanSize(size).c_str(),
            media_type.c_str());

    UploadSession session(transport_, credentials_, clock_, opt_.session);
    auto done = session.Run(payload, progress, cancel);
    if (!done) {
        const Error& e = done.error();
        LogError("Upload %s: %s (%s)",
                 SessionPhaseName(session.State().phase),
                 e.msg.c_str(),
                 ErrorKindName(e.kind));
        return std::unexpected(e);
    }

    UploadOutcome out;
    out.resource_id = done->resource_id;
    out.url = kWatchUrlPrefix + done->resource_id;
    out.title = md.title;
    out.file_size = size;
    out.restarts = done->restarts;

    if (!target.thumbnail_path.empty()) {
        Result t = AttachThumbnail(out.resource_id, target.thumbnail_path);
        if (!t.is_ok()) {
            LogWarn("Video uploaded without thumbnail: %s", t.message().c_str());
            out.warnings.push_back("thumbnail not attached: " + t.message());
        }
    }

    LogInfo("Video uploaded: %s", out.url.c_str());
    return out;
}

Result UploadCoordinator::AttachThumbnail(const std::string& resource_id, const std::string& path) {
    const std::string image_type = ThumbnailMediaTypeForPath(path);
    if (image_type.empty()) {
        return Result::Fail(ErrorKind::InputValidation,
                            "Unsupported thumbnail format '" + FileExtensionLower(path) +
                                "' (supported: .jpg .jpeg .png .webp)");
    }

    std::vector<std::uint8_t> image;
    if (Result r = ReadWholeFile(path, image); !r.is_ok()) {
        return r;
    }
    if (image.empty()) {
        return Result::Fail(ErrorKind::InputValidation, "Thumbnail is empty: " + path);
    }
    if (image.size() > kMaxThumbnailBytes) {
        return Result::Fail(ErrorKind::InputValidation,
                            "Thumbnail is " + HumanSize(image.size()) + "; the limit is 2 MiB");
    }

    auto token = credentials_.AccessToken();
    if (!token) return Result::Fail(token.error());

    HttpRequest req;
    req.method = "POST";
    req.url = opt_.thumbnail_url + "?videoId=" + UrlEncode(resource_id) + "&uploadType=media";
    req.headers = {
        {"Authorization", "Bearer " + *token},
        {"Content-Type", image_type},
    };
    req.body = image;
    req.connect_timeout = opt_.session.connect_timeout;
    req.total_timeout = opt_.session.request_timeout;

    const HttpResponse resp = transport_.Perform(req);
    if (!resp.Delivered()) {
        return Result::Fail(ErrorKind::Transient,
                            std::string("thumbnail upload: ") + NetErrorName(resp.net_error) +
                                ": " + resp.net_error_msg);
    }
    if (resp.status != 200 && resp.status != 201) {
        return Result::Fail(Error(ErrorKind::UploadFailed,
                                  "thumbnail upload: HTTP " + std::to_string(resp.status) + ": " +
                                      resumable::ExtractApiErrorMessage(resp.body))
                                .WithHttpStatus(resp.status));
    }
    LogInfo("Thumbnail attached to %s", resource_id.c_str());
    return Result::Ok();
}

} // namespace uplink
