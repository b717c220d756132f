#pragma once

#include "auth/credential_manager.hpp"
#include "net/http.hpp"
#include "uplink/channel_api.hpp"
#include "uplink/progress.hpp"
#include "uplink/upload_session.hpp"
#include "uplink/video_metadata.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uplink {

inline constexpr const char* kWatchUrlPrefix = "https://www.youtube.com/watch?v=";

struct UploadTarget {
    std::string path;
    // Expected byte length; checked against the file when set.
    std::optional<std::uint64_t> declared_length;
    // Empty means inferred from the file extension.
    std::string media_type;
    VideoMetadata metadata;
    std::string thumbnail_path;
};

struct UploadOutcome {
    std::string resource_id;
    std::string url;
    std::string title;
    std::uint64_t file_size = 0;
    int restarts = 0;
    // Non-fatal problems, e.g. a thumbnail that could not be attached.
    std::vector<std::string> warnings;
};

struct CoordinatorOptions {
    UploadSessionOptions session;
    std::string thumbnail_url;
    std::string api_url;
};

class UploadCoordinator {
public:
    UploadCoordinator(CredentialLifecycleManager& credentials,
                      IHttpTransport& transport,
                      IClock& clock,
                      CoordinatorOptions opt);

    // Validates the target, acquires a credential and drives one session.
    // Nothing touches the network until validation has passed.
    Expected<UploadOutcome> Upload(UploadTarget target,
                                   IProgress* progress,
                                   const std::atomic_bool* cancel);

    Expected<Credential> AcquireCredential();
    Expected<Credential> BootstrapCredential(const std::string& authorization_code);
    Result RevokeCredential(bool forget_key = false);

    // One authenticated channels.list call. Proves the stored credential is
    // accepted by the API, not just present on disk.
    Expected<ChannelInfo> GetChannelInfo();
    Result TestConnection();

    // Categories assignable in `region_code`. API failures other than
    // AuthRequired fall back to DefaultVideoCategories() with a warning.
    Expected<std::vector<VideoCategory>> VideoCategories(const std::string& region_code = "US");

private:
    Result AttachThumbnail(const std::string& resource_id, const std::string& path);
    Expected<HttpResponse> AuthorizedGet(const std::string& url, const char* what);

    CredentialLifecycleManager& credentials_;
    IHttpTransport& transport_;
    IClock& clock_;
    CoordinatorOptions opt_;
};

} // namespace uplink
