#define _FILE_OFFSET_BITS 64

#include "auth/credential_manager.hpp"
#include "auth/credential_store.hpp"
#include "auth/token_endpoint.hpp"
#include "net/curl_transport.hpp"
#include "system/signals.hpp"
#include "uplink/progress_sinks.hpp"
#include "uplink/upload_coordinator.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"
#include "util/time_format.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "uplink.json";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  auth-url                       Print the consent page URL\n"
        "  authorize --code <code>        Exchange an authorization code and store the credential\n"
        "  status                         Report whether a usable credential is stored\n"
        "  revoke [--forget-key]          Delete the stored credential (and the encryption key)\n"
        "  categories [--region <CC>]     List video category ids (default region US)\n"
        "  upload -i <file> [options]     Upload a video\n"
        "\n"
        "Upload options:\n"
        "  -i, --input <file>             Video file\n"
        "      --title <text>             Title (default: Untitled)\n"
        "      --description <text>       Description\n"
        "      --tags <a,b,c>             Comma separated tags\n"
        "      --category <id>            Numeric category id (default 22)\n"
        "      --privacy <p>              public | unlisted | private (default private)\n"
        "      --language <name|code>     Audio language, e.g. English or th\n"
        "      --recording-date <iso>     Recording date, e.g. 2026-01-31T08:00:00Z\n"
        "      --publish-at <iso>         Scheduled publication (requires private)\n"
        "      --made-for-kids            Declare the video as made for kids\n"
        "      --altered-content <Yes|No> Informational, logged only\n"
        "      --paid-promotion           Informational, logged only\n"
        "      --thumbnail <image>        .jpg/.jpeg/.png/.webp, at most 2 MiB\n"
        "      --bandwidth <bytes/sec>    Upload rate limit (0 = unlimited)\n"
        "      --progress-file <path>     Write progress JSON to this file\n"
        "\n"
        "Global options:\n"
        "  -c, --config <path>            Config file (default %s)\n"
        "  -v, --verbose                  Debug logging\n"
        "  -h, --help                     Show this help\n",
        argv, kDefaultConfigPath);
}

const char *Hint(uplink::ErrorKind kind) {
    using uplink::ErrorKind;
    switch (kind) {
        case ErrorKind::AuthRequired:   return "not authorized; run 'auth-url' and 'authorize --code <code>'";
        case ErrorKind::RateLimited:    return "API quota exhausted; try again later";
        case ErrorKind::CorruptData:    return "stored credential is unreadable; run 'revoke' and authorize again";
        case ErrorKind::StorageError:   return "check permissions of the token directory";
        case ErrorKind::Cancelled:      return "cancelled by signal";
        default:                        return nullptr;
    }
}

int ReportError(const uplink::Error &e) {
    std::fprintf(stderr, "ERROR: %s [%s]\n", e.msg.c_str(), uplink::ErrorKindName(e.kind));
    if (const char *h = Hint(e.kind)) {
        std::fprintf(stderr, "       %s\n", h);
    }
    return 1;
}

bool ParseU64Arg(const char *s, std::uint64_t &out) {
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0' || *s == '-')
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

// Everything a command needs, wired from the loaded configuration.
struct App {
    uplink::config::UploaderConfig cfg;
    std::unique_ptr<uplink::CurlTransport> transport;
    std::unique_ptr<uplink::OAuthTokenClient> oauth;
    std::unique_ptr<uplink::CredentialStore> store;
    std::unique_ptr<uplink::CredentialLifecycleManager> credentials;
    std::unique_ptr<uplink::UploadCoordinator> coordinator;
};

uplink::Result LoadConfig(const std::string &path, bool explicit_path, bool verbose,
                          uplink::config::UploaderConfig &cfg) {
    struct stat st{};
    if (explicit_path || ::stat(path.c_str(), &st) == 0) {
        if (auto r = cfg.LoadFile(path); !r.is_ok())
            return r;
    }
    if (auto r = cfg.ApplyEnvironment(); !r.is_ok())
        return r;
    if (auto r = cfg.Validate(); !r.is_ok())
        return r;

    uplink::LogLevel lvl = uplink::LogLevel::Info;
    if (!uplink::ParseLogLevel(cfg.log_level, lvl))
        lvl = uplink::LogLevel::Info;
    uplink::Logger::Instance().SetLevel(verbose ? uplink::LogLevel::Debug : lvl);
    if (!cfg.log_file.empty() && !uplink::Logger::Instance().SetLogFile(cfg.log_file)) {
        std::fprintf(stderr, "WARN: cannot open log file: %s\n", cfg.log_file.c_str());
    }
    return uplink::Result::Ok();
}

std::unique_ptr<uplink::UploadCoordinator> MakeCoordinator(App &app);

void Wire(App &app) {
    const auto &cfg = app.cfg;

    uplink::OAuthClientConfig client;
    client.client_id = cfg.client_id;
    client.client_secret = cfg.client_secret;
    client.auth_uri = cfg.auth_uri;
    client.token_uri = cfg.token_uri;
    client.redirect_uri = cfg.redirect_uri;
    client.scopes = cfg.scopes;
    client.connect_timeout = std::chrono::seconds(cfg.connect_timeout_sec);
    client.request_timeout = std::chrono::seconds(cfg.request_timeout_sec);

    app.transport = std::make_unique<uplink::CurlTransport>();
    app.oauth = std::make_unique<uplink::OAuthTokenClient>(client, *app.transport);
    app.store = std::make_unique<uplink::CredentialStore>(cfg.CredentialFilePath(), cfg.KeyFilePath());

    uplink::CredentialLifecycleManager::Options copt;
    copt.safety_margin = std::chrono::seconds(cfg.credential_safety_margin_sec);
    app.credentials = std::make_unique<uplink::CredentialLifecycleManager>(
        *app.store, *app.oauth, uplink::SystemClock::Instance(), copt);

    app.coordinator = MakeCoordinator(app);
}

std::unique_ptr<uplink::UploadCoordinator> MakeCoordinator(App &app) {
    const auto &cfg = app.cfg;

    uplink::CoordinatorOptions opt;
    opt.thumbnail_url = cfg.thumbnail_url;
    opt.api_url = cfg.api_url;
    opt.session.upload_url = cfg.upload_url;
    opt.session.chunk_size = cfg.chunk_size_bytes;
    opt.session.bandwidth_limit = cfg.bandwidth_limit_bytes_per_sec;
    opt.session.connect_timeout = std::chrono::seconds(cfg.connect_timeout_sec);
    opt.session.request_timeout = std::chrono::seconds(cfg.request_timeout_sec);
    opt.session.max_session_restarts = static_cast<int>(cfg.max_session_restarts);
    opt.session.retry.max_attempts = static_cast<int>(cfg.max_retry_attempts);
    opt.session.retry.initial_delay =
        std::chrono::milliseconds(static_cast<long long>(cfg.retry_initial_delay_sec * 1000.0));
    opt.session.retry.max_delay =
        std::chrono::milliseconds(static_cast<long long>(cfg.retry_max_delay_sec * 1000.0));
    opt.session.retry.backoff_factor = cfg.retry_backoff_multiplier;

    return std::make_unique<uplink::UploadCoordinator>(
        *app.credentials, *app.transport, uplink::SystemClock::Instance(), opt);
}

int CmdAuthUrl(App &app) {
    if (app.cfg.client_id.empty()) {
        std::fprintf(stderr, "ERROR: ClientId is not configured\n");
        return 1;
    }
    std::printf("%s\n", app.oauth->AuthorizationUrl().c_str());
    return 0;
}

int CmdAuthorize(App &app, int argc, char **argv) {
    const char *code = nullptr;
    static option long_opts[] = {
        {"code", required_argument, nullptr, 'k'},
        {nullptr, 0, nullptr, 0},
    };
    int c;
    while ((c = getopt_long(argc, argv, "k:", long_opts, nullptr)) != -1) {
        if (c == 'k') {
            code = optarg;
        } else {
            return 2;
        }
    }
    if (!code || !*code) {
        std::fprintf(stderr, "authorize: --code is required\n");
        return 2;
    }

    auto cred = app.coordinator->BootstrapCredential(code);
    if (!cred)
        return ReportError(cred.error());

    std::printf("Authorized. Credential stored in %s\n", app.cfg.CredentialFilePath().c_str());
    return 0;
}

int CmdStatus(App &app) {
    auto cred = app.coordinator->AcquireCredential();
    if (!cred) {
        std::printf("Not authenticated (%s)\n", uplink::ErrorKindName(cred.error().kind));
        return 1;
    }
    std::printf("Authenticated\n");
    std::printf("  access token:  %s\n", uplink::MaskSecret(cred->access_token).c_str());
    std::printf("  refreshable:   %s\n", cred->CanRefresh() ? "yes" : "no");
    if (cred->expiry) {
        std::printf("  expires:       %s\n", uplink::FormatIso8601Utc(*cred->expiry).c_str());
    }
    std::printf("  scopes:        %s\n", uplink::Join(cred->scopes, " ").c_str());

    auto channel = app.coordinator->GetChannelInfo();
    if (!channel) {
        std::printf("  API check:     failed\n");
        return ReportError(channel.error());
    }
    std::printf("  channel:       %s (%s)\n", channel->title.c_str(), channel->channel_id.c_str());
    std::printf("  subscribers:   %llu\n", static_cast<unsigned long long>(channel->subscriber_count));
    std::printf("  videos:        %llu\n", static_cast<unsigned long long>(channel->video_count));
    return 0;
}

int CmdCategories(App &app, int argc, char **argv) {
    std::string region = "US";
    static option long_opts[] = {
        {"region", required_argument, nullptr, 'r'},
        {nullptr, 0, nullptr, 0},
    };
    int c;
    while ((c = getopt_long(argc, argv, "r:", long_opts, nullptr)) != -1) {
        if (c == 'r') {
            region = optarg;
        } else {
            return 2;
        }
    }

    auto cats = app.coordinator->VideoCategories(region);
    if (!cats)
        return ReportError(cats.error());
    for (const auto &cat : *cats) {
        std::printf("%4s  %s\n", cat.id.c_str(), cat.title.c_str());
    }
    return 0;
}

int CmdRevoke(App &app, int argc, char **argv) {
    bool forget_key = false;
    static option long_opts[] = {
        {"forget-key", no_argument, nullptr, 'f'},
        {nullptr, 0, nullptr, 0},
    };
    int c;
    while ((c = getopt_long(argc, argv, "f", long_opts, nullptr)) != -1) {
        if (c == 'f') {
            forget_key = true;
        } else {
            return 2;
        }
    }

    if (auto r = app.coordinator->RevokeCredential(forget_key); !r.is_ok())
        return ReportError(r.error);
    std::printf("Credential removed%s\n", forget_key ? " (encryption key deleted)" : "");
    return 0;
}

int CmdUpload(App &app, int argc, char **argv) {
    enum : int {
        kTitle = 1000,
        kDescription,
        kTags,
        kCategory,
        kPrivacy,
        kLanguage,
        kRecordingDate,
        kPublishAt,
        kMadeForKids,
        kAlteredContent,
        kPaidPromotion,
        kThumbnail,
        kBandwidth,
        kProgressFile,
    };
    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"title", required_argument, nullptr, kTitle},
        {"description", required_argument, nullptr, kDescription},
        {"tags", required_argument, nullptr, kTags},
        {"category", required_argument, nullptr, kCategory},
        {"privacy", required_argument, nullptr, kPrivacy},
        {"language", required_argument, nullptr, kLanguage},
        {"recording-date", required_argument, nullptr, kRecordingDate},
        {"publish-at", required_argument, nullptr, kPublishAt},
        {"made-for-kids", no_argument, nullptr, kMadeForKids},
        {"altered-content", required_argument, nullptr, kAlteredContent},
        {"paid-promotion", no_argument, nullptr, kPaidPromotion},
        {"thumbnail", required_argument, nullptr, kThumbnail},
        {"bandwidth", required_argument, nullptr, kBandwidth},
        {"progress-file", required_argument, nullptr, kProgressFile},
        {nullptr, 0, nullptr, 0},
    };

    uplink::UploadTarget target;
    std::string progress_file;

    int c;
    while ((c = getopt_long(argc, argv, "i:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'i':
                target.path = optarg;
                break;
            case kTitle:
                target.metadata.title = optarg;
                break;
            case kDescription:
                target.metadata.description = optarg;
                break;
            case kTags:
                target.metadata.tags = uplink::SplitList(optarg);
                break;
            case kCategory:
                target.metadata.category_id = optarg;
                break;
            case kPrivacy:
                target.metadata.privacy = optarg;
                break;
            case kLanguage:
                target.metadata.language = optarg;
                break;
            case kRecordingDate:
            case kPublishAt: {
                uplink::WallTime t;
                if (!uplink::ParseIso8601Utc(optarg, t)) {
                    std::fprintf(stderr, "Invalid date: %s\n", optarg);
                    return 2;
                }
                if (c == kRecordingDate) {
                    target.metadata.recording_date = t;
                } else {
                    target.metadata.publish_at = t;
                }
                break;
            }
            case kMadeForKids:
                target.metadata.made_for_kids = true;
                break;
            case kAlteredContent:
                target.metadata.altered_content = optarg;
                break;
            case kPaidPromotion:
                target.metadata.paid_promotion = true;
                break;
            case kThumbnail:
                target.thumbnail_path = optarg;
                break;
            case kBandwidth: {
                std::uint64_t v = 0;
                if (!ParseU64Arg(optarg, v)) {
                    std::fprintf(stderr, "Invalid --bandwidth: %s\n", optarg);
                    return 2;
                }
                app.cfg.bandwidth_limit_bytes_per_sec = v;
                break;
            }
            case kProgressFile:
                progress_file = optarg;
                break;
            default:
                return 2;
        }
    }

    if (target.path.empty()) {
        std::fprintf(stderr, "upload: -i <file> is required\n");
        return 2;
    }

    // --bandwidth changes the session options.
    app.coordinator = MakeCoordinator(app);

    uplink::ConsoleProgressSink console;
    std::unique_ptr<uplink::FileProgressSink> file_sink;
    std::vector<uplink::IProgress *> sinks{&console};
    if (!progress_file.empty()) {
        file_sink = std::make_unique<uplink::FileProgressSink>(progress_file);
        sinks.push_back(file_sink.get());
    }
    uplink::FanoutProgress progress(sinks);

    auto out = app.coordinator->Upload(std::move(target), &progress, &uplink::g_cancel);
    uplink::ClearProgressLine();
    if (!out)
        return ReportError(out.error());

    std::printf("Uploaded: %s\n", out->url.c_str());
    std::printf("  id:       %s\n", out->resource_id.c_str());
    std::printf("  title:    %s\n", out->title.c_str());
    std::printf("  size:     %llu bytes\n", static_cast<unsigned long long>(out->file_size));
    if (out->restarts > 0) {
        std::printf("  restarts: %d\n", out->restarts);
    }
    for (const auto &w : out->warnings) {
        std::fprintf(stderr, "WARN: %s\n", w.c_str());
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    uplink::InstallSignalHandlers();

    std::string config_path = kDefaultConfigPath;
    bool explicit_config = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // '+' stops at the command name; its options are parsed separately.
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "+hvc:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                explicit_config = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[optind];
    const int sub_argc = argc - optind;
    char **sub_argv = argv + optind;
    optind = 0;

    App app;
    if (auto r = LoadConfig(config_path, explicit_config, verbose, app.cfg); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
        return 1;
    }
    Wire(app);

    int rc = 2;
    if (command == "auth-url") {
        rc = CmdAuthUrl(app);
    } else if (command == "authorize") {
        rc = CmdAuthorize(app, sub_argc, sub_argv);
    } else if (command == "status") {
        rc = CmdStatus(app);
    } else if (command == "revoke") {
        rc = CmdRevoke(app, sub_argc, sub_argv);
    } else if (command == "categories") {
        rc = CmdCategories(app, sub_argc, sub_argv);
    } else if (command == "upload") {
        rc = CmdUpload(app, sub_argc, sub_argv);
    } else {
        std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
        PrintUsage(argv[0]);
        return 2;
    }

    if (rc == 2) {
        PrintUsage(argv[0]);
    }
    return rc;
}
