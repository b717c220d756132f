#include "uplink/video_metadata.hpp"

#include "util/text_utils.hpp"
#include "util/time_format.hpp"

#include <array>
#include <cctype>
#include <nlohmann/json.hpp>
#include <utility>

namespace uplink {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<const char*, const char*>, 9> kVideoTypes = {{
    {".mp4", "video/mp4"},
    {".mov", "video/quicktime"},
    {".avi", "video/x-msvideo"},
    {".flv", "video/x-flv"},
    {".wmv", "video/x-ms-wmv"},
    {".webm", "video/webm"},
    {".mkv", "video/x-matroska"},
    {".mpeg", "video/mpeg"},
    {".mpg", "video/mpeg"},
}};

constexpr std::array<std::pair<const char*, const char*>, 4> kImageTypes = {{
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".webp", "image/webp"},
}};

constexpr std::array<std::pair<const char*, const char*>, 9> kLanguages = {{
    {"english", "en"},
    {"thai", "th"},
    {"spanish", "es"},
    {"french", "fr"},
    {"german", "de"},
    {"japanese", "ja"},
    {"korean", "ko"},
    {"chinese", "zh"},
    {"other", "en"},
}};

// Code points, not bytes; continuation bytes are skipped.
size_t Utf8Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

bool AllDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

Result NormalizeMetadata(VideoMetadata& md) {
    md.title = Trim(md.title);
    if (md.title.empty()) md.title = "Untitled";
    if (Utf8Length(md.title) > kMaxTitleChars) {
        return Result::Fail(ErrorKind::InputValidation,
                            "title exceeds " + std::to_string(kMaxTitleChars) + " characters");
    }
    if (md.title.find_first_of("<>") != std::string::npos) {
        return Result::Fail(ErrorKind::InputValidation, "title must not contain '<' or '>'");
    }
    if (md.description.size() > kMaxDescriptionBytes) {
        return Result::Fail(ErrorKind::InputValidation,
                            "description exceeds " + std::to_string(kMaxDescriptionBytes) + " bytes");
    }

    std::vector<std::string> tags;
    for (const auto& t : md.tags) {
        std::string v = Trim(t);
        if (!v.empty()) tags.push_back(std::move(v));
    }
    md.tags = std::move(tags);

    if (md.category_id.empty()) md.category_id = "22";
    if (!AllDigits(md.category_id)) {
        return Result::Fail(ErrorKind::InputValidation,
                            "category id must be numeric: " + md.category_id);
    }

    md.privacy = ToLower(Trim(md.privacy));
    if (md.privacy.empty()) md.privacy = "private";
    if (md.privacy != "public" && md.privacy != "unlisted" && md.privacy != "private") {
        return Result::Fail(ErrorKind::InputValidation,
                            "privacy must be public, unlisted or private: " + md.privacy);
    }
    if (md.publish_at && md.privacy != "private") {
        return Result::Fail(ErrorKind::InputValidation,
                            "scheduled publication requires privacy 'private'");
    }
    return Result::Ok();
}

std::string LanguageCode(const std::string& language) {
    const std::string key = ToLower(Trim(language));
    for (const auto& [name, code] : kLanguages) {
        if (key == name) return code;
    }
    if (key.size() == 2 && std::isalpha(static_cast<unsigned char>(key[0])) &&
        std::isalpha(static_cast<unsigned char>(key[1]))) {
        return key;
    }
    return "en";
}

std::string BuildVideoResourceJson(const VideoMetadata& md) {
    json snippet = {
        {"title", md.title.empty() ? std::string("Untitled") : md.title},
        {"description", md.description},
        {"tags", md.tags},
        {"categoryId", md.category_id},
        {"defaultAudioLanguage", LanguageCode(md.language)},
    };
    json status = {
        {"privacyStatus", md.privacy},
        {"selfDeclaredMadeForKids", md.made_for_kids},
    };
    if (md.publish_at) status["publishAt"] = FormatIso8601Utc(*md.publish_at);

    json body = {{"snippet", std::move(snippet)}, {"status", std::move(status)}};
    if (md.recording_date) {
        body["recordingDetails"] = {{"recordingDate", FormatIso8601Utc(*md.recording_date)}};
    }
    return body.dump();
}

std::vector<std::string> VideoResourceParts(const VideoMetadata& md) {
    std::vector<std::string> parts = {"snippet", "status"};
    if (md.recording_date) parts.push_back("recordingDetails");
    return parts;
}

std::string VideoMediaTypeForPath(const std::string& path) {
    const std::string ext = FileExtensionLower(path);
    for (const auto& [e, type] : kVideoTypes) {
        if (ext == e) return type;
    }
    return {};
}

bool IsAllowedVideoMediaType(const std::string& media_type) {
    const std::string t = ToLower(Trim(media_type));
    for (const auto& entry : kVideoTypes) {
        if (t == entry.second) return true;
    }
    return false;
}

std::string ThumbnailMediaTypeForPath(const std::string& path) {
    const std::string ext = FileExtensionLower(path);
    for (const auto& [e, type] : kImageTypes) {
        if (ext == e) return type;
    }
    return {};
}

} // namespace uplink
