#pragma once

#include "util/clock.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uplink {

inline constexpr std::uint64_t kMaxVideoBytes = 256ULL * 1024 * 1024 * 1024;
inline constexpr std::uint64_t kMaxThumbnailBytes = 2ULL * 1024 * 1024;
inline constexpr size_t kMaxTitleChars = 100;
inline constexpr size_t kMaxDescriptionBytes = 5000;

struct VideoMetadata {
    std::string title;
    std::string description;
    std::vector<std::string> tags;
    std::string category_id = "22";
    std::string privacy = "private";
    // Display name ("English", "Thai", ...) or an ISO 639-1 code.
    std::string language = "English";
    bool made_for_kids = false;
    std::optional<WallTime> recording_date;
    std::optional<WallTime> publish_at;

    // Not accepted by the API at upload time; logged only.
    std::string altered_content = "No";
    bool paid_promotion = false;
};

// Fills defaults (empty title -> "Untitled") and checks every field.
// Errors are InputValidation.
Result NormalizeMetadata(VideoMetadata& md);

// "English" -> "en"; unknown names fall back to "en". Two-letter codes pass through.
std::string LanguageCode(const std::string& language);

// Request body for the initiate POST and the `part` list naming its sections.
std::string BuildVideoResourceJson(const VideoMetadata& md);
std::vector<std::string> VideoResourceParts(const VideoMetadata& md);

// Allow-listed media type for a video file extension, or empty.
std::string VideoMediaTypeForPath(const std::string& path);
bool IsAllowedVideoMediaType(const std::string& media_type);

// Allow-listed image type for a thumbnail extension, or empty.
std::string ThumbnailMediaTypeForPath(const std::string& path);

} // namespace uplink
