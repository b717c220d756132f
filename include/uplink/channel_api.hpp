#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace uplink {

// The authenticated account's channel, from channels.list?mine=true.
struct ChannelInfo {
    std::string channel_id;
    std::string title;
    std::string description;
    std::string thumbnail_url;
    std::uint64_t subscriber_count = 0;
    std::uint64_t video_count = 0;
    std::uint64_t view_count = 0;
};

struct VideoCategory {
    std::string id;
    std::string title;
};

// `api_url` is the data API root, e.g. "https://www.googleapis.com/youtube/v3".
std::string ChannelsUrl(const std::string& api_url);
std::string VideoCategoriesUrl(const std::string& api_url, const std::string& region_code);

// NotFound when the account has no channel; CorruptData when the body does
// not have the expected shape.
Expected<ChannelInfo> ParseChannelInfo(const std::string& body);
Expected<std::vector<VideoCategory>> ParseVideoCategories(const std::string& body);

// Built-in list used when the category listing is unavailable.
const std::vector<VideoCategory>& DefaultVideoCategories();

} // namespace uplink
