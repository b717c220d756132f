#include "uplink/channel_api.hpp"

#include "util/text_utils.hpp"

#include <charconv>
#include <nlohmann/json.hpp>

namespace uplink {

using json = nlohmann::json;

namespace {

// Counts arrive as decimal strings ("subscriberCount": "1200").
std::uint64_t CountField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (it->is_number_unsigned()) return it->get<std::uint64_t>();
    if (!it->is_string()) return 0;
    const std::string s = it->get<std::string>();
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    return (ec == std::errc() && ptr == s.data() + s.size()) ? v : 0;
}

const json* Items(const json& j) {
    if (!j.is_object()) return nullptr;
    auto it = j.find("items");
    if (it == j.end() || !it->is_array()) return nullptr;
    return &*it;
}

} // namespace

std::string ChannelsUrl(const std::string& api_url) {
    return api_url + "/channels?part=snippet,statistics&mine=true";
}

std::string VideoCategoriesUrl(const std::string& api_url, const std::string& region_code) {
    return api_url + "/videoCategories?part=snippet&regionCode=" + UrlEncode(region_code);
}

Expected<ChannelInfo> ParseChannelInfo(const std::string& body) {
    try {
        const json j = json::parse(body);
        const json* items = Items(j);
        if (!items || items->empty()) {
            return Fail(ErrorKind::NotFound, "No channel is associated with this account");
        }
        const json& ch = items->front();
        if (!ch.is_object() || !ch.contains("id") || !ch["id"].is_string()) {
            return Fail(ErrorKind::CorruptData, "channel entry has no id");
        }

        ChannelInfo out;
        out.channel_id = ch["id"].get<std::string>();
        if (auto sn = ch.find("snippet"); sn != ch.end() && sn->is_object()) {
            out.title = sn->value("title", "");
            out.description = sn->value("description", "");
            out.thumbnail_url = sn->value(json::json_pointer("/thumbnails/default/url"), "");
        }
        if (auto st = ch.find("statistics"); st != ch.end() && st->is_object()) {
            out.subscriber_count = CountField(*st, "subscriberCount");
            out.video_count = CountField(*st, "videoCount");
            out.view_count = CountField(*st, "viewCount");
        }
        return out;
    } catch (const json::exception& e) {
        return Fail(ErrorKind::CorruptData, std::string("channel response is not valid: ") + e.what());
    }
}

Expected<std::vector<VideoCategory>> ParseVideoCategories(const std::string& body) {
    try {
        const json j = json::parse(body);
        const json* items = Items(j);
        if (!items) return Fail(ErrorKind::CorruptData, "category response has no items");

        std::vector<VideoCategory> out;
        for (const auto& item : *items) {
            if (!item.is_object()) continue;
            VideoCategory c;
            c.id = item.value("id", "");
            c.title = item.value(json::json_pointer("/snippet/title"), "");
            if (!c.id.empty()) out.push_back(std::move(c));
        }
        return out;
    } catch (const json::exception& e) {
        return Fail(ErrorKind::CorruptData, std::string("category response is not valid: ") + e.what());
    }
}

const std::vector<VideoCategory>& DefaultVideoCategories() {
    static const std::vector<VideoCategory> kDefaults = {
        {"1", "Film & Animation"},
        {"2", "Autos & Vehicles"},
        {"10", "Music"},
        {"15", "Pets & Animals"},
        {"17", "Sports"},
        {"18", "Short Movies"},
        {"19", "Travel & Events"},
        {"20", "Gaming"},
        {"21", "Videoblogging"},
        {"22", "People & Blogs"},
        {"23", "Comedy"},
        {"24", "Entertainment"},
        {"25", "News & Politics"},
        {"26", "Howto & Style"},
        {"27", "Education"},
        {"28", "Science & Technology"},
        {"29", "Nonprofits & Activism"},
        {"30", "Movies"},
        {"31", "Anime/Animation"},
        {"32", "Action/Adventure"},
        {"33", "Classics"},
        {"34", "Comedy"},
        {"35", "Documentary"},
        {"36", "Drama"},
        {"37", "Family"},
        {"38", "Foreign"},
        {"39", "Horror"},
        {"40", "Sci-Fi/Fantasy"},
        {"41", "Thriller"},
        {"42", "Shorts"},
        {"43", "Shows"},
        {"44", "Trailers"},
    };
    return kDefaults;
}

} // namespace uplink
