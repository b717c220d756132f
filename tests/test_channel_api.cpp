#include "uplink/channel_api.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

constexpr const char* kChannelBody = R"({
  "kind": "youtube#channelListResponse",
  "items": [{
    "id": "UC123",
    "snippet": {
      "title": "Road Trips",
      "description": "Driving around",
      "thumbnails": {"default": {"url": "https://img.test/c.jpg"}}
    },
    "statistics": {"subscriberCount": "1200", "videoCount": "42", "viewCount": "98765"}
  }]
})";

TEST(ChannelApiTests, Urls) {
    EXPECT_EQ(uplink::ChannelsUrl("https://api.test/v3"),
              "https://api.test/v3/channels?part=snippet,statistics&mine=true");
    EXPECT_EQ(uplink::VideoCategoriesUrl("https://api.test/v3", "TH"),
              "https://api.test/v3/videoCategories?part=snippet&regionCode=TH");
}

TEST(ChannelApiTests, ParsesChannel) {
    auto ch = uplink::ParseChannelInfo(kChannelBody);
    ASSERT_TRUE(ch.has_value()) << ch.error().msg;
    EXPECT_EQ(ch->channel_id, "UC123");
    EXPECT_EQ(ch->title, "Road Trips");
    EXPECT_EQ(ch->description, "Driving around");
    EXPECT_EQ(ch->thumbnail_url, "https://img.test/c.jpg");
    EXPECT_EQ(ch->subscriber_count, 1200u);
    EXPECT_EQ(ch->video_count, 42u);
    EXPECT_EQ(ch->view_count, 98765u);
}

TEST(ChannelApiTests, SparseChannelDefaultsMissingFields) {
    auto ch = uplink::ParseChannelInfo(R"({"items":[{"id":"UC9","statistics":{"subscriberCount":"hidden"}}]})");
    ASSERT_TRUE(ch.has_value()) << ch.error().msg;
    EXPECT_EQ(ch->channel_id, "UC9");
    EXPECT_EQ(ch->title, "");
    EXPECT_EQ(ch->subscriber_count, 0u);
}

TEST(ChannelApiTests, ChannelErrors) {
    EXPECT_EQ(uplink::ParseChannelInfo(R"({"items":[]})").error().kind, uplink::ErrorKind::NotFound);
    EXPECT_EQ(uplink::ParseChannelInfo("{}").error().kind, uplink::ErrorKind::NotFound);
    EXPECT_EQ(uplink::ParseChannelInfo("<html>").error().kind, uplink::ErrorKind::CorruptData);
    EXPECT_EQ(uplink::ParseChannelInfo(R"({"items":[{"snippet":{}}]})").error().kind,
              uplink::ErrorKind::CorruptData);
}

TEST(ChannelApiTests, ParsesCategories) {
    auto cats = uplink::ParseVideoCategories(R"({"items":[
        {"id":"10","snippet":{"title":"Music"}},
        {"snippet":{"title":"no id"}},
        {"id":"22","snippet":{"title":"People & Blogs"}}
    ]})");
    ASSERT_TRUE(cats.has_value()) << cats.error().msg;
    ASSERT_EQ(cats->size(), 2u);
    EXPECT_EQ((*cats)[0].id, "10");
    EXPECT_EQ((*cats)[0].title, "Music");
    EXPECT_EQ((*cats)[1].title, "People & Blogs");

    EXPECT_EQ(uplink::ParseVideoCategories("{}").error().kind, uplink::ErrorKind::CorruptData);
    EXPECT_EQ(uplink::ParseVideoCategories("nope").error().kind, uplink::ErrorKind::CorruptData);
}

TEST(ChannelApiTests, DefaultCategoriesIncludeUploadDefault) {
    const auto& defaults = uplink::DefaultVideoCategories();
    EXPECT_EQ(defaults.size(), 32u);
    bool found = false;
    for (const auto& c : defaults) {
        if (c.id == "22") {
            EXPECT_EQ(c.title, "People & Blogs");
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

} // namespace
