#include "auth/token_endpoint.hpp"
#include "testing.hpp"

#include <deque>
#include <gtest/gtest.h>
#include <string>

namespace {

// Replays queued responses and keeps the requests it saw.
class ScriptedTransport final : public uplink::IHttpTransport {
  public:
    uplink::HttpResponse Perform(const uplink::HttpRequest& req) override {
        urls.push_back(req.url);
        bodies.emplace_back(reinterpret_cast<const char*>(req.body.data()), req.body.size());
        content_types.push_back(uplink::FindHeader(req.headers, "content-type").value_or(""));
        if (responses.empty()) return testutil::MakeResponse(500);
        auto r = responses.front();
        responses.pop_front();
        return r;
    }

    std::deque<uplink::HttpResponse> responses;
    std::vector<std::string> urls;
    std::vector<std::string> bodies;
    std::vector<std::string> content_types;
};

uplink::OAuthClientConfig Client() {
    uplink::OAuthClientConfig c;
    c.client_id = "id 1";
    c.client_secret = "s&cret";
    c.auth_uri = "https://accounts.test/o/oauth2/auth";
    c.token_uri = "https://oauth.test/token";
    c.redirect_uri = "http://localhost:8080";
    c.scopes = {"https://www.googleapis.com/auth/youtube.upload",
                "https://www.googleapis.com/auth/youtube"};
    return c;
}

TEST(TokenEndpointTests, ParsesTokenResponse) {
    auto g = uplink::ParseTokenResponse(
        R"({"access_token":"a1","expires_in":3599,"refresh_token":"r1","scope":"s1 s2","token_type":"Bearer"})");
    ASSERT_TRUE(g.has_value()) << g.error().msg;
    EXPECT_EQ(g->access_token, "a1");
    EXPECT_EQ(g->refresh_token, "r1");
    ASSERT_TRUE(g->expires_in.has_value());
    EXPECT_EQ(g->expires_in->count(), 3599);
    EXPECT_EQ(g->scopes, (std::vector<std::string>{"s1", "s2"}));
}

TEST(TokenEndpointTests, ResponseWithoutAccessTokenIsAuthRequired) {
    EXPECT_EQ(uplink::ParseTokenResponse(R"({"expires_in":10})").error().kind,
              uplink::ErrorKind::AuthRequired);
    EXPECT_EQ(uplink::ParseTokenResponse("<html>").error().kind, uplink::ErrorKind::AuthRequired);
}

TEST(TokenEndpointTests, ExchangeCodePostsForm) {
    ScriptedTransport t;
    t.responses.push_back(testutil::MakeResponse(200, R"({"access_token":"a","refresh_token":"r","expires_in":60})"));
    uplink::OAuthTokenClient client(Client(), t);

    auto g = client.ExchangeCode("4/code+x");
    ASSERT_TRUE(g.has_value()) << g.error().msg;
    ASSERT_EQ(t.urls.size(), 1u);
    EXPECT_EQ(t.urls[0], "https://oauth.test/token");
    EXPECT_EQ(t.content_types[0], "application/x-www-form-urlencoded");
    EXPECT_NE(t.bodies[0].find("grant_type=authorization_code"), std::string::npos);
    EXPECT_NE(t.bodies[0].find("code=4%2Fcode%2Bx"), std::string::npos);
    EXPECT_NE(t.bodies[0].find("client_id=id%201"), std::string::npos);
    EXPECT_NE(t.bodies[0].find("client_secret=s%26cret"), std::string::npos);
    EXPECT_NE(t.bodies[0].find("redirect_uri=http%3A%2F%2Flocalhost%3A8080"), std::string::npos);
}

TEST(TokenEndpointTests, RefreshPostsRefreshGrant) {
    ScriptedTransport t;
    t.responses.push_back(testutil::MakeResponse(200, R"({"access_token":"new","expires_in":3600})"));
    uplink::OAuthTokenClient client(Client(), t);

    auto g = client.Refresh("1//rt");
    ASSERT_TRUE(g.has_value());
    EXPECT_EQ(g->access_token, "new");
    EXPECT_TRUE(g->refresh_token.empty());
    EXPECT_NE(t.bodies[0].find("grant_type=refresh_token"), std::string::npos);
    EXPECT_NE(t.bodies[0].find("refresh_token=1%2F%2Frt"), std::string::npos);
}

TEST(TokenEndpointTests, RevokedGrantIsAuthRequired) {
    ScriptedTransport t;
    t.responses.push_back(testutil::MakeResponse(
        400, R"({"error":"invalid_grant","error_description":"Token has been expired or revoked."})"));
    uplink::OAuthTokenClient client(Client(), t);

    auto g = client.Refresh("rt");
    ASSERT_FALSE(g.has_value());
    EXPECT_EQ(g.error().kind, uplink::ErrorKind::AuthRequired);
    EXPECT_EQ(g.error().http_status, 400);
    EXPECT_NE(g.error().msg.find("invalid_grant"), std::string::npos);
}

TEST(TokenEndpointTests, NetworkFailureIsTransient) {
    ScriptedTransport t;
    t.responses.push_back(testutil::NetFailure(uplink::NetError::ConnectFailed));
    uplink::OAuthTokenClient client(Client(), t);

    EXPECT_EQ(client.Refresh("rt").error().kind, uplink::ErrorKind::Transient);
}

TEST(TokenEndpointTests, AuthorizationUrlRequestsOfflineAccess) {
    ScriptedTransport t;
    uplink::OAuthTokenClient client(Client(), t);

    const std::string url = client.AuthorizationUrl("xyz");
    EXPECT_EQ(url.rfind("https://accounts.test/o/oauth2/auth?response_type=code", 0), 0u);
    EXPECT_NE(url.find("access_type=offline"), std::string::npos);
    EXPECT_NE(url.find("prompt=consent"), std::string::npos);
    EXPECT_NE(url.find("include_granted_scopes=true"), std::string::npos);
    EXPECT_NE(url.find("scope=https%3A%2F%2Fwww.googleapis.com%2Fauth%2Fyoutube.upload%20"),
              std::string::npos);
    EXPECT_NE(url.find("&state=xyz"), std::string::npos);
    EXPECT_TRUE(t.urls.empty());
}

} // namespace
