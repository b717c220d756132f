#include "auth/token_endpoint.hpp"

#include "util/logger.hpp"
#include "util/text_utils.hpp"

#include <nlohmann/json.hpp>

namespace uplink {

using json = nlohmann::json;

namespace {

// OAuth error bodies look like {"error":"invalid_grant","error_description":"..."}.
std::string DescribeOAuthError(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_object()) {
            std::string err = j.value("error", "");
            std::string desc = j.value("error_description", "");
            if (!err.empty()) return desc.empty() ? err : err + ": " + desc;
        }
    } catch (const json::exception&) {
        // Not JSON; report the raw body below.
    }
    return body.size() > 200 ? body.substr(0, 200) : body;
}

} // namespace

Expected<TokenGrant> ParseTokenResponse(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) {
            return Fail(ErrorKind::AuthRequired, "token response is not a JSON object");
        }

        TokenGrant g;
        g.access_token = j.value("access_token", "");
        g.refresh_token = j.value("refresh_token", "");
        if (auto it = j.find("expires_in"); it != j.end() && it->is_number()) {
            const auto secs = it->get<long long>();
            if (secs > 0) g.expires_in = std::chrono::seconds(secs);
        }
        if (auto it = j.find("scope"); it != j.end() && it->is_string()) {
            g.scopes = SplitList(it->get<std::string>(), ' ');
        }

        if (g.access_token.empty()) {
            return Fail(ErrorKind::AuthRequired, "token response missing access_token");
        }
        return g;
    } catch (const json::exception& e) {
        return Fail(ErrorKind::AuthRequired, std::string("token response: ") + e.what());
    }
}

OAuthTokenClient::OAuthTokenClient(OAuthClientConfig config, IHttpTransport& transport)
    : config_(std::move(config)), transport_(transport) {}

Expected<TokenGrant> OAuthTokenClient::ExchangeCode(const std::string& authorization_code) {
    const std::string form = "grant_type=authorization_code"
                             "&code=" + UrlEncode(authorization_code) +
                             "&client_id=" + UrlEncode(config_.client_id) +
                             "&client_secret=" + UrlEncode(config_.client_secret) +
                             "&redirect_uri=" + UrlEncode(config_.redirect_uri);
    return PostForm(form, "authorization code exchange");
}

Expected<TokenGrant> OAuthTokenClient::Refresh(const std::string& refresh_token) {
    LogDebug("Refreshing access token (refresh_token %s)", MaskSecret(refresh_token).c_str());
    const std::string form = "grant_type=refresh_token"
                             "&refresh_token=" + UrlEncode(refresh_token) +
                             "&client_id=" + UrlEncode(config_.client_id) +
                             "&client_secret=" + UrlEncode(config_.client_secret);
    return PostForm(form, "token refresh");
}

Expected<TokenGrant> OAuthTokenClient::PostForm(const std::string& form, const char* what) {
    HttpRequest req;
    req.method = "POST";
    req.url = config_.token_uri;
    req.headers = {{"Content-Type", "application/x-www-form-urlencoded"},
                   {"Accept", "application/json"}};
    req.body = AsBytes(form);
    req.connect_timeout = config_.connect_timeout;
    req.total_timeout = config_.request_timeout;

    HttpResponse resp = transport_.Perform(req);
    if (!resp.Delivered()) {
        LogWarn("%s failed: %s (%s)", what, NetErrorName(resp.net_error), resp.net_error_msg.c_str());
        return std::unexpected(
            Error(ErrorKind::Transient, std::string(what) + " failed: " + resp.net_error_msg));
    }
    if (resp.status != 200) {
        const std::string detail = DescribeOAuthError(resp.body);
        LogWarn("%s rejected: HTTP %ld %s", what, resp.status, detail.c_str());
        return std::unexpected(
            Error(ErrorKind::AuthRequired, std::string(what) + " rejected: " + detail)
                .WithHttpStatus(resp.status));
    }
    return ParseTokenResponse(resp.body);
}

std::string OAuthTokenClient::AuthorizationUrl(const std::string& state) const {
    std::string url = config_.auth_uri;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += "response_type=code";
    url += "&client_id=" + UrlEncode(config_.client_id);
    url += "&redirect_uri=" + UrlEncode(config_.redirect_uri);
    url += "&scope=" + UrlEncode(Join(config_.scopes, " "));
    url += "&access_type=offline&include_granted_scopes=true&prompt=consent";
    if (!state.empty()) url += "&state=" + UrlEncode(state);
    return url;
}

} // namespace uplink
