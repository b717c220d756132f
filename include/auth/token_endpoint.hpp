#pragma once

#include "auth/credential.hpp"
#include "net/http.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace uplink {

struct OAuthClientConfig {
    std::string client_id;
    std::string client_secret;
    std::string auth_uri;
    std::string token_uri;
    std::string redirect_uri;
    std::vector<std::string> scopes;
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds request_timeout{60};
};

// What the authorization server returned for one exchange.
struct TokenGrant {
    std::string access_token;
    std::string refresh_token;            // empty when the server did not rotate it
    std::optional<std::chrono::seconds> expires_in;
    std::vector<std::string> scopes;      // empty when the server did not report them
};

class ITokenEndpoint {
public:
    virtual ~ITokenEndpoint() = default;

    virtual Expected<TokenGrant> ExchangeCode(const std::string& authorization_code) = 0;
    virtual Expected<TokenGrant> Refresh(const std::string& refresh_token) = 0;

    // Identity stamped into credentials created from this endpoint's grants.
    virtual const OAuthClientConfig& Client() const = 0;
};

// OAuth 2.0 token endpoint over form-encoded POST.
class OAuthTokenClient final : public ITokenEndpoint {
public:
    OAuthTokenClient(OAuthClientConfig config, IHttpTransport& transport);

    Expected<TokenGrant> ExchangeCode(const std::string& authorization_code) override;
    Expected<TokenGrant> Refresh(const std::string& refresh_token) override;
    const OAuthClientConfig& Client() const override { return config_; }

    // Consent page URL requesting offline access.
    std::string AuthorizationUrl(const std::string& state = {}) const;

private:
    Expected<TokenGrant> PostForm(const std::string& form, const char* what);

    OAuthClientConfig config_;
    IHttpTransport& transport_;
};

// Parses a token endpoint JSON body. Exposed for tests.
Expected<TokenGrant> ParseTokenResponse(const std::string& body);

} // namespace uplink
