#pragma once

#include "util/clock.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace uplink {

struct Credential {
    std::string access_token;
    std::string refresh_token;
    std::string token_uri;
    std::string client_id;
    std::string client_secret;
    std::vector<std::string> scopes;
    // Absent when the issuer did not report a lifetime.
    std::optional<WallTime> expiry;

    bool CanRefresh() const { return !refresh_token.empty(); }

    // True when `now` is past expiry minus `margin`. A credential without an
    // expiry never expires by time; one without an access token always has.
    bool ExpiredAt(WallTime now, std::chrono::seconds margin) const;

    bool operator==(const Credential&) const = default;
};

// JSON codec for the at-rest plaintext. Expiry is serialized with second
// precision, so decoded expiry is truncated to whole seconds.
std::string EncodeCredentialJson(const Credential& c);
Expected<Credential> DecodeCredentialJson(const std::string& json);

} // namespace uplink
