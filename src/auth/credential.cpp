#include "auth/credential.hpp"

#include "util/time_format.hpp"

#include <nlohmann/json.hpp>

namespace uplink {

using json = nlohmann::json;

bool Credential::ExpiredAt(WallTime now, std::chrono::seconds margin) const {
    if (access_token.empty()) return true;
    if (!expiry) return false;
    return now >= *expiry - margin;
}

std::string EncodeCredentialJson(const Credential& c) {
    json j;
    j["token"] = c.access_token;
    j["refresh_token"] = c.refresh_token;
    j["token_uri"] = c.token_uri;
    j["client_id"] = c.client_id;
    j["client_secret"] = c.client_secret;
    j["scopes"] = c.scopes;
    j["expiry"] = c.expiry ? json(FormatIso8601Utc(*c.expiry)) : json(nullptr);
    return j.dump();
}

Expected<Credential> DecodeCredentialJson(const std::string& input) {
    try {
        auto j = json::parse(input);
        if (!j.is_object()) {
            return Fail(ErrorKind::CorruptData, "credential record must be a JSON object");
        }

        Credential c;
        c.access_token = j.value("token", "");
        c.refresh_token = j.value("refresh_token", "");
        c.token_uri = j.value("token_uri", "");
        c.client_id = j.value("client_id", "");
        c.client_secret = j.value("client_secret", "");
        c.scopes = j.value("scopes", std::vector<std::string>{});

        auto it = j.find("expiry");
        if (it != j.end() && !it->is_null()) {
            if (!it->is_string()) {
                return Fail(ErrorKind::CorruptData, "credential expiry must be a string");
            }
            WallTime t{};
            if (!ParseIso8601Utc(it->get<std::string>(), t)) {
                return Fail(ErrorKind::CorruptData, "credential expiry is not ISO 8601");
            }
            c.expiry = t;
        }

        if (c.access_token.empty() && c.refresh_token.empty()) {
            return Fail(ErrorKind::CorruptData, "credential record has no tokens");
        }
        return c;
    } catch (const json::exception& e) {
        return Fail(ErrorKind::CorruptData, std::string("credential record: ") + e.what());
    }
}

} // namespace uplink
