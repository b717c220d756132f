#include "auth/credential_manager.hpp"

#include "util/logger.hpp"
#include "util/text_utils.hpp"

namespace uplink {

CredentialLifecycleManager::CredentialLifecycleManager(CredentialStore& store,
                                                       ITokenEndpoint& endpoint,
                                                       IClock& clock,
                                                       Options opt)
    : store_(store), endpoint_(endpoint), clock_(clock), opt_(opt) {}

Expected<Credential> CredentialLifecycleManager::Acquire() {
    std::lock_guard<std::mutex> lk(mu_);
    return AcquireLocked();
}

Expected<Credential> CredentialLifecycleManager::AcquireLocked() {
    if (!cached_) {
        auto loaded = store_.Get();
        if (!loaded) {
            if (loaded.error().kind == ErrorKind::NotFound) {
                return Fail(ErrorKind::AuthRequired, "No stored credential; authorization required");
            }
            LogError("Cannot load stored credential: %s", loaded.error().msg.c_str());
            return std::unexpected(loaded.error());
        }
        cached_ = std::move(*loaded);
        LogInfo("Credentials loaded from %s", store_.CredentialPath().c_str());
    }

    if (unsaved_) {
        auto put = store_.Put(*cached_);
        if (!put.is_ok()) {
            LogError("Credential still not persisted: %s", put.message().c_str());
            return std::unexpected(put.error);
        }
        unsaved_ = false;
        LogInfo("Pending credential persisted to %s", store_.CredentialPath().c_str());
    }

    const WallTime now = clock_.WallNow();
    if (!cached_->ExpiredAt(now, opt_.safety_margin)) {
        return *cached_;
    }

    if (!cached_->CanRefresh()) {
        return Fail(ErrorKind::AuthRequired, "Credential expired and has no refresh token");
    }

    LogInfo("Access token expired or about to expire, refreshing");
    auto grant = endpoint_.Refresh(cached_->refresh_token);
    if (!grant) {
        LogError("Credential refresh failed: %s", grant.error().msg.c_str());
        return std::unexpected(Error(ErrorKind::AuthRequired,
                                     "Credential refresh failed: " + grant.error().msg)
                                   .WithHttpStatus(grant.error().http_status));
    }

    Credential updated = *cached_;
    updated.access_token = grant->access_token;
    if (!grant->refresh_token.empty()) updated.refresh_token = grant->refresh_token;
    if (!grant->scopes.empty()) updated.scopes = grant->scopes;
    if (grant->expires_in) {
        updated.expiry = now + *grant->expires_in;
    } else {
        updated.expiry.reset();
    }
    cached_ = updated;
    LogInfo("Credentials refreshed (access token %s)", MaskSecret(updated.access_token).c_str());

    auto put = store_.Put(updated);
    if (!put.is_ok()) {
        unsaved_ = true;
        LogError("Refreshed credential could not be persisted: %s", put.message().c_str());
        return std::unexpected(put.error);
    }
    return updated;
}

Expected<Credential> CredentialLifecycleManager::Bootstrap(const std::string& authorization_code) {
    if (authorization_code.empty()) {
        return Fail(ErrorKind::InputValidation, "Authorization code is empty");
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto grant = endpoint_.ExchangeCode(authorization_code);
    if (!grant) {
        LogError("Authorization code exchange failed: %s", grant.error().msg.c_str());
        return std::unexpected(grant.error());
    }

    const OAuthClientConfig& client = endpoint_.Client();
    Credential c;
    c.access_token = grant->access_token;
    c.refresh_token = grant->refresh_token;
    c.token_uri = client.token_uri;
    c.client_id = client.client_id;
    c.client_secret = client.client_secret;
    c.scopes = grant->scopes.empty() ? client.scopes : grant->scopes;
    if (grant->expires_in) c.expiry = clock_.WallNow() + *grant->expires_in;

    if (!c.CanRefresh()) {
        LogWarn("Authorization server granted no refresh token; re-authorization will be "
                "needed when the access token expires");
    }

    cached_ = c;
    auto put = store_.Put(c);
    if (!put.is_ok()) {
        unsaved_ = true;
        LogError("New credential could not be persisted: %s", put.message().c_str());
        return std::unexpected(put.error);
    }
    LogInfo("Authentication successful");
    return c;
}

Result CredentialLifecycleManager::Revoke(bool forget_key) {
    std::lock_guard<std::mutex> lk(mu_);
    cached_.reset();
    unsaved_ = false;
    return store_.Clear(forget_key);
}

bool CredentialLifecycleManager::IsAuthenticated() {
    std::lock_guard<std::mutex> lk(mu_);
    return AcquireLocked().has_value();
}

Expected<std::string> CredentialLifecycleManager::AccessToken() {
    std::lock_guard<std::mutex> lk(mu_);
    auto c = AcquireLocked();
    if (!c) return std::unexpected(c.error());
    return c->access_token;
}

} // namespace uplink
