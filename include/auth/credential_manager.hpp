#pragma once

#include "auth/credential.hpp"
#include "auth/credential_store.hpp"
#include "auth/token_endpoint.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace uplink {

// Supplies a bearer token for the next request. Implementations refresh
// behind the scenes; callers fetch again before every request.
class IAccessTokenSource {
public:
    virtual ~IAccessTokenSource() = default;
    virtual Expected<std::string> AccessToken() = 0;
};

// Owns the one credential of this installation. All entry points take the
// same mutex, so at most one refresh exchange is ever in flight and callers
// that queued behind it observe its outcome instead of issuing their own.
class CredentialLifecycleManager final : public IAccessTokenSource {
public:
    struct Options {
        std::chrono::seconds safety_margin{60};
    };

    CredentialLifecycleManager(CredentialStore& store,
                               ITokenEndpoint& endpoint,
                               IClock& clock,
                               Options opt);
    CredentialLifecycleManager(CredentialStore& store, ITokenEndpoint& endpoint, IClock& clock)
        : CredentialLifecycleManager(store, endpoint, clock, Options{}) {}

    CredentialLifecycleManager(const CredentialLifecycleManager&) = delete;
    CredentialLifecycleManager& operator=(const CredentialLifecycleManager&) = delete;

    // Valid credential, refreshing at most once. AuthRequired when there is no
    // credential or the refresh failed; CorruptData/StorageError from the store
    // are passed through. A credential that could not be written is kept in
    // memory and written again on every call until the write succeeds.
    Expected<Credential> Acquire();

    // Exchanges a one-time authorization code and persists the result.
    Expected<Credential> Bootstrap(const std::string& authorization_code);

    Result Revoke(bool forget_key = false);

    bool IsAuthenticated();

    Expected<std::string> AccessToken() override;

private:
    Expected<Credential> AcquireLocked();

    CredentialStore& store_;
    ITokenEndpoint& endpoint_;
    IClock& clock_;
    Options opt_;

    std::mutex mu_;
    std::optional<Credential> cached_;
    // cached_ is newer than the stored record.
    bool unsaved_ = false;
};

} // namespace uplink
