#include "auth/credential_manager.hpp"
#include "testing.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

using namespace std::chrono_literals;

class CredentialManagerTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeClock clock;
    testutil::FakeTokenEndpoint endpoint;
    uplink::CredentialStore store{tmp.Path() + "/tokens/credential.bin",
                                  tmp.Path() + "/tokens/.encryption_key"};

    uplink::Credential StoredCredential(std::chrono::seconds lifetime) {
        uplink::Credential c;
        c.access_token = "access-0";
        c.refresh_token = "refresh-0";
        c.token_uri = "https://oauth.test/token";
        c.client_id = "client-id";
        c.scopes = {"scope.upload"};
        c.expiry = clock.WallNow() + lifetime;
        return c;
    }
};

TEST_F(CredentialManagerTests, NoStoredCredentialIsAuthRequired) {
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);
    auto c = mgr.Acquire();
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().kind, uplink::ErrorKind::AuthRequired);
    EXPECT_FALSE(mgr.IsAuthenticated());
    EXPECT_EQ(endpoint.refreshes.load(), 0);
}

TEST_F(CredentialManagerTests, FreshCredentialIsReturnedWithoutRefresh) {
    ASSERT_TRUE(store.Put(StoredCredential(1h)).is_ok());
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    auto c = mgr.Acquire();
    ASSERT_TRUE(c.has_value()) << c.error().msg;
    EXPECT_EQ(c->access_token, "access-0");
    EXPECT_EQ(endpoint.refreshes.load(), 0);
}

TEST_F(CredentialManagerTests, ExpiredCredentialIsRefreshedAndPersisted) {
    ASSERT_TRUE(store.Put(StoredCredential(30s)).is_ok());  // inside the 60 s margin
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    auto c = mgr.Acquire();
    ASSERT_TRUE(c.has_value()) << c.error().msg;
    EXPECT_EQ(c->access_token, "access-refreshed-1");
    EXPECT_EQ(c->refresh_token, "refresh-0");  // kept when not rotated
    EXPECT_EQ(endpoint.last_refresh_token, "refresh-0");
    EXPECT_EQ(endpoint.refreshes.load(), 1);

    auto persisted = store.Get();
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->access_token, "access-refreshed-1");
    EXPECT_EQ(persisted->refresh_token, "refresh-0");

    // Cached and valid now: no second exchange.
    ASSERT_TRUE(mgr.Acquire().has_value());
    EXPECT_EQ(endpoint.refreshes.load(), 1);
}

TEST_F(CredentialManagerTests, UnpersistedRefreshIsWrittenOnNextAcquire) {
    ASSERT_TRUE(store.Put(StoredCredential(30s)).is_ok());
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    // A directory where the temp file goes makes the write fail, even as root.
    const std::string blocker = store.CredentialPath() + ".tmp";
    ASSERT_EQ(::mkdir(blocker.c_str(), 0700), 0);

    auto first = mgr.Acquire();
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().kind, uplink::ErrorKind::StorageError);
    EXPECT_EQ(store.Get()->access_token, "access-0");

    // Still failing: the error is reported again instead of the cached token.
    EXPECT_EQ(mgr.Acquire().error().kind, uplink::ErrorKind::StorageError);

    ASSERT_EQ(::rmdir(blocker.c_str()), 0);
    auto second = mgr.Acquire();
    ASSERT_TRUE(second.has_value()) << second.error().msg;
    EXPECT_EQ(second->access_token, "access-refreshed-1");
    EXPECT_EQ(store.Get()->access_token, "access-refreshed-1");
    EXPECT_EQ(endpoint.refreshes.load(), 1);
}

TEST_F(CredentialManagerTests, RotatedRefreshTokenReplacesOld) {
    endpoint.rotate_refresh_token = true;
    ASSERT_TRUE(store.Put(StoredCredential(-10s)).is_ok());
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    auto c = mgr.Acquire();
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->refresh_token, "refresh-2");
}

TEST_F(CredentialManagerTests, RefreshFailureIsAuthRequiredAndNotRetried) {
    endpoint.fail = true;
    ASSERT_TRUE(store.Put(StoredCredential(-10s)).is_ok());
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    auto c = mgr.Acquire();
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().kind, uplink::ErrorKind::AuthRequired);
    EXPECT_EQ(endpoint.refreshes.load(), 1);
}

TEST_F(CredentialManagerTests, ExpiredWithoutRefreshTokenIsAuthRequired) {
    auto stored = StoredCredential(-10s);
    stored.refresh_token.clear();
    ASSERT_TRUE(store.Put(stored).is_ok());
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    EXPECT_EQ(mgr.Acquire().error().kind, uplink::ErrorKind::AuthRequired);
    EXPECT_EQ(endpoint.refreshes.load(), 0);
}

TEST_F(CredentialManagerTests, CorruptStoreIsSurfaced) {
    ASSERT_TRUE(store.Put(StoredCredential(1h)).is_ok());
    testutil::WriteFile(store.KeyPath(), std::string(32, 'x'));
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    EXPECT_EQ(mgr.Acquire().error().kind, uplink::ErrorKind::CorruptData);
}

TEST_F(CredentialManagerTests, BootstrapExchangesCodeAndPersists) {
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    auto c = mgr.Bootstrap("one-time-code");
    ASSERT_TRUE(c.has_value()) << c.error().msg;
    EXPECT_EQ(c->access_token, "access-from-one-time-code");
    EXPECT_EQ(c->client_id, "client-id");
    EXPECT_EQ(c->token_uri, "https://oauth.test/token");
    ASSERT_TRUE(c->expiry.has_value());
    EXPECT_EQ(*c->expiry, clock.WallNow() + 3600s);
    EXPECT_TRUE(store.Exists());
    EXPECT_TRUE(mgr.IsAuthenticated());
}

TEST_F(CredentialManagerTests, BootstrapRejectsEmptyCode) {
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);
    EXPECT_EQ(mgr.Bootstrap("").error().kind, uplink::ErrorKind::InputValidation);
    EXPECT_EQ(endpoint.exchanges.load(), 0);
}

TEST_F(CredentialManagerTests, RevokeDropsMemoryAndDisk) {
    ASSERT_TRUE(store.Put(StoredCredential(1h)).is_ok());
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);
    ASSERT_TRUE(mgr.Acquire().has_value());

    ASSERT_TRUE(mgr.Revoke().is_ok());
    EXPECT_FALSE(store.Exists());
    EXPECT_EQ(mgr.Acquire().error().kind, uplink::ErrorKind::AuthRequired);
    EXPECT_TRUE(mgr.Revoke().is_ok());
}

TEST_F(CredentialManagerTests, AccessTokenRefreshesWhenClockPassesExpiry) {
    ASSERT_TRUE(store.Put(StoredCredential(10min)).is_ok());
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    EXPECT_EQ(*mgr.AccessToken(), "access-0");
    clock.Advance(9min + 30s);
    EXPECT_EQ(*mgr.AccessToken(), "access-refreshed-1");
    EXPECT_EQ(endpoint.refreshes.load(), 1);
}

TEST_F(CredentialManagerTests, ConcurrentAcquirersShareOneRefresh) {
    endpoint.delay = 50ms;
    ASSERT_TRUE(store.Put(StoredCredential(-10s)).is_ok());
    uplink::CredentialLifecycleManager mgr(store, endpoint, clock);

    std::vector<std::string> tokens(2);
    std::thread a([&] { tokens[0] = mgr.AccessToken().value_or(""); });
    std::thread b([&] { tokens[1] = mgr.AccessToken().value_or(""); });
    a.join();
    b.join();

    EXPECT_EQ(endpoint.refreshes.load(), 1);
    EXPECT_EQ(tokens[0], "access-refreshed-1");
    EXPECT_EQ(tokens[1], "access-refreshed-1");
}

} // namespace
