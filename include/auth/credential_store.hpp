#pragma once

#include "auth/credential.hpp"
#include "crypto/secret_box.hpp"
#include "util/result.hpp"

#include <string>

namespace uplink {

// Encrypted single-record credential file plus its companion key file,
// both owner read/write only. Purely local I/O; not synchronized: the
// owning CredentialLifecycleManager serializes access.
class CredentialStore {
public:
    CredentialStore(std::string credential_path, std::string key_path);

    // StorageError when the directory or files cannot be written; CorruptData
    // when an existing key file is unusable.
    Result Put(const Credential& record);

    // NotFound when no credential file exists; CorruptData when it cannot be
    // decrypted or parsed.
    Expected<Credential> Get() const;

    // Idempotent. The key file is removed only when `remove_key` is set.
    Result Clear(bool remove_key = false);

    bool Exists() const;

    const std::string& CredentialPath() const { return credential_path_; }
    const std::string& KeyPath() const { return key_path_; }

private:
    Result LoadOrCreateKey(SecretKey& out);
    Result LoadKey(SecretKey& out) const;

    std::string credential_path_;
    std::string key_path_;
};

} // namespace uplink
