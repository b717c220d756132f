#pragma once

#include "util/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace uplink {

inline constexpr std::size_t kSecretKeySize = 32;
inline constexpr std::size_t kNonceSize = 12;
inline constexpr std::size_t kTagSize = 16;

using SecretKey = std::array<std::uint8_t, kSecretKeySize>;

// Cryptographically secure random bytes (OpenSSL RAND_bytes).
Result RandomBytes(std::span<std::uint8_t> out);

// AES-256-GCM authenticated encryption. Sealed layout: nonce | ciphertext | tag.
class SecretBox {
public:
    explicit SecretBox(const SecretKey& key);
    SecretBox(const SecretBox&) = delete;
    SecretBox& operator=(const SecretBox&) = delete;
    ~SecretBox();

    static Result GenerateKey(SecretKey& out);

    Result Seal(std::span<const std::uint8_t> aad,
                std::span<const std::uint8_t> plaintext,
                std::vector<std::uint8_t>& out) const;

    // Fails with CorruptData when the input is truncated or authentication fails.
    Result Open(std::span<const std::uint8_t> aad,
                std::span<const std::uint8_t> sealed,
                std::vector<std::uint8_t>& out) const;

private:
    SecretKey key_;
};

} // namespace uplink
