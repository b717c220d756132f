#include "crypto/secret_box.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <climits>

namespace uplink {

namespace {

class CipherCtx final {
public:
    CipherCtx() : ctx_(EVP_CIPHER_CTX_new()) {}
    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
    ~CipherCtx() {
        if (ctx_) EVP_CIPHER_CTX_free(ctx_);
    }

    EVP_CIPHER_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_ = nullptr;
};

bool FitsInt(std::size_t n) { return n <= static_cast<std::size_t>(INT_MAX); }

} // namespace

Result RandomBytes(std::span<std::uint8_t> out) {
    if (out.empty()) return Result::Ok();
    if (!FitsInt(out.size()) || RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        return Result::Fail(ErrorKind::StorageError, "RAND_bytes failed");
    }
    return Result::Ok();
}

SecretBox::SecretBox(const SecretKey& key) : key_(key) {}

SecretBox::~SecretBox() { OPENSSL_cleanse(key_.data(), key_.size()); }

Result SecretBox::GenerateKey(SecretKey& out) { return RandomBytes(out); }

Result SecretBox::Seal(std::span<const std::uint8_t> aad,
                       std::span<const std::uint8_t> plaintext,
                       std::vector<std::uint8_t>& out) const {
    if (!FitsInt(aad.size()) || !FitsInt(plaintext.size())) {
        return Result::Fail(ErrorKind::StorageError, "Seal input too large");
    }

    out.assign(kNonceSize + plaintext.size() + kTagSize, 0);
    std::span<std::uint8_t> nonce(out.data(), kNonceSize);
    auto r = RandomBytes(nonce);
    if (!r.is_ok()) return r;

    CipherCtx ctx;
    if (!ctx.ok() ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
        return Result::Fail(ErrorKind::StorageError, "AES-GCM encrypt init failed");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        return Result::Fail(ErrorKind::StorageError, "AES-GCM AAD failed");
    }

    std::uint8_t* ct = out.data() + kNonceSize;
    int ct_len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ct, &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            return Result::Fail(ErrorKind::StorageError, "AES-GCM encrypt failed");
        }
        ct_len = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), ct + ct_len, &len) != 1) {
        return Result::Fail(ErrorKind::StorageError, "AES-GCM encrypt final failed");
    }

    std::uint8_t* tag = out.data() + kNonceSize + plaintext.size();
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag) != 1) {
        return Result::Fail(ErrorKind::StorageError, "AES-GCM get tag failed");
    }
    return Result::Ok();
}

Result SecretBox::Open(std::span<const std::uint8_t> aad,
                       std::span<const std::uint8_t> sealed,
                       std::vector<std::uint8_t>& out) const {
    if (sealed.size() < kNonceSize + kTagSize) {
        return Result::Fail(ErrorKind::CorruptData, "Sealed data truncated");
    }
    if (!FitsInt(aad.size()) || !FitsInt(sealed.size())) {
        return Result::Fail(ErrorKind::CorruptData, "Sealed data too large");
    }

    const std::size_t ct_size = sealed.size() - kNonceSize - kTagSize;
    const std::uint8_t* nonce = sealed.data();
    const std::uint8_t* ct = sealed.data() + kNonceSize;
    // EVP_CTRL_GCM_SET_TAG takes a non-const pointer but does not modify it.
    std::array<std::uint8_t, kTagSize> tag{};
    std::copy(sealed.end() - static_cast<std::ptrdiff_t>(kTagSize), sealed.end(), tag.begin());

    CipherCtx ctx;
    if (!ctx.ok() ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        return Result::Fail(ErrorKind::CorruptData, "AES-GCM decrypt init failed");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        return Result::Fail(ErrorKind::CorruptData, "AES-GCM AAD failed");
    }

    out.assign(ct_size, 0);
    int pt_len = 0;
    if (ct_size > 0) {
        if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ct, static_cast<int>(ct_size)) != 1) {
            out.clear();
            return Result::Fail(ErrorKind::CorruptData, "AES-GCM decrypt failed");
        }
        pt_len = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                            tag.data()) != 1) {
        out.clear();
        return Result::Fail(ErrorKind::CorruptData, "AES-GCM set tag failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + pt_len, &len) != 1) {
        OPENSSL_cleanse(out.data(), out.size());
        out.clear();
        return Result::Fail(ErrorKind::CorruptData, "Authentication failed (wrong key or tampered data)");
    }
    return Result::Ok();
}

} // namespace uplink
