#include "auth/credential_store.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace uplink {

namespace {

constexpr std::array<std::uint8_t, 5> kHeader = {'U', 'P', 'L', 'C', 1};
constexpr mode_t kFileMode = 0600;
constexpr std::size_t kMaxRecordBytes = 1024 * 1024;

std::string ErrnoText(int err) { return std::string(std::strerror(err)); }

Result EnsureParentDirectory(const std::string& path) {
    namespace fs = std::filesystem;
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return Result::Ok();

    std::error_code ec;
    if (fs::exists(parent, ec)) return Result::Ok();

    fs::create_directories(parent, ec);
    if (ec) {
        return Result::Fail(ErrorKind::StorageError,
                            "create_directories failed: " + parent.string() + ": " + ec.message());
    }
    if (::chmod(parent.c_str(), 0700) != 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::StorageError,
                            "chmod failed: " + parent.string() + ": " + ErrnoText(err));
    }
    LogInfo("Created credential directory: %s", parent.c_str());
    return Result::Ok();
}

Result WriteAllToFd(int fd, std::span<const std::uint8_t> data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(ErrorKind::StorageError, "write failed: " + ErrnoText(err));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

// tmp file (0600) + fsync + rename, so a reader never sees a torn record.
Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> data) {
    auto dir_res = EnsureParentDirectory(path);
    if (!dir_res.is_ok()) return dir_res;

    const std::string tmp_path = path + ".tmp";
    Fd fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, kFileMode));
    if (!fd.Valid()) {
        const int err = errno;
        return Result::Fail(ErrorKind::StorageError,
                            "Failed to open " + tmp_path + " (" + ErrnoText(err) + ")");
    }
    if (::fchmod(fd.Get(), kFileMode) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(ErrorKind::StorageError, "fchmod failed: " + ErrnoText(err));
    }

    auto res = WriteAllToFd(fd.Get(), data);
    if (res.is_ok() && ::fsync(fd.Get()) != 0) {
        const int err = errno;
        res = Result::Fail(ErrorKind::StorageError, "fsync failed: " + ErrnoText(err));
    }
    if (const int err = fd.Close(); res.is_ok() && err != 0) {
        res = Result::Fail(ErrorKind::StorageError, "close failed: " + ErrnoText(err));
    }
    if (!res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return res;
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(ErrorKind::StorageError, "Atomic rename failed: " + ErrnoText(err));
    }
    return Result::Ok();
}

// NotFound for ENOENT, StorageError for anything else.
Result ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        const int err = errno;
        if (err == ENOENT) return Result::Fail(ErrorKind::NotFound, "No such file: " + path);
        return Result::Fail(ErrorKind::StorageError,
                            "Failed to open " + path + " (" + ErrnoText(err) + ")");
    }

    out.clear();
    std::array<std::uint8_t, 4096> buf{};
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(ErrorKind::StorageError, "read failed: " + ErrnoText(err));
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
        if (out.size() > kMaxRecordBytes) {
            return Result::Fail(ErrorKind::CorruptData, "File too large: " + path);
        }
    }
    return Result::Ok();
}

Result RemoveIfPresent(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        const int err = errno;
        return Result::Fail(ErrorKind::StorageError,
                            "Failed to remove " + path + " (" + ErrnoText(err) + ")");
    }
    return Result::Ok();
}

} // namespace

CredentialStore::CredentialStore(std::string credential_path, std::string key_path)
    : credential_path_(std::move(credential_path)), key_path_(std::move(key_path)) {}

Result CredentialStore::LoadKey(SecretKey& out) const {
    std::vector<std::uint8_t> raw;
    auto res = ReadFileBytes(key_path_, raw);
    if (!res.is_ok()) return res;
    if (raw.size() != out.size()) {
        OPENSSL_cleanse(raw.data(), raw.size());
        return Result::Fail(ErrorKind::CorruptData,
                            "Encryption key has wrong length: " + key_path_);
    }
    std::copy(raw.begin(), raw.end(), out.begin());
    OPENSSL_cleanse(raw.data(), raw.size());
    return Result::Ok();
}

Result CredentialStore::LoadOrCreateKey(SecretKey& out) {
    auto res = LoadKey(out);
    if (res.is_ok() || res.kind() != ErrorKind::NotFound) return res;

    res = SecretBox::GenerateKey(out);
    if (!res.is_ok()) return res;
    res = WriteFileAtomic(key_path_, out);
    if (!res.is_ok()) return res;

    LogInfo("Generated new credential encryption key: %s", key_path_.c_str());
    return Result::Ok();
}

Result CredentialStore::Put(const Credential& record) {
    SecretKey key{};
    auto res = LoadOrCreateKey(key);
    if (!res.is_ok()) return res;
    SecretBox box(key);
    OPENSSL_cleanse(key.data(), key.size());

    std::string plaintext = EncodeCredentialJson(record);
    std::vector<std::uint8_t> sealed;
    res = box.Seal(kHeader,
                   std::span<const std::uint8_t>(
                       reinterpret_cast<const std::uint8_t*>(plaintext.data()), plaintext.size()),
                   sealed);
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    if (!res.is_ok()) return res;

    std::vector<std::uint8_t> file(kHeader.begin(), kHeader.end());
    file.insert(file.end(), sealed.begin(), sealed.end());

    res = WriteFileAtomic(credential_path_, file);
    if (!res.is_ok()) return res;

    LogInfo("Credentials saved: %s", credential_path_.c_str());
    return Result::Ok();
}

Expected<Credential> CredentialStore::Get() const {
    std::vector<std::uint8_t> file;
    auto res = ReadFileBytes(credential_path_, file);
    if (!res.is_ok()) return std::unexpected(res.error);

    if (file.size() < kHeader.size() ||
        !std::equal(kHeader.begin(), kHeader.end(), file.begin())) {
        return Fail(ErrorKind::CorruptData, "Credential file has unknown format: " + credential_path_);
    }

    SecretKey key{};
    res = LoadKey(key);
    if (!res.is_ok()) {
        if (res.kind() == ErrorKind::NotFound) {
            return Fail(ErrorKind::CorruptData,
                        "Encryption key missing, stored credential is unrecoverable: " + key_path_);
        }
        return std::unexpected(res.error);
    }
    SecretBox box(key);
    OPENSSL_cleanse(key.data(), key.size());

    std::vector<std::uint8_t> plaintext;
    res = box.Open(kHeader,
                   std::span<const std::uint8_t>(file.data() + kHeader.size(),
                                                 file.size() - kHeader.size()),
                   plaintext);
    if (!res.is_ok()) {
        return Fail(ErrorKind::CorruptData, "Cannot decrypt credential file: " + res.message());
    }

    std::string json(plaintext.begin(), plaintext.end());
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    auto decoded = DecodeCredentialJson(json);
    OPENSSL_cleanse(json.data(), json.size());
    return decoded;
}

Result CredentialStore::Clear(bool remove_key) {
    auto res = RemoveIfPresent(credential_path_);
    if (!res.is_ok()) return res;
    if (remove_key) {
        res = RemoveIfPresent(key_path_);
        if (!res.is_ok()) return res;
    }
    LogInfo("Credentials cleared%s", remove_key ? " (including encryption key)" : "");
    return Result::Ok();
}

bool CredentialStore::Exists() const {
    struct stat st{};
    return ::stat(credential_path_.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace uplink
