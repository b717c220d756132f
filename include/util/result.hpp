#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace uplink {

// Closed error taxonomy. Callers switch on `kind`; the core never renders
// user-facing text.
enum class ErrorKind : int {
    None = 0,
    InputValidation,
    AuthRequired,
    Transient,
    RateLimited,
    SessionExpired,
    UploadFailed,
    Cancelled,
    NotFound,
    StorageError,
    CorruptData,
};

const char* ErrorKindName(ErrorKind kind);

struct Error {
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    // Diagnostics, zero when not applicable.
    int attempts{0};
    long http_status{0};
    std::uint64_t offset{0};

    Error() = default;
    Error(ErrorKind k, std::string m) : kind(k), msg(std::move(m)) {}

    Error& WithAttempts(int n) {
        attempts = n;
        return *this;
    }
    Error& WithHttpStatus(long s) {
        http_status = s;
        return *this;
    }
    Error& WithOffset(std::uint64_t o) {
        offset = o;
        return *this;
    }
};

template <typename T>
using Expected = std::expected<T, Error>;

inline std::unexpected<Error> Fail(ErrorKind kind, std::string msg) {
    return std::unexpected(Error(kind, std::move(msg)));
}

struct Result {
    bool ok{true};
    Error error;

    bool is_ok() const { return ok; }
    ErrorKind kind() const { return error.kind; }
    const std::string& message() const { return error.msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind kind, std::string m) {
        return {.ok = false, .error = Error(kind, std::move(m))};
    }
    static Result Fail(Error e) { return {.ok = false, .error = std::move(e)}; }
};

} // namespace uplink
