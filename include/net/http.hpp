#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uplink {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive lookup; first match wins.
std::optional<std::string> FindHeader(const HttpHeaders& headers, std::string_view name);

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    // Not owned; must outlive the Perform() call.
    std::span<const std::uint8_t> body;

    std::chrono::seconds connect_timeout{30};
    // Whole-exchange limit for this one call. Zero disables it.
    std::chrono::seconds total_timeout{60};
};

enum class NetError : int {
    None = 0,
    Timeout,
    ConnectFailed,
    ConnectionReset,
    InvalidRequest,
    Other,
};

const char* NetErrorName(NetError e);

struct HttpResponse {
    NetError net_error{NetError::None};
    std::string net_error_msg;

    long status{0};
    HttpHeaders headers;
    std::string body;

    bool Delivered() const { return net_error == NetError::None; }
    std::optional<std::string> Header(std::string_view name) const {
        return FindHeader(headers, name);
    }
};

// One blocking request/response exchange. Never throws; transport failures
// are reported through HttpResponse::net_error.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse Perform(const HttpRequest& request) = 0;
};

inline std::span<const std::uint8_t> AsBytes(std::string_view s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace uplink
