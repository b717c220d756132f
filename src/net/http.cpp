#include "net/http.hpp"

#include "util/text_utils.hpp"

namespace uplink {

std::optional<std::string> FindHeader(const HttpHeaders& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (EqualsIgnoreCase(key, name)) return value;
    }
    return std::nullopt;
}

const char* NetErrorName(NetError e) {
    switch (e) {
        case NetError::None:            return "none";
        case NetError::Timeout:         return "timeout";
        case NetError::ConnectFailed:   return "connect_failed";
        case NetError::ConnectionReset: return "connection_reset";
        case NetError::InvalidRequest:  return "invalid_request";
        case NetError::Other:           return "other";
    }
    return "unknown";
}

} // namespace uplink
