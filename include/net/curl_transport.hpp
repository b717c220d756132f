#pragma once

#include "net/http.hpp"

#include <string>

namespace uplink {

// libcurl easy-interface transport. Each Perform() uses a fresh easy handle,
// so one instance may be shared by concurrent sessions.
class CurlTransport final : public IHttpTransport {
public:
    explicit CurlTransport(std::string user_agent = "uplink/1.0");

    HttpResponse Perform(const HttpRequest& request) override;

private:
    std::string user_agent_;
};

} // namespace uplink
