#include "net/curl_transport.hpp"

#include "util/logger.hpp"
#include "util/text_utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <mutex>

namespace uplink {

namespace {

std::once_flag g_curl_init;

void EnsureCurlGlobalInit() {
    std::call_once(g_curl_init, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            LogError("curl_global_init failed");
        }
    });
}

class EasyHandle final {
public:
    EasyHandle() : h_(curl_easy_init()) {}
    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
    ~EasyHandle() {
        if (h_) curl_easy_cleanup(h_);
    }

    CURL* get() const { return h_; }
    bool ok() const { return h_ != nullptr; }

private:
    CURL* h_ = nullptr;
};

class HeaderList final {
public:
    HeaderList() = default;
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
    ~HeaderList() {
        if (list_) curl_slist_free_all(list_);
    }

    bool Append(const std::string& line) {
        curl_slist* next = curl_slist_append(list_, line.c_str());
        if (!next) return false;
        list_ = next;
        return true;
    }

    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

struct UploadCursor {
    std::span<const std::uint8_t> data;
    std::size_t pos = 0;
};

size_t ReadBody(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* cur = static_cast<UploadCursor*>(userdata);
    const size_t room = size * nitems;
    const size_t n = std::min(room, cur->data.size() - cur->pos);
    if (n > 0) {
        std::memcpy(buffer, cur->data.data() + cur->pos, n);
        cur->pos += n;
    }
    return n;
}

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t WriteHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    const size_t n = size * nitems;
    std::string_view line(buffer, n);

    // A new status line starts a new header block (e.g. after 100 Continue).
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return n;
    }
    const size_t colon = line.find(':');
    if (colon == std::string_view::npos) return n;
    headers->emplace_back(Trim(line.substr(0, colon)), Trim(line.substr(colon + 1)));
    return n;
}

NetError MapCurlCode(CURLcode rc) {
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
            return NetError::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetError::ConnectFailed;
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return NetError::ConnectionReset;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_BAD_FUNCTION_ARGUMENT:
            return NetError::InvalidRequest;
        default:
            return NetError::Other;
    }
}

} // namespace

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
    EnsureCurlGlobalInit();
}

HttpResponse CurlTransport::Perform(const HttpRequest& request) {
    HttpResponse resp;

    EasyHandle easy;
    if (!easy.ok()) {
        resp.net_error = NetError::Other;
        resp.net_error_msg = "curl_easy_init failed";
        return resp;
    }
    CURL* h = easy.get();

    HeaderList headers;
    bool headers_ok = headers.Append("Expect:");
    for (const auto& [name, value] : request.headers) {
        headers_ok = headers_ok && headers.Append(name + ": " + value);
    }
    if (!headers_ok) {
        resp.net_error = NetError::Other;
        resp.net_error_msg = "curl_slist_append failed";
        return resp;
    }

    char errbuf[CURL_ERROR_SIZE]{};
    UploadCursor cursor{request.body, 0};

    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(request.total_timeout.count()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, WriteHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp.headers);

    if (request.method == "POST") {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS,
                         request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    } else if (request.method == "PUT") {
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_READFUNCTION, ReadBody);
        curl_easy_setopt(h, CURLOPT_READDATA, &cursor);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        resp.net_error = MapCurlCode(rc);
        resp.net_error_msg = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        LogDebug("%s %s failed: %s", request.method.c_str(), request.url.c_str(),
                 resp.net_error_msg.c_str());
        return resp;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    LogDebug("%s %s -> %ld", request.method.c_str(), request.url.c_str(), resp.status);
    return resp;
}

} // namespace uplink
