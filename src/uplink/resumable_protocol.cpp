#include "uplink/resumable_protocol.hpp"

#include "util/text_utils.hpp"

#include <charconv>
#include <nlohmann/json.hpp>

namespace uplink::resumable {

using json = nlohmann::json;

namespace {

bool ParseU64(std::string_view s, std::uint64_t& out) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

std::string Prefix(const std::string& body) {
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

} // namespace

std::string ContentRange(const ByteRange& r, std::uint64_t total) {
    if (r.length == 0) return StatusProbeRange(total);
    return "bytes " + std::to_string(r.offset) + "-" + std::to_string(r.End() - 1) + "/" +
           std::to_string(total);
}

std::string StatusProbeRange(std::uint64_t total) { return "bytes */" + std::to_string(total); }

bool ParseConfirmedBytes(const std::string& range_header, std::uint64_t& out) {
    const std::string v = Trim(range_header);
    constexpr std::string_view kPrefix = "bytes=";
    if (v.size() <= kPrefix.size() || !EqualsIgnoreCase(std::string_view(v).substr(0, kPrefix.size()), kPrefix)) {
        return false;
    }
    const std::string_view range = std::string_view(v).substr(kPrefix.size());
    const size_t dash = range.find('-');
    if (dash == std::string_view::npos) return false;

    std::uint64_t first = 0;
    std::uint64_t last = 0;
    if (!ParseU64(range.substr(0, dash), first) || !ParseU64(range.substr(dash + 1), last)) {
        return false;
    }
    // The server only ever reports a prefix of the upload.
    if (first != 0 || last == UINT64_MAX) return false;
    out = last + 1;
    return true;
}

std::string InitiateUrl(const std::string& base, const std::vector<std::string>& parts) {
    std::string url = base;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += "uploadType=resumable";
    if (!parts.empty()) url += "&part=" + Join(parts, ",");
    return url;
}

Expected<std::string> ParseResourceId(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_object()) {
            auto it = j.find("id");
            if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
                return it->get<std::string>();
            }
        }
        return Fail(ErrorKind::UploadFailed, "final response has no resource id: " + Prefix(body));
    } catch (const json::exception& e) {
        return Fail(ErrorKind::UploadFailed, std::string("final response is not JSON: ") + e.what());
    }
}

std::string ExtractApiErrorReason(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) return {};
        auto err = j.find("error");
        if (err == j.end() || !err->is_object()) return {};
        auto errors = err->find("errors");
        if (errors != err->end() && errors->is_array() && !errors->empty() &&
            errors->front().is_object()) {
            return errors->front().value("reason", "");
        }
        return err->value("status", "");
    } catch (const json::exception&) {
        return {};
    }
}

std::string ExtractApiErrorMessage(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_object()) {
            auto err = j.find("error");
            if (err != j.end() && err->is_object()) {
                std::string msg = err->value("message", "");
                if (!msg.empty()) return msg;
            }
        }
    } catch (const json::exception&) {
        // Not JSON; fall back to the raw body.
    }
    return Prefix(body);
}

} // namespace uplink::resumable
