#pragma once

#include "uplink/byte_range_chunker.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace uplink {

// Framing and parsing for the initiate / chunked PUT / finalize protocol.
namespace resumable {

inline constexpr long kResumeIncomplete = 308;

// "bytes 0-5242879/26214400"; an empty range becomes "bytes */<total>".
std::string ContentRange(const ByteRange& r, std::uint64_t total);

// Status probe asking the server what it has: "bytes */<total>".
std::string StatusProbeRange(std::uint64_t total);

// "bytes=0-1048575" -> 1048576 bytes durably received.
bool ParseConfirmedBytes(const std::string& range_header, std::uint64_t& out);

// `base` + "?uploadType=resumable&part=a,b".
std::string InitiateUrl(const std::string& base, const std::vector<std::string>& parts);

// The "id" of the created resource in a final 200/201 body.
Expected<std::string> ParseResourceId(const std::string& body);

// First error reason from a Google-style error body
// ({"error":{"errors":[{"reason":"quotaExceeded"}], "message": ...}}), or empty.
std::string ExtractApiErrorReason(const std::string& body);

// Human-readable error message from the same body shape, or a body prefix.
std::string ExtractApiErrorMessage(const std::string& body);

} // namespace resumable

} // namespace uplink
