#pragma once

#include "util/clock.hpp"

#include <string>

namespace uplink {

// "2026-01-31T08:15:00Z", second precision.
std::string FormatIso8601Utc(WallTime t);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM"/"-HH:MM" offset. No offset means UTC.
bool ParseIso8601Utc(const std::string& s, WallTime& out);

} // namespace uplink
