#pragma once

#include <functional>
#include <string>

#include <Poco/Timestamp.h>

#include "flashdrop/core/result.h"

namespace flashdrop::core {

/// @brief Source of "now"; injectable so expiry logic can be tested at fixed instants.
using Clock = std::function<Poco::Timestamp()>;

/// @brief Clock backed by the system wall clock.
Clock SystemClock();

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Formats a timestamp as ISO8601 UTC with microsecond precision.
std::string FormatIso8601(const Poco::Timestamp& timestamp);
/// @brief Parses an ISO8601 timestamp; the inverse of FormatIso8601 to the microsecond.
Result<Poco::Timestamp> ParseIso8601(const std::string& text);
/// @brief Returns timestamp shifted by delta_seconds.
Poco::Timestamp AddSeconds(const Poco::Timestamp& timestamp, long long delta_seconds);

}  // namespace flashdrop::core
