#include "flashdrop/core/time.h"

#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeParser.h>
#include <Poco/Exception.h>
#include <Poco/Timespan.h>

namespace flashdrop::core {

Clock SystemClock() {
    return []() { return Poco::Timestamp(); };
}

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::string FormatIso8601(const Poco::Timestamp& timestamp) {
    return Poco::DateTimeFormatter::format(timestamp, Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
}

Result<Poco::Timestamp> ParseIso8601(const std::string& text) {
    try {
        int tzd = 0;
        Poco::DateTime parsed =
            Poco::DateTimeParser::parse(Poco::DateTimeFormat::ISO8601_FRAC_FORMAT, text, tzd);
        parsed.makeUTC(tzd);
        return parsed.timestamp();
    } catch (const Poco::Exception& ex) {
        return Error{ErrorCode::kInvalidArgument, "invalid timestamp: " + ex.displayText()};
    }
}

Poco::Timestamp AddSeconds(const Poco::Timestamp& timestamp, long long delta_seconds) {
    Poco::Timestamp shifted = timestamp;
    shifted += Poco::Timespan(static_cast<long>(delta_seconds), 0);
    return shifted;
}

}  // namespace flashdrop::core
