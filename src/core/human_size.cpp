#include "flashdrop/core/human_size.h"

#include <array>

#include <Poco/NumberFormatter.h>

namespace flashdrop::core {

std::string HumanSize(std::uint64_t bytes) {
    if (bytes == 1) {
        return "1 Byte";
    }
    if (bytes < 1000) {
        return std::to_string(bytes) + " Bytes";
    }

    static const std::array<const char*, 8> kSuffixes{"kB", "MB", "GB", "TB",
                                                      "PB", "EB", "ZB", "YB"};
    const double value = static_cast<double>(bytes);
    double unit = 1000.0;
    std::size_t index = 0;
    // Pick the largest unit whose next step up would exceed the value.
    while (index + 1 < kSuffixes.size() && value >= unit * 1000.0) {
        unit *= 1000.0;
        ++index;
    }
    return Poco::NumberFormatter::format(value / unit, 1) + " " + kSuffixes[index];
}

}  // namespace flashdrop::core
