#pragma once

#include <cstdint>
#include <string>

namespace flashdrop::core {

/// @brief Formats a byte count with decimal (SI) units, e.g. "3.6 kB", "1 Byte", "512 Bytes".
std::string HumanSize(std::uint64_t bytes);

}  // namespace flashdrop::core
