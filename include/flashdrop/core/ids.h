#pragma once

#include <string>

namespace flashdrop::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate an opaque upload session token handed to clients.
std::string GenerateSessionToken();

}  // namespace flashdrop::core
