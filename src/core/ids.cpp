#include "flashdrop/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace flashdrop::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateSessionToken() {
    // Random (v4) rather than time-based so tokens cannot be guessed from each other.
    return Poco::UUIDGenerator().createRandom().toString();
}

}  // namespace flashdrop::core
