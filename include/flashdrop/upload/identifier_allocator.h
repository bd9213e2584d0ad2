#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include "flashdrop/core/config.h"
#include "flashdrop/core/result.h"

namespace flashdrop::storage {
class LocalStorage;
}

namespace flashdrop::upload {

/// @brief Produces a random candidate identifier of the requested length.
using DrawFn = std::function<std::string(std::size_t length)>;

/// @brief Hands out short public identifiers that no stored object or in-flight
/// assembly is using.
///
/// Each draw is checked against the object directory and against ids reserved by
/// earlier Allocate() calls that have not been released yet. After
/// `attempts_per_length` collisions the identifier grows by one character, up to
/// `max_length`; past that Allocate() fails with kIdentifierExhausted.
class IdentifierAllocator {
public:
    IdentifierAllocator(std::shared_ptr<storage::LocalStorage> storage,
                        core::IdentifierConfig config, DrawFn draw = {});

    core::Result<std::string> Allocate();
    /// @brief Drops the reservation once the object exists on disk or assembly was abandoned.
    void Release(const std::string& id);

    std::size_t reserved_count() const;

    static const std::string& Alphabet();
    /// @brief Default draw: uniform characters from Alphabet() using Poco::Random.
    static DrawFn RandomDraw();

private:
    std::shared_ptr<storage::LocalStorage> storage_;
    core::IdentifierConfig config_;
    DrawFn draw_;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> reserved_;
};

}  // namespace flashdrop::upload
