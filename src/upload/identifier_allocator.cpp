#include "flashdrop/upload/identifier_allocator.h"

#include <Poco/Random.h>

#include "flashdrop/core/logger.h"
#include "flashdrop/storage/local_storage.h"

namespace flashdrop::upload {

IdentifierAllocator::IdentifierAllocator(std::shared_ptr<storage::LocalStorage> storage,
                                         core::IdentifierConfig config, DrawFn draw)
    : storage_(std::move(storage)),
      config_(config),
      draw_(draw ? std::move(draw) : RandomDraw()) {}

const std::string& IdentifierAllocator::Alphabet() {
    static const std::string kAlphabet =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    return kAlphabet;
}

DrawFn IdentifierAllocator::RandomDraw() {
    auto random = std::make_shared<Poco::Random>();
    random->seed();
    auto random_mutex = std::make_shared<std::mutex>();
    return [random, random_mutex](std::size_t length) {
        const auto& alphabet = Alphabet();
        std::string id;
        id.reserve(length);
        std::lock_guard<std::mutex> lock(*random_mutex);
        for (std::size_t i = 0; i < length; ++i) {
            id += alphabet[random->next(static_cast<Poco::UInt32>(alphabet.size()))];
        }
        return id;
    };
}

core::Result<std::string> IdentifierAllocator::Allocate() {
    for (int length = config_.length; length <= config_.max_length; ++length) {
        for (int attempt = 0; attempt < config_.attempts_per_length; ++attempt) {
            auto candidate = draw_(static_cast<std::size_t>(length));
            if (candidate.size() != static_cast<std::size_t>(length)) {
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (reserved_.count(candidate) > 0 || storage_->HasObjectWithId(candidate)) {
                continue;
            }
            reserved_.insert(candidate);
            return candidate;
        }
        if (length < config_.max_length) {
            core::LogWarning("Identifier collisions at length " + std::to_string(length) +
                             ", escalating to " + std::to_string(length + 1));
        }
    }
    return core::Error{core::ErrorCode::kIdentifierExhausted,
                       "no free identifier up to length " + std::to_string(config_.max_length)};
}

void IdentifierAllocator::Release(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.erase(id);
}

std::size_t IdentifierAllocator::reserved_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.size();
}

}  // namespace flashdrop::upload
