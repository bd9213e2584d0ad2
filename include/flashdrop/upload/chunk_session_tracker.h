#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <Poco/Timestamp.h>

#include "flashdrop/core/result.h"
#include "flashdrop/core/time.h"

namespace flashdrop::storage {
class LocalStorage;
}

namespace flashdrop::upload {

/// @brief One incoming chunk. An empty session_token opens a new session.
struct ChunkUpload {
    std::string session_token;
    std::string file_name;
    int chunk_index{0};
    int total_chunks{0};
    std::string_view data;
};

/// @brief Where a chunk landed and the session it belongs to.
struct StoredChunkRef {
    std::string session_token;
    int chunk_index{0};
    std::filesystem::path path;
    std::uint64_t size_bytes{0};
};

struct StoredChunk {
    std::filesystem::path path;
    std::uint64_t size_bytes{0};
};

/// @brief Chunks received so far for one logical upload.
struct UploadSession {
    std::string token;
    std::string file_name;
    std::string extension;
    int total_chunks{0};
    std::map<int, StoredChunk> chunks;
    std::uint64_t total_bytes{0};
    Poco::Timestamp created_at{0};
    Poco::Timestamp last_activity{0};

    /// @brief True when exactly the indices 0..total_chunks-1 are present.
    bool HasAllChunks(int expected_total) const;
};

/// @brief Tracks in-flight chunked uploads keyed by server-issued session token.
class ChunkSessionTracker {
public:
    ChunkSessionTracker(std::shared_ptr<storage::LocalStorage> storage,
                        std::uint64_t max_file_bytes, core::Clock clock = core::SystemClock());

    /// @brief Validates, stores and registers one chunk.
    ///
    /// The extension gate runs before any session lookup, so a rejected chunk never
    /// creates state. Duplicate indices overwrite the previous bytes.
    core::Result<StoredChunkRef> PutChunk(const ChunkUpload& chunk);

    bool IsComplete(const std::string& token, int total_chunks) const;

    /// @brief Removes and returns the session if it holds every chunk 0..total_chunks-1;
    /// otherwise leaves it untouched and reports kSessionNotFound or kMissingChunks.
    core::Result<UploadSession> TakeSession(const std::string& token, int total_chunks);

    /// @brief Removes sessions whose last activity is older than cutoff.
    std::vector<UploadSession> ExpireIdle(const Poco::Timestamp& cutoff);

    std::size_t Count() const;

private:
    void DiscardStaged(const std::filesystem::path& staged);

    std::shared_ptr<storage::LocalStorage> storage_;
    std::uint64_t max_file_bytes_;
    core::Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, UploadSession> sessions_;
};

}  // namespace flashdrop::upload
