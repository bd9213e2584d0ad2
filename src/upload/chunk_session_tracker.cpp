#include "flashdrop/upload/chunk_session_tracker.h"

#include "flashdrop/core/ids.h"
#include "flashdrop/core/logger.h"
#include "flashdrop/storage/local_storage.h"

namespace flashdrop::upload {

namespace {

core::Error TooLarge(std::uint64_t limit) {
    return core::Error{core::ErrorCode::kFileTooLarge,
                       "upload exceeds " + std::to_string(limit) + " bytes"};
}

}  // namespace

bool UploadSession::HasAllChunks(int expected_total) const {
    if (expected_total <= 0 || chunks.size() != static_cast<std::size_t>(expected_total)) {
        return false;
    }
    // Keys are unique and ordered, so count plus bounds means exactly 0..N-1.
    return chunks.begin()->first == 0 && chunks.rbegin()->first == expected_total - 1;
}

void ChunkSessionTracker::DiscardStaged(const std::filesystem::path& staged) {
    auto removed = storage_->RemoveFile(staged);
    if (!removed.ok()) {
        core::LogError(removed.error().message);
    }
}

ChunkSessionTracker::ChunkSessionTracker(std::shared_ptr<storage::LocalStorage> storage,
                                         std::uint64_t max_file_bytes, core::Clock clock)
    : storage_(std::move(storage)), max_file_bytes_(max_file_bytes), clock_(std::move(clock)) {}

core::Result<StoredChunkRef> ChunkSessionTracker::PutChunk(const ChunkUpload& chunk) {
    const auto extension = storage::LocalStorage::ExtensionOf(chunk.file_name);
    if (!storage::LocalStorage::IsAllowedExtension(extension)) {
        return core::Error{core::ErrorCode::kInvalidFileType, "file type not allowed"};
    }
    if (chunk.chunk_index < 0 || chunk.total_chunks <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "chunkIndex must be >= 0 and totalChunks > 0"};
    }
    if (chunk.data.size() > max_file_bytes_) {
        return TooLarge(max_file_bytes_);
    }

    const bool opens_session = chunk.session_token.empty();
    const auto token = opens_session ? core::GenerateSessionToken() : chunk.session_token;

    if (!opens_session) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(token);
        if (it == sessions_.end() || it->second.file_name != chunk.file_name) {
            return core::Error{core::ErrorCode::kSessionNotFound, "upload session not found"};
        }
        const auto& session = it->second;
        std::uint64_t replaced = 0;
        auto existing = session.chunks.find(chunk.chunk_index);
        if (existing != session.chunks.end()) {
            replaced = existing->second.size_bytes;
        }
        if (session.total_bytes - replaced + chunk.data.size() > max_file_bytes_) {
            return TooLarge(max_file_bytes_);
        }
    }

    // Bytes are staged outside the lock; the chunk path is only replaced by the rename
    // below, and only while the session is still tracked.
    const auto staged = storage_->NewTempPath();
    auto written = storage_->WriteChunk(staged, chunk.data);
    if (!written.ok()) {
        return written.error();
    }
    const auto path = storage_->ChunkPath(token, chunk.chunk_index, extension);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    if (opens_session) {
        UploadSession session;
        session.token = token;
        session.file_name = chunk.file_name;
        session.extension = extension;
        session.created_at = now;
        sessions_.emplace(token, std::move(session));
        core::LogDebug("Opened upload session " + token + " for " + chunk.file_name);
    }

    auto it = sessions_.find(token);
    if (it == sessions_.end()) {
        // Completed or expired while the bytes were being written.
        DiscardStaged(staged);
        return core::Error{core::ErrorCode::kSessionNotFound, "upload session not found"};
    }

    auto moved = storage_->MoveFile(staged, path);
    if (!moved.ok()) {
        DiscardStaged(staged);
        if (opens_session) {
            sessions_.erase(it);
        }
        return moved.error();
    }

    auto& session = it->second;
    auto& entry = session.chunks[chunk.chunk_index];
    session.total_bytes = session.total_bytes - entry.size_bytes + written.value();
    entry.path = path;
    entry.size_bytes = written.value();
    session.total_chunks = chunk.total_chunks;
    session.last_activity = now;

    StoredChunkRef ref;
    ref.session_token = token;
    ref.chunk_index = chunk.chunk_index;
    ref.path = path;
    ref.size_bytes = written.value();
    return ref;
}

bool ChunkSessionTracker::IsComplete(const std::string& token, int total_chunks) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(token);
    return it != sessions_.end() && it->second.HasAllChunks(total_chunks);
}

core::Result<UploadSession> ChunkSessionTracker::TakeSession(const std::string& token,
                                                             int total_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) {
        return core::Error{core::ErrorCode::kSessionNotFound, "no chunks found for session"};
    }
    if (!it->second.HasAllChunks(total_chunks)) {
        return core::Error{core::ErrorCode::kMissingChunks,
                           "have " + std::to_string(it->second.chunks.size()) + " of " +
                               std::to_string(total_chunks) + " chunks"};
    }
    UploadSession session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

std::vector<UploadSession> ChunkSessionTracker::ExpireIdle(const Poco::Timestamp& cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UploadSession> expired;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.last_activity < cutoff) {
            expired.push_back(std::move(it->second));
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::size_t ChunkSessionTracker::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace flashdrop::upload
