#pragma once

#include <memory>
#include <string>

#include "flashdrop/core/result.h"
#include "flashdrop/core/time.h"
#include "flashdrop/metadata/metadata_store.h"

namespace flashdrop::storage {
class LocalStorage;
}

namespace flashdrop::upload {

class ChunkSessionTracker;
class IdentifierAllocator;
struct UploadSession;

/// @brief Turns a complete chunk session into a stored object plus its FileRecord.
class Assembler {
public:
    Assembler(std::shared_ptr<storage::LocalStorage> storage,
              std::shared_ptr<ChunkSessionTracker> tracker,
              std::shared_ptr<IdentifierAllocator> allocator,
              std::shared_ptr<metadata::MetadataStore> metadata, int file_ttl_seconds,
              core::Clock clock = core::SystemClock());

    /// @brief Concatenates chunks 0..total_chunks-1 in order under a fresh identifier.
    ///
    /// Each chunk file is deleted as soon as it has been copied. On failure the
    /// partial object and any remaining chunks are removed and the session is gone;
    /// the client has to upload again.
    core::Result<metadata::FileRecord> Complete(const std::string& session_token,
                                                int total_chunks);

private:
    core::Result<void> Concatenate(const UploadSession& session, int total_chunks,
                                   const std::string& temp_path);
    void DiscardChunks(const UploadSession& session);

    std::shared_ptr<storage::LocalStorage> storage_;
    std::shared_ptr<ChunkSessionTracker> tracker_;
    std::shared_ptr<IdentifierAllocator> allocator_;
    std::shared_ptr<metadata::MetadataStore> metadata_;
    int file_ttl_seconds_;
    core::Clock clock_;
};

}  // namespace flashdrop::upload
