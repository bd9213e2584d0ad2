#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <Poco/Timestamp.h>

#include "flashdrop/core/error.h"
#include "flashdrop/core/result.h"

namespace flashdrop::metadata {

/// @brief Metadata describing one completed, live stored object.
struct FileRecord {
    std::string id;
    std::string original_name;
    std::string mime_type;
    std::uint64_t size_bytes{0};
    std::string human_size;
    Poco::Timestamp upload_time{0};
    Poco::Timestamp expiry_time{0};
    std::string extension;
};

bool operator==(const FileRecord& lhs, const FileRecord& rhs);

/// @brief Called for each expired record while the store lock is held.
using ReclaimFn = std::function<void(const FileRecord&)>;

/// @brief Abstract id -> record store; implementations must serialize all mutations.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual core::Result<FileRecord> Get(const std::string& id) = 0;
    virtual core::Result<void> Insert(const FileRecord& record) = 0;
    virtual core::Result<void> Delete(const std::string& id) = 0;
    virtual std::size_t Size() = 0;

    /// @brief Removes every record with expiry_time < now, invoking reclaim first for each,
    /// and persists once after the batch. Returns the removed records.
    virtual std::vector<FileRecord> RemoveExpired(const Poco::Timestamp& now,
                                                  const ReclaimFn& reclaim) = 0;

    /// @brief Writes the full store to durable storage.
    virtual core::Result<void> Snapshot() = 0;
    /// @brief Replaces in-memory state with the durable copy; unreadable data yields empty.
    virtual void Restore() = 0;
};

}  // namespace flashdrop::metadata
