#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "flashdrop/metadata/metadata_store.h"

namespace flashdrop::metadata {

/// @brief In-memory store persisted as one JSON document, rewritten on every mutation.
class JsonMetadataStore : public MetadataStore {
public:
    explicit JsonMetadataStore(std::filesystem::path snapshot_path);

    core::Result<FileRecord> Get(const std::string& id) override;
    core::Result<void> Insert(const FileRecord& record) override;
    core::Result<void> Delete(const std::string& id) override;
    std::size_t Size() override;

    std::vector<FileRecord> RemoveExpired(const Poco::Timestamp& now,
                                          const ReclaimFn& reclaim) override;

    core::Result<void> Snapshot() override;
    void Restore() override;

    static std::string Serialize(const std::map<std::string, FileRecord>& records);
    static core::Result<std::map<std::string, FileRecord>> Deserialize(const std::string& text);

private:
    // Callers must hold mutex_.
    core::Result<void> SnapshotLocked();
    void PersistAfterMutationLocked(const char* operation);

    std::filesystem::path snapshot_path_;
    std::mutex mutex_;
    std::map<std::string, FileRecord> records_;
};

}  // namespace flashdrop::metadata
