#include "flashdrop/metadata/json_metadata_store.h"

#include <fstream>
#include <sstream>

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/UUIDGenerator.h>

#include "flashdrop/core/logger.h"
#include "flashdrop/core/time.h"

namespace flashdrop::metadata {

bool operator==(const FileRecord& lhs, const FileRecord& rhs) {
    return lhs.id == rhs.id && lhs.original_name == rhs.original_name &&
           lhs.mime_type == rhs.mime_type && lhs.size_bytes == rhs.size_bytes &&
           lhs.human_size == rhs.human_size && lhs.upload_time == rhs.upload_time &&
           lhs.expiry_time == rhs.expiry_time && lhs.extension == rhs.extension;
}

JsonMetadataStore::JsonMetadataStore(std::filesystem::path snapshot_path)
    : snapshot_path_(std::move(snapshot_path)) {}

core::Result<FileRecord> JsonMetadataStore::Get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return core::Error{core::ErrorCode::kNotFound, "record not found"};
    }
    return it->second;
}

core::Result<void> JsonMetadataStore::Insert(const FileRecord& record) {
    if (record.id.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "record id is empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.id] = record;
    PersistAfterMutationLocked("insert");
    return core::Ok();
}

core::Result<void> JsonMetadataStore::Delete(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.erase(id) == 0) {
        return core::Error{core::ErrorCode::kNotFound, "record not found"};
    }
    PersistAfterMutationLocked("delete");
    return core::Ok();
}

std::size_t JsonMetadataStore::Size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<FileRecord> JsonMetadataStore::RemoveExpired(const Poco::Timestamp& now,
                                                         const ReclaimFn& reclaim) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FileRecord> removed;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.expiry_time < now) {
            if (reclaim) {
                reclaim(it->second);
            }
            removed.push_back(it->second);
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
    // One snapshot per batch; an empty sweep still rewrites so the file tracks memory.
    PersistAfterMutationLocked("expiry sweep");
    return removed;
}

core::Result<void> JsonMetadataStore::Snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    return SnapshotLocked();
}

void JsonMetadataStore::Restore() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(snapshot_path_, ec)) {
        core::LogInfo("No metadata snapshot at " + snapshot_path_.string() +
                      ", starting empty");
        return;
    }

    std::ifstream in(snapshot_path_, std::ios::binary);
    if (!in.is_open()) {
        core::LogError("Cannot open metadata snapshot " + snapshot_path_.string() +
                       ", starting empty");
        return;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = Deserialize(buffer.str());
    if (!parsed.ok()) {
        core::LogError("Corrupt metadata snapshot " + snapshot_path_.string() + ": " +
                       parsed.error().message + ", starting empty");
        return;
    }
    records_ = std::move(parsed.value());
    core::LogInfo("Restored " + std::to_string(records_.size()) + " file records");
}

core::Result<void> JsonMetadataStore::SnapshotLocked() {
    const auto body = Serialize(records_);
    try {
        if (snapshot_path_.has_parent_path()) {
            std::filesystem::create_directories(snapshot_path_.parent_path());
        }
        // Write beside the target, then rename so readers never see a torn document.
        auto temp_path = snapshot_path_;
        temp_path += ".tmp-" + Poco::UUIDGenerator().createOne().toString();
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                return core::Error{core::ErrorCode::kPersistenceFailed,
                                   "failed to open " + temp_path.string()};
            }
            out << body;
            out.flush();
            if (!out) {
                out.close();
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                return core::Error{core::ErrorCode::kPersistenceFailed,
                                   "failed to write " + temp_path.string()};
            }
        }
        std::filesystem::rename(temp_path, snapshot_path_);
    } catch (const std::filesystem::filesystem_error& ex) {
        return core::Error{core::ErrorCode::kPersistenceFailed, ex.what()};
    }
    return core::Ok();
}

void JsonMetadataStore::PersistAfterMutationLocked(const char* operation) {
    auto persisted = SnapshotLocked();
    if (!persisted.ok()) {
        // Memory stays authoritative; the next successful snapshot catches up.
        core::LogError(std::string("Metadata snapshot after ") + operation +
                       " failed: " + persisted.error().message);
    }
}

std::string JsonMetadataStore::Serialize(const std::map<std::string, FileRecord>& records) {
    Poco::JSON::Object root;
    for (const auto& entry : records) {
        const auto& record = entry.second;
        Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
        item->set("original_name", record.original_name);
        item->set("mime_type", record.mime_type);
        item->set("size", static_cast<Poco::UInt64>(record.size_bytes));
        item->set("human_size", record.human_size);
        item->set("upload_time", core::FormatIso8601(record.upload_time));
        item->set("expiry_time", core::FormatIso8601(record.expiry_time));
        item->set("extension", record.extension);
        root.set(entry.first, item);
    }
    std::stringstream ss;
    root.stringify(ss);
    return ss.str();
}

core::Result<std::map<std::string, FileRecord>> JsonMetadataStore::Deserialize(
    const std::string& text) {
    Poco::JSON::Object::Ptr root;
    try {
        Poco::JSON::Parser parser;
        auto parsed = parser.parse(text);
        root = parsed.extract<Poco::JSON::Object::Ptr>();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument, ex.displayText()};
    }
    if (!root) {
        return core::Error{core::ErrorCode::kInvalidArgument, "snapshot is not an object"};
    }

    std::map<std::string, FileRecord> records;
    for (auto it = root->begin(); it != root->end(); ++it) {
        const auto& id = it->first;
        try {
            auto item = root->getObject(id);
            if (!item) {
                core::LogWarning("Skipping metadata entry " + id + ": not an object");
                continue;
            }
            auto upload_time = core::ParseIso8601(item->getValue<std::string>("upload_time"));
            auto expiry_time = core::ParseIso8601(item->getValue<std::string>("expiry_time"));
            if (!upload_time.ok() || !expiry_time.ok()) {
                core::LogWarning("Skipping metadata entry " + id + ": bad timestamp");
                continue;
            }

            FileRecord record;
            record.id = id;
            record.original_name = item->getValue<std::string>("original_name");
            record.mime_type = item->getValue<std::string>("mime_type");
            record.size_bytes = item->getValue<Poco::UInt64>("size");
            record.human_size = item->optValue<std::string>("human_size", "");
            record.upload_time = upload_time.value();
            record.expiry_time = expiry_time.value();
            record.extension = item->optValue<std::string>("extension", "");
            records.emplace(id, std::move(record));
        } catch (const Poco::Exception& ex) {
            core::LogWarning("Skipping metadata entry " + id + ": " + ex.displayText());
        }
    }
    return records;
}

}  // namespace flashdrop::metadata
