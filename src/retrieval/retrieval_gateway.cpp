#include "flashdrop/retrieval/retrieval_gateway.h"

#include "flashdrop/core/logger.h"
#include "flashdrop/storage/local_storage.h"

namespace flashdrop::retrieval {

RetrievalGateway::RetrievalGateway(std::shared_ptr<metadata::MetadataStore> metadata,
                                   std::shared_ptr<storage::LocalStorage> storage)
    : metadata_(std::move(metadata)), storage_(std::move(storage)) {}

core::Result<ResolvedFile> RetrievalGateway::Resolve(const std::string& id_or_name,
                                                     const Poco::Timestamp& now) const {
    const auto id = BaseId(id_or_name);
    if (!storage::LocalStorage::IsSafeName(id)) {
        return core::Error{core::ErrorCode::kNotFound, "file not found"};
    }

    auto record = metadata_->Get(id);
    if (!record.ok()) {
        return core::Error{core::ErrorCode::kNotFound, "file not found"};
    }
    if (now > record.value().expiry_time) {
        return core::Error{core::ErrorCode::kExpired, "file has expired"};
    }

    ResolvedFile resolved;
    resolved.path = storage_->ObjectPath(id, record.value().extension);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(resolved.path, ec)) {
        core::LogWarning("Record " + id + " has no backing object at " + resolved.path.string());
        return core::Error{core::ErrorCode::kNotFound, "file not found"};
    }
    resolved.record = std::move(record.value());
    return resolved;
}

std::string RetrievalGateway::BaseId(const std::string& id_or_name) {
    return id_or_name.substr(0, id_or_name.find('.'));
}

bool RetrievalGateway::PreferRawResponse(const std::string& raw_param,
                                         const std::string& accept_header) {
    return raw_param == "true" || accept_header.rfind("image/", 0) == 0 ||
           accept_header.rfind("video/", 0) == 0;
}

}  // namespace flashdrop::retrieval
