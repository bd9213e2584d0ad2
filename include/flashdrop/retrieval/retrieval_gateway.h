#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <Poco/Timestamp.h>

#include "flashdrop/core/result.h"
#include "flashdrop/metadata/metadata_store.h"

namespace flashdrop::storage {
class LocalStorage;
}

namespace flashdrop::retrieval {

/// @brief A live record together with the object file that backs it.
struct ResolvedFile {
    metadata::FileRecord record;
    std::filesystem::path path;
};

/// @brief Read-side lookup of share links.
class RetrievalGateway {
public:
    RetrievalGateway(std::shared_ptr<metadata::MetadataStore> metadata,
                     std::shared_ptr<storage::LocalStorage> storage);

    /// @brief Accepts "abc123" or "abc123.png". kNotFound when the record or its object
    /// is missing, kExpired when now is past the expiry time.
    core::Result<ResolvedFile> Resolve(const std::string& id_or_name,
                                       const Poco::Timestamp& now) const;

    /// @brief Identifier part of a share-link segment (text before the first '.').
    static std::string BaseId(const std::string& id_or_name);
    /// @brief Raw bytes are served for ?raw=true or when the client asks for image/video.
    static bool PreferRawResponse(const std::string& raw_param, const std::string& accept_header);

private:
    std::shared_ptr<metadata::MetadataStore> metadata_;
    std::shared_ptr<storage::LocalStorage> storage_;
};

}  // namespace flashdrop::retrieval
