#include "flashdrop/storage/local_storage.h"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <Poco/UUIDGenerator.h>

#include "flashdrop/core/logger.h"

namespace flashdrop::storage {

const std::vector<std::string>& AllowedExtensions() {
    static const std::vector<std::string> kAllowed{".png", ".jpg", ".jpeg", ".gif",
                                                   ".mp4", ".webm", ".pdf"};
    return kAllowed;
}

LocalStorage::LocalStorage(std::string object_path, std::string chunk_path,
                           std::string temp_path)
    : object_path_(std::move(object_path)),
      chunk_path_(std::move(chunk_path)),
      temp_path_(std::move(temp_path)) {
    std::filesystem::create_directories(object_path_);
    std::filesystem::create_directories(chunk_path_);
    std::filesystem::create_directories(temp_path_);
}

std::filesystem::path LocalStorage::ObjectPath(const std::string& id,
                                               const std::string& extension) const {
    return std::filesystem::path(object_path_) / (id + extension);
}

std::filesystem::path LocalStorage::ChunkPath(const std::string& session_token, int index,
                                              const std::string& extension) const {
    return std::filesystem::path(chunk_path_) /
           (session_token + "_" + std::to_string(index) + extension);
}

std::filesystem::path LocalStorage::NewTempPath() const {
    return std::filesystem::path(temp_path_) / Poco::UUIDGenerator().createOne().toString();
}

bool LocalStorage::HasObjectWithId(const std::string& id) const {
    std::error_code ec;
    if (std::filesystem::exists(ObjectPath(id, ""), ec)) {
        return true;
    }
    for (const auto& extension : AllowedExtensions()) {
        if (std::filesystem::exists(ObjectPath(id, extension), ec)) {
            return true;
        }
    }
    return false;
}

core::Result<std::uint64_t> LocalStorage::WriteChunk(const std::filesystem::path& path,
                                                     std::string_view data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kChunkWriteFailed,
                           "failed to open chunk file " + path.filename().string()};
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return core::Error{core::ErrorCode::kChunkWriteFailed,
                           "failed to write chunk file " + path.filename().string()};
    }
    return static_cast<std::uint64_t>(data.size());
}

core::Result<void> LocalStorage::MoveFile(const std::filesystem::path& from,
                                          const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kChunkWriteFailed,
                           "failed to move " + from.filename().string() + " to " +
                               to.filename().string() + ": " + ec.message()};
    }
    return core::Ok();
}

core::Result<void> LocalStorage::RemoveFile(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to remove " + path.string() + ": " + ec.message()};
    }
    return core::Ok();
}

ChunkSweepResult LocalStorage::RemoveStaleChunks(std::chrono::seconds max_age) {
    ChunkSweepResult result;
    const auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;

    std::error_code ec;
    std::filesystem::directory_iterator it(chunk_path_, ec);
    if (ec) {
        core::LogError("Chunk sweep cannot list " + chunk_path_ + ": " + ec.message());
        ++result.failed;
        return result;
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        const auto modified = entry.last_write_time(entry_ec);
        if (entry_ec || modified >= cutoff) {
            continue;
        }
        if (std::filesystem::remove(entry.path(), entry_ec)) {
            ++result.removed;
        } else if (entry_ec) {
            core::LogError("Chunk sweep failed to remove " + entry.path().string() + ": " +
                           entry_ec.message());
            ++result.failed;
        }
    }
    return result;
}

std::vector<std::filesystem::path> LocalStorage::ListObjectsOlderThan(
    std::chrono::seconds max_age) const {
    std::vector<std::filesystem::path> objects;
    const auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;

    std::error_code ec;
    std::filesystem::directory_iterator it(object_path_, ec);
    if (ec) {
        core::LogError("Cannot list object directory " + object_path_ + ": " + ec.message());
        return objects;
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        const auto modified = entry.last_write_time(entry_ec);
        if (!entry_ec && modified < cutoff) {
            objects.push_back(entry.path());
        }
    }
    return objects;
}

bool LocalStorage::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == "..") {
        return false;
    }
    return true;
}

std::string LocalStorage::ExtensionOf(const std::string& file_name) {
    auto extension = std::filesystem::path(file_name).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return extension;
}

bool LocalStorage::IsAllowedExtension(const std::string& extension) {
    const auto& allowed = AllowedExtensions();
    return std::find(allowed.begin(), allowed.end(), extension) != allowed.end();
}

}  // namespace flashdrop::storage
