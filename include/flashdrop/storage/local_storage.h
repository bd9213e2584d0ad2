#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "flashdrop/core/error.h"
#include "flashdrop/core/result.h"

namespace flashdrop::storage {

/// @brief Upload extensions accepted at the chunk boundary (lower-case, with dot).
const std::vector<std::string>& AllowedExtensions();

/// @brief Outcome of an orphan-chunk sweep.
struct ChunkSweepResult {
    std::size_t removed{0};
    std::size_t failed{0};
};

/// @brief Local filesystem layout: completed objects, in-flight chunks and temp files.
class LocalStorage {
public:
    LocalStorage(std::string object_path, std::string chunk_path, std::string temp_path);

    /// @brief Path of the stored object `{id}{extension}` under the object root.
    std::filesystem::path ObjectPath(const std::string& id, const std::string& extension) const;
    /// @brief Path of one stored chunk `{token}_{index}{extension}` under the chunk root.
    std::filesystem::path ChunkPath(const std::string& session_token, int index,
                                    const std::string& extension) const;
    /// @brief Fresh unique path under the temp root.
    std::filesystem::path NewTempPath() const;

    /// @brief True when an object named `id` (bare or with any allowed extension) exists.
    bool HasObjectWithId(const std::string& id) const;

    /// @brief Writes `data` to `path`, replacing any previous content; returns bytes written.
    core::Result<std::uint64_t> WriteChunk(const std::filesystem::path& path,
                                           std::string_view data);
    /// @brief Renames `from` over `to`, replacing whatever `to` held.
    core::Result<void> MoveFile(const std::filesystem::path& from,
                                const std::filesystem::path& to);
    /// @brief Removes a file; a file that is already gone is not an error.
    core::Result<void> RemoveFile(const std::filesystem::path& path);
    /// @brief Deletes chunk files whose last write time is older than `max_age`.
    ChunkSweepResult RemoveStaleChunks(std::chrono::seconds max_age);
    /// @brief Object files whose last write time is older than `max_age`.
    std::vector<std::filesystem::path> ListObjectsOlderThan(std::chrono::seconds max_age) const;

    static bool IsSafeName(const std::string& name);
    /// @brief Lower-cased suffix of a file name including the dot, or empty.
    static std::string ExtensionOf(const std::string& file_name);
    static bool IsAllowedExtension(const std::string& extension);

private:
    std::string object_path_;
    std::string chunk_path_;
    std::string temp_path_;
};

}  // namespace flashdrop::storage
