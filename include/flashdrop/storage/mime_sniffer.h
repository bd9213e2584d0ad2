#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace flashdrop::storage {

/// @brief Detect a MIME type from leading content bytes; falls back to
/// "application/octet-stream" when no signature matches.
std::string SniffMimeType(std::string_view head);

/// @brief Reads the head of a file and sniffs its MIME type.
std::string SniffMimeTypeOfFile(const std::filesystem::path& path);

}  // namespace flashdrop::storage
