#include "flashdrop/storage/mime_sniffer.h"

#include <array>
#include <fstream>

namespace flashdrop::storage {

namespace {

constexpr std::size_t kSniffBytes = 64;

struct Signature {
    std::size_t offset;
    std::string_view magic;
    const char* mime_type;
};

// Ordered: the first matching signature wins.
const std::array<Signature, 11> kSignatures{{
    {0, std::string_view("\x89PNG\r\n\x1a\n", 8), "image/png"},
    {0, std::string_view("\xff\xd8\xff", 3), "image/jpeg"},
    {0, "GIF87a", "image/gif"},
    {0, "GIF89a", "image/gif"},
    {0, "%PDF-", "application/pdf"},
    {0, std::string_view("\x1a\x45\xdf\xa3", 4), "video/webm"},
    {4, "ftypqt", "video/quicktime"},
    {4, "ftyp", "video/mp4"},
    {0, "BM", "image/bmp"},
    {0, std::string_view("PK\x03\x04", 4), "application/zip"},
    {0, std::string_view("\x1f\x8b", 2), "application/gzip"},
}};

bool IsWebp(std::string_view head) {
    return head.size() >= 12 && head.substr(0, 4) == "RIFF" && head.substr(8, 4) == "WEBP";
}

bool LooksLikeText(std::string_view head) {
    if (head.empty()) {
        return false;
    }
    for (unsigned char c : head) {
        if (c < 0x09 || (c > 0x0d && c < 0x20 && c != 0x1b)) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string SniffMimeType(std::string_view head) {
    if (IsWebp(head)) {
        return "image/webp";
    }
    for (const auto& signature : kSignatures) {
        if (head.size() >= signature.offset + signature.magic.size() &&
            head.substr(signature.offset, signature.magic.size()) == signature.magic) {
            return signature.mime_type;
        }
    }
    if (head.empty()) {
        return "application/x-empty";
    }
    if (LooksLikeText(head)) {
        return "text/plain";
    }
    return "application/octet-stream";
}

std::string SniffMimeTypeOfFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return "application/octet-stream";
    }
    std::array<char, kSniffBytes> buffer{};
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    return SniffMimeType(std::string_view(buffer.data(), static_cast<std::size_t>(in.gcount())));
}

}  // namespace flashdrop::storage
