#include "flashdrop/upload/assembler.h"

#include <array>
#include <filesystem>
#include <fstream>

#include "flashdrop/core/human_size.h"
#include "flashdrop/core/logger.h"
#include "flashdrop/observability/metrics.h"
#include "flashdrop/storage/local_storage.h"
#include "flashdrop/storage/mime_sniffer.h"
#include "flashdrop/upload/chunk_session_tracker.h"
#include "flashdrop/upload/identifier_allocator.h"

namespace flashdrop::upload {

namespace {
constexpr std::size_t kCopyBufferSize = 8192;
}

Assembler::Assembler(std::shared_ptr<storage::LocalStorage> storage,
                     std::shared_ptr<ChunkSessionTracker> tracker,
                     std::shared_ptr<IdentifierAllocator> allocator,
                     std::shared_ptr<metadata::MetadataStore> metadata, int file_ttl_seconds,
                     core::Clock clock)
    : storage_(std::move(storage)),
      tracker_(std::move(tracker)),
      allocator_(std::move(allocator)),
      metadata_(std::move(metadata)),
      file_ttl_seconds_(file_ttl_seconds),
      clock_(std::move(clock)) {}

core::Result<metadata::FileRecord> Assembler::Complete(const std::string& session_token,
                                                       int total_chunks) {
    if (total_chunks <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "totalChunks must be positive"};
    }
    auto taken = tracker_->TakeSession(session_token, total_chunks);
    if (!taken.ok()) {
        return taken.error();
    }
    const auto& session = taken.value();

    auto id = allocator_->Allocate();
    if (!id.ok()) {
        DiscardChunks(session);
        return id.error();
    }

    const auto temp_path = storage_->NewTempPath().string();
    auto concatenated = Concatenate(session, total_chunks, temp_path);
    if (!concatenated.ok()) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        DiscardChunks(session);
        allocator_->Release(id.value());
        core::LogError("Assembly of session " + session_token + " failed: " +
                       concatenated.error().message);
        return concatenated.error();
    }

    const auto final_path = storage_->ObjectPath(id.value(), session.extension);
    std::error_code ec;
    std::filesystem::rename(temp_path, final_path, ec);
    // The object now guards its own id through the directory check.
    allocator_->Release(id.value());
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return core::Error{core::ErrorCode::kAssemblyFailed,
                           "failed to move assembled object into place: " + ec.message()};
    }

    const auto size = std::filesystem::file_size(final_path, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kAssemblyFailed,
                           "cannot stat assembled object: " + ec.message()};
    }

    metadata::FileRecord record;
    record.id = id.value();
    record.original_name = session.file_name;
    record.mime_type = storage::SniffMimeTypeOfFile(final_path);
    record.size_bytes = static_cast<std::uint64_t>(size);
    record.human_size = core::HumanSize(record.size_bytes);
    record.upload_time = clock_();
    record.expiry_time = core::AddSeconds(record.upload_time, file_ttl_seconds_);
    record.extension = session.extension;

    auto inserted = metadata_->Insert(record);
    if (!inserted.ok()) {
        std::filesystem::remove(final_path, ec);
        return core::Error{core::ErrorCode::kAssemblyFailed, inserted.error().message};
    }

    observability::RecordUploadCompleted(record.size_bytes);
    core::LogInfo("Stored " + record.id + record.extension + " (" + record.human_size + ", " +
                  record.mime_type + ") from session " + session_token);
    return record;
}

core::Result<void> Assembler::Concatenate(const UploadSession& session, int total_chunks,
                                          const std::string& temp_path) {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kAssemblyFailed, "failed to open destination"};
    }

    std::array<char, kCopyBufferSize> buffer{};
    for (int index = 0; index < total_chunks; ++index) {
        const auto& chunk = session.chunks.at(index);
        {
            std::ifstream in(chunk.path, std::ios::binary);
            if (!in.is_open()) {
                return core::Error{core::ErrorCode::kAssemblyFailed,
                                   "failed to read chunk " + std::to_string(index)};
            }
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto bytes = in.gcount();
                if (bytes <= 0) {
                    break;
                }
                out.write(buffer.data(), bytes);
            }
            if (in.bad() || !out) {
                return core::Error{core::ErrorCode::kAssemblyFailed,
                                   "failed to copy chunk " + std::to_string(index)};
            }
        }
        auto removed = storage_->RemoveFile(chunk.path);
        if (!removed.ok()) {
            core::LogWarning(removed.error().message);
        }
    }

    out.flush();
    if (!out) {
        return core::Error{core::ErrorCode::kAssemblyFailed, "failed to flush destination"};
    }
    return core::Ok();
}

void Assembler::DiscardChunks(const UploadSession& session) {
    for (const auto& entry : session.chunks) {
        auto removed = storage_->RemoveFile(entry.second.path);
        if (!removed.ok()) {
            core::LogWarning(removed.error().message);
        }
    }
}

}  // namespace flashdrop::upload
