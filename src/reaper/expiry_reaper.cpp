#include "flashdrop/reaper/expiry_reaper.h"

#include <exception>
#include <filesystem>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include "flashdrop/core/logger.h"
#include "flashdrop/metadata/metadata_store.h"
#include "flashdrop/observability/metrics.h"
#include "flashdrop/storage/local_storage.h"
#include "flashdrop/upload/chunk_session_tracker.h"

namespace flashdrop::reaper {

namespace net = boost::asio;

ExpiryReaper::ExpiryReaper(net::io_context& ioc,
                           std::shared_ptr<metadata::MetadataStore> metadata,
                           std::shared_ptr<storage::LocalStorage> storage,
                           std::shared_ptr<upload::ChunkSessionTracker> tracker,
                           core::RetentionConfig retention, core::Clock clock)
    : metadata_(std::move(metadata)),
      storage_(std::move(storage)),
      tracker_(std::move(tracker)),
      retention_(retention),
      clock_(std::move(clock)),
      strand_(net::make_strand(ioc)),
      timer_(strand_),
      stopped_future_(stopped_.get_future().share()) {}

void ExpiryReaper::Start() {
    net::post(strand_, [this]() { Tick(); });
}

std::shared_future<void> ExpiryReaper::Stop() {
    net::post(strand_, [this]() {
        if (stopping_) {
            return;
        }
        stopping_ = true;
        timer_.cancel();
        Finish();
    });
    return stopped_future_;
}

void ExpiryReaper::Tick() {
    if (stopping_) {
        return;
    }
    state_ = State::kSweeping;
    try {
        RunCycle(clock_());
    } catch (const std::exception& ex) {
        core::LogError(std::string("Reaper cycle failed: ") + ex.what());
        observability::RecordReaperCycle(0, 0, 0, true);
    }
    state_ = State::kIdle;
    ScheduleNext();
}

void ExpiryReaper::ScheduleNext() {
    timer_.expires_after(std::chrono::seconds(retention_.sweep_interval_seconds));
    timer_.async_wait(net::bind_executor(strand_, [this](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted || stopping_) {
            return;
        }
        Tick();
    }));
}

void ExpiryReaper::Finish() {
    auto persisted = metadata_->Snapshot();
    if (!persisted.ok()) {
        core::LogError("Final metadata snapshot failed: " + persisted.error().message);
    }
    state_ = State::kStopped;
    core::LogInfo("Expiry reaper stopped");
    stopped_.set_value();
}

SweepReport ExpiryReaper::RunCycle(const Poco::Timestamp& now) {
    SweepReport report;

    // Object deletion happens inside the store lock so no reader sees a half-reaped id.
    auto removed = metadata_->RemoveExpired(now, [&](const metadata::FileRecord& record) {
        const auto path = storage_->ObjectPath(record.id, record.extension);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            ++report.objects_already_gone;
            return;
        }
        auto deleted = storage_->RemoveFile(path);
        if (!deleted.ok()) {
            core::LogError("Failed to delete expired object " + record.id + ": " +
                           deleted.error().message);
        }
    });
    report.files_reclaimed = removed.size();

    const auto file_ttl = std::chrono::seconds(retention_.file_ttl_seconds);
    for (const auto& path : storage_->ListObjectsOlderThan(file_ttl)) {
        const auto id = path.filename().string().substr(0, path.filename().string().find('.'));
        if (metadata_->Get(id).ok()) {
            continue;
        }
        core::LogWarning("Removing object without record: " + path.filename().string());
        if (storage_->RemoveFile(path).ok()) {
            ++report.orphan_objects_removed;
        }
    }

    const auto chunks =
        storage_->RemoveStaleChunks(std::chrono::seconds(retention_.orphan_chunk_ttl_seconds));
    report.chunks_removed = chunks.removed;

    const auto session_cutoff = core::AddSeconds(now, -retention_.session_ttl_seconds);
    for (const auto& session : tracker_->ExpireIdle(session_cutoff)) {
        for (const auto& entry : session.chunks) {
            auto deleted = storage_->RemoveFile(entry.second.path);
            if (deleted.ok()) {
                ++report.chunks_removed;
            } else {
                core::LogError(deleted.error().message);
            }
        }
        core::LogInfo("Dropped abandoned upload session " + session.token);
        ++report.sessions_dropped;
    }

    observability::RecordReaperCycle(report.files_reclaimed, report.chunks_removed,
                                     report.sessions_dropped, false);
    const auto summary = "Reaper sweep: " + std::to_string(report.files_reclaimed) +
                         " expired, " + std::to_string(report.orphan_objects_removed) +
                         " orphan objects, " + std::to_string(report.chunks_removed) +
                         " chunks, " + std::to_string(report.sessions_dropped) + " sessions";
    if (report.files_reclaimed + report.orphan_objects_removed + report.chunks_removed +
            report.sessions_dropped > 0) {
        core::LogInfo(summary);
    } else {
        core::LogDebug(summary);
    }
    return report;
}

}  // namespace flashdrop::reaper
