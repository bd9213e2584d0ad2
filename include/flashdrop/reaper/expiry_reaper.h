#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <Poco/Timestamp.h>

#include "flashdrop/core/config.h"
#include "flashdrop/core/time.h"

namespace flashdrop::metadata {
class MetadataStore;
}

namespace flashdrop::storage {
class LocalStorage;
}

namespace flashdrop::upload {
class ChunkSessionTracker;
}

namespace flashdrop::reaper {

/// @brief What one sweep reclaimed.
struct SweepReport {
    std::size_t files_reclaimed{0};
    std::size_t objects_already_gone{0};
    std::size_t orphan_objects_removed{0};
    std::size_t chunks_removed{0};
    std::size_t sessions_dropped{0};
};

/// @brief Periodic retention enforcement: expired records and their objects, stale
/// chunk files, abandoned upload sessions and objects that lost their record.
///
/// Runs on a strand of the server's io_context. A failing sweep is logged and the
/// next one is scheduled as usual; only Stop() ends the loop.
class ExpiryReaper {
public:
    enum class State { kIdle, kSweeping, kStopped };

    ExpiryReaper(boost::asio::io_context& ioc, std::shared_ptr<metadata::MetadataStore> metadata,
                 std::shared_ptr<storage::LocalStorage> storage,
                 std::shared_ptr<upload::ChunkSessionTracker> tracker,
                 core::RetentionConfig retention, core::Clock clock = core::SystemClock());

    ExpiryReaper(const ExpiryReaper&) = delete;
    ExpiryReaper& operator=(const ExpiryReaper&) = delete;

    /// @brief Sweeps once immediately, then every sweep interval.
    void Start();
    /// @brief Cancels the pending wait. The future is ready once the final metadata
    /// snapshot has been written; the io_context must still be running.
    std::shared_future<void> Stop();

    /// @brief One full sweep against `now`. May throw on unexpected I/O failures.
    SweepReport RunCycle(const Poco::Timestamp& now);

    State state() const { return state_.load(); }

private:
    void Tick();
    void ScheduleNext();
    void Finish();

    std::shared_ptr<metadata::MetadataStore> metadata_;
    std::shared_ptr<storage::LocalStorage> storage_;
    std::shared_ptr<upload::ChunkSessionTracker> tracker_;
    core::RetentionConfig retention_;
    core::Clock clock_;

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    std::atomic<State> state_{State::kIdle};
    bool stopping_{false};
    std::promise<void> stopped_;
    std::shared_future<void> stopped_future_;
};

}  // namespace flashdrop::reaper
