#pragma once

#include "dsup/api/snapshot.hpp"
#include "dsup/core/result.hpp"
#include "dsup/events/event_bus.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace dsup::api {

enum class FinishStatus {
    Finished, ///< finished_at is set
    Failed    ///< failed_at is set; the service rejected the upload
};

struct WaitOutcome {
    FinishStatus status = FinishStatus::Finished;
    SourceSnapshot snapshot;

    [[nodiscard]] bool ok() const noexcept { return status == FinishStatus::Finished; }
};

using SnapshotFetcher = std::function<dsup::Result<SourceSnapshot>()>;
using ProgressCallback = std::function<void(const SourceSnapshot&)>;
/// Replaceable for tests; defaults to std::this_thread::sleep_for
using Sleeper = std::function<void(std::chrono::milliseconds)>;

struct WaitOptions {
    ProgressCallback progress;
    std::optional<std::chrono::milliseconds> timeout;   ///< nullopt waits forever
    std::chrono::milliseconds sleep_interval{1000};
    Sleeper sleeper;
    events::EventBus* bus = nullptr;
};

/**
 * @brief Poll a source until it reports finished or failed
 *
 * Runs on the calling thread: fetch, report progress, check the markers,
 * sleep, repeat. A remote failure is a normal WaitOutcome; running past
 * `timeout` is ErrorCode::Timeout and a failed fetch is returned as is.
 */
dsup::Result<WaitOutcome> wait_for_finish(const SnapshotFetcher& fetch, const WaitOptions& options);

} // namespace dsup::api
