#include "dsup/api/wait.hpp"

#include "dsup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace dsup::api {

dsup::Result<WaitOutcome> wait_for_finish(const SnapshotFetcher& fetch, const WaitOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    const Sleeper sleep = options.sleeper ? options.sleeper : Sleeper([](std::chrono::milliseconds ms) {
        std::this_thread::sleep_for(ms);
    });

    while (true) {
        auto fetched = fetch();
        if (fetched.is_error()) {
            return dsup::Err<WaitOutcome>(fetched.error());
        }
        const auto& snapshot = fetched.value();

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (options.bus) {
            options.bus->emit(events::StatusPolledEvent{snapshot.id, snapshot.is_finished(),
                                                        snapshot.is_failed(), elapsed});
        }
        if (options.progress) {
            options.progress(snapshot);
        }

        if (snapshot.is_failed()) {
            spdlog::warn("Source {} reported failure at {}", snapshot.id, *snapshot.failed_at);
            return dsup::Ok(WaitOutcome{FinishStatus::Failed, snapshot});
        }
        if (snapshot.is_finished()) {
            spdlog::info("Source {} finished at {}", snapshot.id, *snapshot.finished_at);
            return dsup::Ok(WaitOutcome{FinishStatus::Finished, snapshot});
        }

        if (options.timeout && elapsed >= *options.timeout) {
            return dsup::Err<WaitOutcome>(ErrorCode::Timeout,
                "Source " + std::to_string(snapshot.id) + " did not finish within " +
                std::to_string(options.timeout->count()) + "ms");
        }

        sleep(options.sleep_interval);
    }
}

} // namespace dsup::api
