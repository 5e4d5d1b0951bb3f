/**
 * @file components.hpp
 * @brief Ready-made subscribers for upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * UploadCoordinator coordinator(api, &bus);
 */

#pragma once

#include "dsup/events/event_bus.hpp"
#include "dsup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace dsup::events {

/**
 * @brief Logs every upload event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe<UploadInitiatedEvent>([](const UploadInitiatedEvent& e) {
            spdlog::info("[UploadInitiated] content_type={} chunk_size={} parallelism={}",
                         e.content_type, e.chunk_size, e.parallelism);
        }));

        subscriptions_.push_back(bus.subscribe<ChunkUploadedEvent>([](const ChunkUploadedEvent& e) {
            spdlog::debug("[ChunkUploaded] seq={} range=[{}, {}) bytes={}",
                          e.seq_num, e.byte_offset, e.end_byte_offset, e.bytes());
        }));

        subscriptions_.push_back(bus.subscribe<UploadCommittedEvent>([](const UploadCommittedEvent& e) {
            if (e.commit_issued) {
                spdlog::info("[UploadCommitted] content_type={} chunks={} bytes={} duration={}ms",
                             e.content_type, e.chunks, e.total_bytes, e.duration.count());
            } else {
                spdlog::info("[UploadCommitted] content_type={} empty upload, commit skipped",
                             e.content_type);
            }
        }));

        subscriptions_.push_back(bus.subscribe<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[UploadFailed] content_type={} stage={} error={}",
                          e.content_type, e.stage, e.error);
        }));

        subscriptions_.push_back(bus.subscribe<StatusPolledEvent>([](const StatusPolledEvent& e) {
            spdlog::debug("[StatusPolled] source={} finished={} failed={} elapsed={}ms",
                          e.source_id, e.finished, e.failed, e.elapsed.count());
        }));
    }

private:
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Counts upload activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.stats();
 * spdlog::info("bytes sent: {}", stats.bytes_sent.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> uploads_started{0};
        std::atomic<std::uint64_t> uploads_committed{0};
        std::atomic<std::uint64_t> uploads_failed{0};
        std::atomic<std::uint64_t> chunks_sent{0};
        std::atomic<std::uint64_t> bytes_sent{0};
        std::atomic<std::uint64_t> status_polls{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe<UploadInitiatedEvent>([this](const UploadInitiatedEvent&) {
            stats_.uploads_started++;
        }));

        subscriptions_.push_back(bus.subscribe<ChunkUploadedEvent>([this](const ChunkUploadedEvent& e) {
            stats_.chunks_sent++;
            stats_.bytes_sent += e.bytes();
        }));

        subscriptions_.push_back(bus.subscribe<UploadCommittedEvent>([this](const UploadCommittedEvent&) {
            stats_.uploads_committed++;
        }));

        subscriptions_.push_back(bus.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        }));

        subscriptions_.push_back(bus.subscribe<StatusPolledEvent>([this](const StatusPolledEvent&) {
            stats_.status_polls++;
        }));
    }

    // Handlers capture `this`
    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& stats() const noexcept { return stats_; }

private:
    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

} // namespace dsup::events
