#include "dsup/events/components.hpp"
#include "dsup/events/event_bus.hpp"
#include "dsup/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using dsup::events::ChunkUploadedEvent;
using dsup::events::EventBus;
using dsup::events::LoggerComponent;
using dsup::events::MetricsComponent;
using dsup::events::StatusPolledEvent;
using dsup::events::UploadCommittedEvent;
using dsup::events::UploadFailedEvent;
using dsup::events::UploadInitiatedEvent;

TEST(MetricsComponentTest, CountsUploadActivity) {
    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    bus.emit(UploadInitiatedEvent{"text/csv", 100, 4});
    bus.emit(ChunkUploadedEvent{0, 0, 100});
    bus.emit(ChunkUploadedEvent{1, 100, 200});
    bus.emit(ChunkUploadedEvent{2, 200, 250});
    bus.emit(UploadCommittedEvent{"text/csv", 3, 250, true, std::chrono::milliseconds{12}});
    bus.emit(StatusPolledEvent{7, false, false, std::chrono::milliseconds{0}});
    bus.emit(StatusPolledEvent{7, true, false, std::chrono::milliseconds{1000}});

    bus.emit(UploadInitiatedEvent{"application/zip", 100, 2});
    bus.emit(UploadFailedEvent{"application/zip", "dispatch", "transport: 500"});

    const auto& stats = metrics.stats();
    EXPECT_EQ(stats.uploads_started.load(), 2u);
    EXPECT_EQ(stats.uploads_committed.load(), 1u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.chunks_sent.load(), 3u);
    EXPECT_EQ(stats.bytes_sent.load(), 250u);
    EXPECT_EQ(stats.status_polls.load(), 2u);
}
