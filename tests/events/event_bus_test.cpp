#include "dsup/events/event_bus.hpp"
#include "dsup/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using dsup::events::ChunkUploadedEvent;
using dsup::events::EventBus;
using dsup::events::Subscription;
using dsup::events::UploadFailedEvent;

TEST(EventBusTest, DeliversToSubscribersOfTheEventType) {
    EventBus bus;

    std::vector<std::uint64_t> seqs;
    int failures = 0;
    auto chunks = bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent& e) { seqs.push_back(e.seq_num); });
    auto failed = bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent&) { failures++; });

    bus.emit(ChunkUploadedEvent{0, 0, 100});
    bus.emit(ChunkUploadedEvent{1, 100, 150});

    EXPECT_EQ(seqs, (std::vector<std::uint64_t>{0, 1}));
    EXPECT_EQ(failures, 0);
}

TEST(EventBusTest, SubscriptionDetachesWhenDestroyed) {
    EventBus bus;

    int count = 0;
    {
        auto sub = bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent&) { count++; });
        EXPECT_TRUE(sub.active());
        bus.emit(ChunkUploadedEvent{0, 0, 1});
    }
    bus.emit(ChunkUploadedEvent{1, 1, 2});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<ChunkUploadedEvent>(), 0u);
}

TEST(EventBusTest, ReleasedSubscriptionCanBeRemovedById) {
    EventBus bus;

    int count = 0;
    const auto id = bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent&) { count++; }).release();
    bus.emit(ChunkUploadedEvent{0, 0, 1});
    EXPECT_EQ(bus.subscriber_count<ChunkUploadedEvent>(), 1u);

    bus.unsubscribe(id);
    bus.emit(ChunkUploadedEvent{1, 1, 2});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<ChunkUploadedEvent>(), 0u);
}

TEST(EventBusTest, MovedSubscriptionKeepsHandler) {
    EventBus bus;

    int count = 0;
    Subscription outer;
    {
        auto inner = bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent&) { count++; });
        outer = std::move(inner);
        EXPECT_FALSE(inner.active());
    }
    bus.emit(ChunkUploadedEvent{0, 0, 1});
    EXPECT_EQ(count, 1);

    outer.reset();
    bus.emit(ChunkUploadedEvent{1, 1, 2});
    EXPECT_EQ(count, 1);
}

TEST(EventBusTest, SubscriptionMayOutliveBus) {
    Subscription sub;
    {
        EventBus bus;
        sub = bus.subscribe<UploadFailedEvent>([](const UploadFailedEvent&) {});
    }
    EXPECT_FALSE(sub.active());
    EXPECT_NO_THROW(sub.reset());
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int delivered = 0;
    auto bad = bus.subscribe<ChunkUploadedEvent>([](const ChunkUploadedEvent&) {
        throw std::runtime_error("subscriber bug");
    });
    auto good = bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(ChunkUploadedEvent{0, 0, 10}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBusTest, ConcurrentEmitFromWorkers) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};
    auto sub = bus.subscribe<ChunkUploadedEvent>([&](const ChunkUploadedEvent& e) { bytes += e.bytes(); });

    std::vector<std::thread> workers;
    for (std::uint64_t i = 0; i < 16; ++i) {
        workers.emplace_back([&bus, i]() {
            bus.emit(ChunkUploadedEvent{i, i * 10, i * 10 + 10});
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(bytes.load(), 160u);
}

TEST(EventBusTest, ClearRemovesEverySubscription) {
    EventBus bus;
    auto chunks = bus.subscribe<ChunkUploadedEvent>([](const ChunkUploadedEvent&) {});
    auto failed = bus.subscribe<UploadFailedEvent>([](const UploadFailedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<ChunkUploadedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(UploadFailedEvent{"text/csv", "dispatch", "x"}));
}
