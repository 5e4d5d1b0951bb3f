#include "dsup/api/wait.hpp"
#include "dsup/events/components.hpp"
#include "dsup/events/event_bus.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using dsup::Error;
using dsup::ErrorCode;
using dsup::api::FinishStatus;
using dsup::api::SourceSnapshot;
using dsup::api::WaitOptions;
using dsup::api::wait_for_finish;

namespace {

SourceSnapshot pending(std::int64_t id) {
    SourceSnapshot snapshot;
    snapshot.id = id;
    return snapshot;
}

WaitOptions no_sleep_options(std::vector<std::chrono::milliseconds>* sleeps = nullptr) {
    WaitOptions options;
    options.sleep_interval = std::chrono::milliseconds(250);
    options.sleeper = [sleeps](std::chrono::milliseconds interval) {
        if (sleeps) {
            sleeps->push_back(interval);
        }
    };
    return options;
}

} // namespace

TEST(WaitForFinishTest, PollsUntilFinished) {
    int polls = 0;
    auto fetch = [&]() -> dsup::Result<SourceSnapshot> {
        auto snapshot = pending(9);
        if (++polls == 3) {
            snapshot.finished_at = "2024-01-01T00:00:00Z";
        }
        return dsup::Ok(snapshot);
    };

    std::vector<std::chrono::milliseconds> sleeps;
    auto options = no_sleep_options(&sleeps);
    int progress_calls = 0;
    options.progress = [&](const SourceSnapshot&) { progress_calls++; };

    auto outcome = wait_for_finish(fetch, options);

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().status, FinishStatus::Finished);
    EXPECT_TRUE(outcome.value().ok());
    EXPECT_EQ(polls, 3);
    EXPECT_EQ(progress_calls, 3);
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>(2, std::chrono::milliseconds(250))));
}

TEST(WaitForFinishTest, RemoteFailureIsAnOutcomeNotAnError) {
    auto fetch = []() -> dsup::Result<SourceSnapshot> {
        auto snapshot = pending(4);
        snapshot.failed_at = "2024-01-01T00:00:00Z";
        snapshot.failure_details = {{"message", "unparseable"}};
        return dsup::Ok(snapshot);
    };

    auto outcome = wait_for_finish(fetch, no_sleep_options());

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().status, FinishStatus::Failed);
    EXPECT_FALSE(outcome.value().ok());
    EXPECT_EQ(outcome.value().snapshot.failure_details["message"], "unparseable");
}

TEST(WaitForFinishTest, TimesOutWhenNeverFinished) {
    int polls = 0;
    auto fetch = [&]() -> dsup::Result<SourceSnapshot> {
        polls++;
        return dsup::Ok(pending(1));
    };

    auto options = no_sleep_options();
    options.timeout = std::chrono::milliseconds(0);
    auto outcome = wait_for_finish(fetch, options);

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::Timeout);
    EXPECT_EQ(polls, 1);
}

TEST(WaitForFinishTest, RealClockTimeoutStopsPolling) {
    auto fetch = []() -> dsup::Result<SourceSnapshot> { return dsup::Ok(pending(1)); };

    WaitOptions options;
    options.sleep_interval = std::chrono::milliseconds(5);
    options.timeout = std::chrono::milliseconds(40);
    auto outcome = wait_for_finish(fetch, options);

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::Timeout);
}

TEST(WaitForFinishTest, FetchErrorIsPropagated) {
    auto fetch = []() -> dsup::Result<SourceSnapshot> {
        return dsup::Err<SourceSnapshot>(Error{ErrorCode::Transport, "503", 503});
    };

    auto outcome = wait_for_finish(fetch, no_sleep_options());

    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::Transport);
    EXPECT_EQ(outcome.error().http_status, 503);
}

TEST(WaitForFinishTest, EmitsStatusPolledEvents) {
    int polls = 0;
    auto fetch = [&]() -> dsup::Result<SourceSnapshot> {
        auto snapshot = pending(2);
        if (++polls == 2) {
            snapshot.finished_at = "now";
        }
        return dsup::Ok(snapshot);
    };

    dsup::events::EventBus bus;
    dsup::events::MetricsComponent metrics(bus);
    auto options = no_sleep_options();
    options.bus = &bus;

    ASSERT_TRUE(wait_for_finish(fetch, options).is_ok());
    EXPECT_EQ(metrics.stats().status_polls.load(), 2u);
}
