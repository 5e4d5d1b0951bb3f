#include "dsup/upload/session.hpp"

#include <gtest/gtest.h>

using dsup::ErrorCode;
using dsup::upload::ChunkReceipt;
using dsup::upload::UploadSession;
using dsup::upload::UploadState;

TEST(UploadSessionTest, BeginDispatchRecordsPlan) {
    UploadSession session{"text/csv"};
    EXPECT_EQ(session.state(), UploadState::Init);

    ASSERT_TRUE(session.begin_dispatch(100, 4).is_ok());

    const auto& info = session.info();
    EXPECT_EQ(info.content_type, "text/csv");
    EXPECT_EQ(info.state, UploadState::Dispatching);
    EXPECT_EQ(info.chunk_size, 100u);
    EXPECT_EQ(info.parallelism, 4u);
}

TEST(UploadSessionTest, FollowsLifecycleToCommitted) {
    UploadSession session{"text/csv"};
    ASSERT_TRUE(session.begin_dispatch(100, 2).is_ok());
    ASSERT_TRUE(session.await_commit({{0, 0, 100}, {1, 100, 150}}, 150, 2).is_ok());
    EXPECT_EQ(session.info().receipts.size(), 2u);
    EXPECT_EQ(session.info().bytes_read, 150u);

    ASSERT_TRUE(session.mark_committed(true).is_ok());
    EXPECT_EQ(session.state(), UploadState::Committed);
    EXPECT_TRUE(session.info().commit_issued);
    EXPECT_TRUE(session.is_terminal());
}

TEST(UploadSessionTest, RejectsSkippedStates) {
    UploadSession session{"text/csv"};

    auto skipped = session.mark_committed(true);
    ASSERT_TRUE(skipped.is_error());
    EXPECT_EQ(skipped.error().code, ErrorCode::IllegalState);
    EXPECT_EQ(session.state(), UploadState::Init);

    ASSERT_TRUE(session.begin_dispatch(10, 1).is_ok());
    EXPECT_TRUE(session.begin_dispatch(10, 1).is_error());
}

TEST(UploadSessionTest, FailureReachableFromAnyActiveState) {
    UploadSession from_init{"a"};
    EXPECT_TRUE(from_init.mark_failed("initiate refused").is_ok());
    EXPECT_EQ(from_init.info().last_error, "initiate refused");

    UploadSession from_dispatch{"a"};
    ASSERT_TRUE(from_dispatch.begin_dispatch(1, 1).is_ok());
    EXPECT_TRUE(from_dispatch.mark_failed("chunk 3 rejected").is_ok());

    UploadSession from_commit{"a"};
    ASSERT_TRUE(from_commit.begin_dispatch(1, 1).is_ok());
    ASSERT_TRUE(from_commit.await_commit({}, 0, 0).is_ok());
    EXPECT_TRUE(from_commit.mark_failed("commit refused").is_ok());
    EXPECT_EQ(from_commit.state(), UploadState::Failed);
}

TEST(UploadSessionTest, TerminalStatesRejectEverything) {
    UploadSession failed{"a"};
    ASSERT_TRUE(failed.mark_failed("x").is_ok());
    EXPECT_TRUE(failed.mark_failed("y").is_error());
    EXPECT_TRUE(failed.begin_dispatch(1, 1).is_error());
    EXPECT_EQ(failed.info().last_error, "x");

    UploadSession committed{"a"};
    ASSERT_TRUE(committed.begin_dispatch(1, 1).is_ok());
    ASSERT_TRUE(committed.await_commit({}, 0, 0).is_ok());
    ASSERT_TRUE(committed.mark_committed(false).is_ok());
    EXPECT_TRUE(committed.mark_failed("late").is_error());
    EXPECT_EQ(committed.state(), UploadState::Committed);
}
