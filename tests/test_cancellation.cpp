/**
 * test_cancellation.cpp
 */

#include "core/Cancellation.hpp"
#include "core/Errors.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace interlink::core;

class CancellationTest : public ::testing::Test {
protected:
    CancellationSource root;
};

TEST_F(CancellationTest, DefaultTokenIsNeverCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_EQ(token.reason(), CancelReason::None);
    EXPECT_FALSE(token.deadline().has_value());
    EXPECT_NO_THROW(token.throwIfCancelled());
    EXPECT_EQ(token.onCancel([] {}), 0u);
}

TEST_F(CancellationTest, CancelIsObservedAndIdempotent) {
    auto token = root.token();
    EXPECT_FALSE(token.isCancelled());

    root.cancel();
    root.cancel();

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.reason(), CancelReason::Cancelled);
    EXPECT_THROW(token.throwIfCancelled(), OperationCancelledError);
}

TEST_F(CancellationTest, CallbacksRunOnce) {
    std::atomic<int> calls{0};
    root.token().onCancel([&calls] { ++calls; });

    root.cancel();
    root.cancel();

    EXPECT_EQ(calls.load(), 1);
}

TEST_F(CancellationTest, CallbackOnCancelledTokenRunsImmediately) {
    root.cancel();

    bool called = false;
    root.token().onCancel([&called] { called = true; });
    EXPECT_TRUE(called);
}

TEST_F(CancellationTest, RemovedCallbackDoesNotRun) {
    bool called = false;
    auto id = root.token().onCancel([&called] { called = true; });
    root.token().removeCallback(id);

    root.cancel();
    EXPECT_FALSE(called);
}

TEST_F(CancellationTest, ParentCancellationReachesChildren) {
    CancellationSource first(root.token());
    CancellationSource second(root.token());

    root.cancel();

    EXPECT_TRUE(first.isCancelled());
    EXPECT_TRUE(second.isCancelled());
}

TEST_F(CancellationTest, ChildCancellationLeavesParentAndSiblings) {
    CancellationSource first(root.token());
    CancellationSource second(root.token());

    first.cancel();

    EXPECT_TRUE(first.isCancelled());
    EXPECT_FALSE(second.isCancelled());
    EXPECT_FALSE(root.isCancelled());
}

TEST_F(CancellationTest, ChildOfCancelledParentStartsCancelled) {
    root.cancel();
    CancellationSource child(root.token());
    EXPECT_TRUE(child.isCancelled());
}

TEST_F(CancellationTest, DestroyedChildDetachesFromParent) {
    {
        CancellationSource child(root.token());
    }
    EXPECT_NO_THROW(root.cancel());
}

TEST_F(CancellationTest, TimeoutExpiresAsDeadlineExceeded) {
    auto source = CancellationSource::withTimeout(root.token(), std::chrono::milliseconds(20));
    auto token = source.token();
    ASSERT_TRUE(token.deadline().has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.reason(), CancelReason::DeadlineExceeded);
    EXPECT_THROW(token.throwIfCancelled(), DeadlineExceededError);
}

TEST_F(CancellationTest, ChildInheritsEarlierParentDeadline) {
    auto parent = CancellationSource::withTimeout(root.token(), std::chrono::seconds(1));
    auto child = CancellationSource::withTimeout(parent.token(), std::chrono::hours(1));

    ASSERT_TRUE(child.token().deadline().has_value());
    EXPECT_EQ(*child.token().deadline(), *parent.token().deadline());
}

TEST_F(CancellationTest, ExplicitCancelTakesPrecedenceOverDeadline) {
    auto source = CancellationSource::withTimeout(root.token(), std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    source.cancel();

    EXPECT_EQ(source.token().reason(), CancelReason::Cancelled);
}

TEST_F(CancellationTest, ErrorMessages) {
    EXPECT_STREQ(OperationCancelledError().what(), "operation was cancelled");
    EXPECT_STREQ(DeadlineExceededError().what(), "deadline exceeded");
}
