#include <gtest/gtest.h>
#include "Context.hpp"
#include <atomic>
#include <thread>

using namespace sqlbridge;
using namespace std::chrono_literals;

class ContextTest : public ::testing::Test {
};

TEST_F(ContextTest, BackgroundNeverDone) {
    auto ctx = Context::background();

    EXPECT_FALSE(ctx->isDone());
    EXPECT_FALSE(ctx->deadline().has_value());
    EXPECT_FALSE(ctx->remaining().has_value());
    EXPECT_EQ(ctx->reason(), "");
}

TEST_F(ContextTest, CancelMarksDone) {
    auto ctx = Context::withCancel(Context::background());

    ctx->cancel();

    EXPECT_TRUE(ctx->isCancelled());
    EXPECT_TRUE(ctx->isDone());
    EXPECT_EQ(ctx->reason(), "context cancelled");
}

TEST_F(ContextTest, CancelPropagatesToChildren) {
    auto root = Context::withCancel(Context::background());
    auto child = Context::withCancel(root);
    auto grandchild = Context::withTimeout(child, 10s);

    root->cancel();

    EXPECT_TRUE(child->isDone());
    EXPECT_TRUE(grandchild->isCancelled());
    EXPECT_EQ(grandchild->reason(), "context cancelled");
}

TEST_F(ContextTest, ChildCancelDoesNotAffectParent) {
    auto root = Context::background();
    auto child = Context::withCancel(root);

    child->cancel();

    EXPECT_FALSE(root->isDone());
}

TEST_F(ContextTest, TimeoutExpires) {
    auto ctx = Context::withTimeout(Context::background(), 20ms);
    EXPECT_FALSE(ctx->isDone());

    std::this_thread::sleep_for(40ms);

    EXPECT_TRUE(ctx->isDone());
    EXPECT_FALSE(ctx->isCancelled());
    EXPECT_EQ(ctx->reason(), "context deadline exceeded");
    ASSERT_TRUE(ctx->remaining().has_value());
    EXPECT_EQ(ctx->remaining()->count(), 0);
}

TEST_F(ContextTest, EarliestDeadlineWins) {
    auto outer = Context::withTimeout(Context::background(), 50ms);
    auto inner = Context::withTimeout(outer, 10s);

    ASSERT_TRUE(inner->remaining().has_value());
    EXPECT_LE(*inner->remaining(), 50ms);
    EXPECT_TRUE(inner->deadline() == outer->deadline());
}

TEST_F(ContextTest, CallbacksRunOnCancel) {
    auto ctx = Context::withCancel(Context::background());
    int fired = 0;

    ctx->onCancel([&]() { ++fired; });
    ctx->cancel();
    ctx->cancel();

    EXPECT_EQ(fired, 1);
}

TEST_F(ContextTest, CallbackRunsImmediatelyWhenAlreadyCancelled) {
    auto ctx = Context::withCancel(Context::background());
    ctx->cancel();
    bool fired = false;

    EXPECT_EQ(ctx->onCancel([&]() { fired = true; }), 0u);
    EXPECT_TRUE(fired);
}

TEST_F(ContextTest, RemovedCallbackDoesNotRun) {
    auto ctx = Context::withCancel(Context::background());
    bool fired = false;

    size_t id = ctx->onCancel([&]() { fired = true; });
    ctx->removeCallback(id);
    ctx->cancel();

    EXPECT_FALSE(fired);
}

TEST_F(ContextTest, CancelRegistrationUnregistersOnScopeExit) {
    auto ctx = Context::withCancel(Context::background());
    int fired = 0;

    {
        CancelRegistration registration(ctx, [&]() { ++fired; });
    }
    ctx->cancel();

    EXPECT_EQ(fired, 0);
}

TEST_F(ContextTest, CancelFromAnotherThread) {
    auto ctx = Context::withCancel(Context::background());
    std::atomic<bool> fired{false};
    ctx->onCancel([&]() { fired = true; });

    std::thread canceller([ctx]() {
        std::this_thread::sleep_for(10ms);
        ctx->cancel();
    });
    while (!ctx->isDone()) {
        std::this_thread::sleep_for(1ms);
    }
    canceller.join();

    EXPECT_TRUE(fired.load());
}
