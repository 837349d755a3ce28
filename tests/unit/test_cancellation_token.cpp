#include <gtest/gtest.h>
#include "cancellation_token.hpp"
#include <atomic>
#include <thread>

namespace loadplus {

TEST(CancellationTokenTest, StartsUncancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    token.cancel();
    EXPECT_TRUE(token.isCancelled());
}

TEST(CancellationTokenTest, CallbacksRunOnceOnCancel) {
    CancellationToken token;
    int calls = 0;
    token.addCallback([&calls]() { ++calls; });

    token.cancel();
    token.cancel();
    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, LateCallbackRunsImmediately) {
    CancellationToken token;
    token.cancel();

    bool called = false;
    token.addCallback([&called]() { called = true; });
    EXPECT_TRUE(called);
}

TEST(CancellationTokenTest, RemovedCallbackIsNotInvoked) {
    CancellationToken token;
    int calls = 0;
    auto id = token.addCallback([&calls]() { ++calls; });
    token.removeCallback(id);
    token.removeCallback(id + 100); // unknown ids are ignored

    token.cancel();
    EXPECT_EQ(calls, 0);
}

TEST(CancellationTokenTest, CancelFromAnotherThreadIsVisible) {
    CancellationToken token;
    std::atomic<int> calls{0};
    token.addCallback([&calls]() { calls++; });

    std::thread canceller([&token]() { token.cancel(); });
    canceller.join();

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(calls.load(), 1);
}

} // namespace loadplus
