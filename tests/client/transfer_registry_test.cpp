#include "rms/client/transfer_registry.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using rms::CancellationToken;
using rms::client::TransferRegistry;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, WaitForTimesOutWhenNotCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.wait_for(10ms));
    EXPECT_FALSE(token.is_cancelled());
}

TEST(CancellationTokenTest, CancelWakesWaiter) {
    CancellationToken token;
    std::atomic<bool> woke{false};

    std::thread waiter([&]() {
        woke = token.wait_for(10s);
    });

    std::this_thread::sleep_for(20ms);
    const auto start = std::chrono::steady_clock::now();
    token.cancel();
    waiter.join();

    EXPECT_TRUE(woke);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(CancellationTokenTest, CallbacksRunOnce) {
    CancellationToken token;
    int calls = 0;
    token.on_cancel([&]() { ++calls; });

    token.cancel();
    token.cancel();

    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, CallbackOnCancelledTokenRunsImmediately) {
    CancellationToken token;
    token.cancel();

    bool ran = false;
    EXPECT_EQ(token.on_cancel([&]() { ran = true; }), 0u);
    EXPECT_TRUE(ran);
}

TEST(CancellationTokenTest, RemovedCallbackDoesNotRun) {
    CancellationToken token;
    bool ran = false;
    const auto id = token.on_cancel([&]() { ran = true; });

    token.remove_callback(id);
    token.cancel();

    EXPECT_FALSE(ran);
}

TEST(TransferRegistryTest, AcquireReturnsSameHandle) {
    TransferRegistry registry;
    auto first = registry.acquire("tok");
    auto second = registry.acquire("tok");

    EXPECT_EQ(first, second);
    EXPECT_EQ(registry.find("tok"), first);
    EXPECT_EQ(registry.find("other"), nullptr);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(TransferRegistryTest, CancelTripsAndDropsHandle) {
    TransferRegistry registry;
    auto handle = registry.acquire("tok");

    EXPECT_TRUE(registry.cancel("tok"));
    EXPECT_TRUE(handle->is_cancelled());
    EXPECT_EQ(registry.size(), 0u);

    EXPECT_FALSE(registry.cancel("tok"));
    EXPECT_FALSE(registry.cancel("never-registered"));
}

TEST(TransferRegistryTest, ReleaseDoesNotCancel) {
    TransferRegistry registry;
    auto handle = registry.acquire("tok");

    registry.release("tok");

    EXPECT_FALSE(handle->is_cancelled());
    EXPECT_EQ(registry.find("tok"), nullptr);
}

TEST(TransferRegistryTest, AcquireAfterCancelStartsFresh) {
    TransferRegistry registry;
    auto old_handle = registry.acquire("tok");
    registry.cancel("tok");

    auto fresh = registry.acquire("tok");
    EXPECT_NE(fresh, old_handle);
    EXPECT_FALSE(fresh->is_cancelled());
}

TEST(TransferRegistryTest, CancelAll) {
    TransferRegistry registry;
    auto a = registry.acquire("a");
    auto b = registry.acquire("b");
    auto c = registry.acquire("c");

    auto tokens = registry.tokens();
    std::sort(tokens.begin(), tokens.end());
    EXPECT_EQ(tokens, (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_EQ(registry.cancel_all(), 3u);
    EXPECT_TRUE(a->is_cancelled());
    EXPECT_TRUE(b->is_cancelled());
    EXPECT_TRUE(c->is_cancelled());
    EXPECT_EQ(registry.size(), 0u);
}
