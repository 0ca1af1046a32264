#include <gtest/gtest.h>
#include <agroledger/sync/sync_bridge.h>

#include "common/fake_remote_client.h"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace agroledger;
using namespace agroledger::sync;
using agroledger::tests::FakeRemoteClient;

namespace {

SyncBridge::ClientFactory countingFactory(std::atomic<int>& calls) {
    return [&calls]() -> Result<std::unique_ptr<RemoteClient>> {
        ++calls;
        // Widen the window in which racing initializers could slip through
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::unique_ptr<RemoteClient>(std::make_unique<FakeRemoteClient>());
    };
}

} // namespace

TEST(SyncBridgeTest, ConcurrentCallersShareOneSession) {
    std::atomic<int> factoryCalls{0};
    SyncBridge bridge(countingFactory(factoryCalls));

    std::vector<std::future<Result<int>>> results;
    for (int i = 0; i < 50; ++i) {
        results.push_back(std::async(std::launch::async, [&bridge, i]() {
            return bridge.submit<int>([i](RemoteClient&) -> Result<int> { return i * 2; });
        }));
    }

    for (int i = 0; i < 50; ++i) {
        auto r = results[i].get();
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value(), i * 2);
    }
    EXPECT_EQ(factoryCalls.load(), 1);
    EXPECT_TRUE(bridge.initialized());
}

TEST(SyncBridgeTest, OperationsRunOnTheWorkerThread) {
    std::atomic<int> factoryCalls{0};
    SyncBridge bridge(countingFactory(factoryCalls));

    auto first = bridge.submit<std::thread::id>(
        [](RemoteClient&) -> Result<std::thread::id> { return std::this_thread::get_id(); });
    auto second = bridge.submit<std::thread::id>(
        [](RemoteClient&) -> Result<std::thread::id> { return std::this_thread::get_id(); });
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first.value(), second.value());
    EXPECT_NE(first.value(), std::this_thread::get_id());
}

TEST(SyncBridgeTest, ThrowingOperationOnlyFailsItsCaller) {
    std::atomic<int> factoryCalls{0};
    SyncBridge bridge(countingFactory(factoryCalls));

    auto failed = bridge.submit<void>(
        [](RemoteClient&) -> Result<void> { throw std::runtime_error("socket closed"); });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::RemoteOperationFailed);
    EXPECT_NE(failed.error().message.find("socket closed"), std::string::npos);

    auto next = bridge.submit<int>([](RemoteClient&) -> Result<int> { return 7; });
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), 7);
}

TEST(SyncBridgeTest, FailedInitCanBeRetried) {
    std::atomic<int> attempts{0};
    SyncBridge bridge([&attempts]() -> Result<std::unique_ptr<RemoteClient>> {
        if (attempts++ == 0)
            return Error{ErrorCode::NetworkError, "offline"};
        return std::unique_ptr<RemoteClient>(std::make_unique<FakeRemoteClient>());
    });

    auto first = bridge.init();
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::NetworkError);
    EXPECT_FALSE(bridge.initialized());

    EXPECT_TRUE(bridge.init().has_value());
    EXPECT_TRUE(bridge.init().has_value());
    EXPECT_EQ(attempts.load(), 2);
}

TEST(SyncBridgeTest, MissingFactoryIsNotInitialized) {
    SyncBridge bridge(nullptr);
    auto r = bridge.submit<int>([](RemoteClient&) -> Result<int> { return 1; });
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotInitialized);
}

TEST(SyncBridgeTest, ShutdownLeavesSubscriptionsAndIgnoresFailures) {
    std::atomic<int> factoryCalls{0};
    SyncBridge bridge(countingFactory(factoryCalls));
    ASSERT_TRUE(bridge.init().has_value());

    std::atomic<int> left{0};
    ASSERT_TRUE(bridge
                    .registerSubscription("failing",
                                          []() -> boost::asio::awaitable<void> {
                                              throw std::runtime_error("already closed");
                                              co_return;
                                          })
                    .has_value());
    ASSERT_TRUE(bridge
                    .registerSubscription("clean",
                                          [&left]() -> boost::asio::awaitable<void> {
                                              ++left;
                                              co_return;
                                          })
                    .has_value());
    EXPECT_EQ(bridge.subscriptionCount(), 2u);

    bridge.shutdown();
    EXPECT_EQ(left.load(), 1);
    EXPECT_EQ(bridge.subscriptionCount(), 0u);
    EXPECT_FALSE(bridge.running());
    EXPECT_FALSE(bridge.initialized());

    bridge.shutdown();

    auto after = bridge.submit<int>([](RemoteClient&) -> Result<int> { return 1; });
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, ErrorCode::SystemShutdown);
    auto spawned = bridge.spawn("late", []() -> boost::asio::awaitable<void> { co_return; });
    ASSERT_FALSE(spawned.has_value());
    EXPECT_EQ(spawned.error().code, ErrorCode::SystemShutdown);
    EXPECT_FALSE(bridge.registerSubscription("late", nullptr).has_value());
}

TEST(SyncBridgeTest, ShutdownIsBounded) {
    std::atomic<int> factoryCalls{0};
    SyncBridge bridge(countingFactory(factoryCalls));
    ASSERT_TRUE(bridge
                    .registerSubscription("slow",
                                          []() -> boost::asio::awaitable<void> {
                                              boost::asio::steady_timer timer(
                                                  co_await boost::asio::this_coro::executor,
                                                  std::chrono::seconds(30));
                                              co_await timer.async_wait(boost::asio::use_awaitable);
                                          })
                    .has_value());

    auto started = std::chrono::steady_clock::now();
    bridge.shutdown(std::chrono::milliseconds(100));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_FALSE(bridge.running());
}

TEST(SyncBridgeTest, ShutdownFromWorkerTaskIsIgnored) {
    std::atomic<int> factoryCalls{0};
    SyncBridge bridge(countingFactory(factoryCalls));

    std::promise<void> done;
    auto doneFuture = done.get_future();
    ASSERT_TRUE(bridge
                    .spawn("stop-from-worker",
                           [&bridge, &done]() -> boost::asio::awaitable<void> {
                               bridge.shutdown(std::chrono::milliseconds(50));
                               done.set_value();
                               co_return;
                           })
                    .has_value());
    ASSERT_EQ(doneFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    EXPECT_TRUE(bridge.running());
    auto r = bridge.submit<int>([](RemoteClient&) -> Result<int> { return 9; });
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r.value(), 9);

    bridge.shutdown();
    EXPECT_FALSE(bridge.running());
}

TEST(SyncBridgeTest, SpawnedTasksRunAndFailuresAreContained) {
    std::atomic<int> factoryCalls{0};
    SyncBridge bridge(countingFactory(factoryCalls));

    ASSERT_TRUE(bridge
                    .spawn("boom",
                           []() -> boost::asio::awaitable<void> {
                               throw std::runtime_error("task failure");
                               co_return;
                           })
                    .has_value());

    std::promise<std::thread::id> ran;
    auto ranFuture = ran.get_future();
    ASSERT_TRUE(bridge
                    .spawn("ok",
                           [&ran]() -> boost::asio::awaitable<void> {
                               ran.set_value(std::this_thread::get_id());
                               co_return;
                           })
                    .has_value());
    ASSERT_EQ(ranFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_NE(ranFuture.get(), std::this_thread::get_id());

    // The worker still serves operations
    auto r = bridge.submit<int>([](RemoteClient&) -> Result<int> { return 3; });
    ASSERT_TRUE(r.has_value());
}
