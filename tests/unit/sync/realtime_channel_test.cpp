#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <agroledger/sync/realtime_channel.h>

#include "common/fake_remote_client.h"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace agroledger;
using namespace agroledger::sync;
using agroledger::tests::FakeRemoteClient;
using nlohmann::json;

namespace {

/// Shared between a test and the feeds its factory creates
struct FeedScript {
    std::deque<json> events;
    bool rejectJoin{false};
    bool hangJoin{false};
    std::atomic<int> feedsCreated{0};
    std::atomic<int> joins{0};
    std::atomic<int> leaves{0};
    std::mutex mutex;
    std::vector<ChannelParams> joinedChannels;
};

class ScriptedFeed : public ChangeFeed {
public:
    ScriptedFeed(boost::asio::io_context::executor_type executor, std::shared_ptr<FeedScript> script)
        : timer_(executor), script_(std::move(script)) {}

    boost::asio::awaitable<void> join(const ChannelParams& params) override {
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            script_->joinedChannels.push_back(params);
        }
        ++script_->joins;
        if (script_->rejectJoin)
            throw std::runtime_error("join rejected: unauthorized");
        if (script_->hangJoin) {
            timer_.expires_after(std::chrono::seconds(30));
            co_await timer_.async_wait(boost::asio::use_awaitable);
        }
    }

    boost::asio::awaitable<std::optional<json>> next() override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->events.empty())
            co_return std::nullopt;
        auto event = std::move(script_->events.front());
        script_->events.pop_front();
        co_return event;
    }

    boost::asio::awaitable<void> leave() override {
        ++script_->leaves;
        timer_.cancel();
        co_return;
    }

private:
    boost::asio::steady_timer timer_;
    std::shared_ptr<FeedScript> script_;
};

ChangeFeedFactory scriptedFactory(std::shared_ptr<FeedScript> script) {
    return [script](boost::asio::io_context::executor_type executor) -> std::shared_ptr<ChangeFeed> {
        ++script->feedsCreated;
        return std::make_shared<ScriptedFeed>(executor, script);
    };
}

template <typename Pred> bool waitUntil(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

json change(const std::string& type, int id) {
    return json{{"data", {{"type", type}, {"table", "lancamento"}, {"record", {{"id", id}}}}}};
}

} // namespace

class RealtimeChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        script_ = std::make_shared<FeedScript>();
        bridge_ = std::make_unique<SyncBridge>([]() -> Result<std::unique_ptr<RemoteClient>> {
            return std::unique_ptr<RemoteClient>(std::make_unique<FakeRemoteClient>());
        });
    }

    void TearDown() override {
        channel_.reset();
        bridge_->shutdown();
    }

    void makeChannel(RealtimeChannel::Options options = {}) {
        channel_ = std::make_unique<RealtimeChannel>(*bridge_, scriptedFactory(script_), options);
    }

    std::shared_ptr<FeedScript> script_;
    std::unique_ptr<SyncBridge> bridge_;
    std::unique_ptr<RealtimeChannel> channel_;
};

TEST_F(RealtimeChannelTest, DeliversChangesWithResolvedKind) {
    script_->events = {change("INSERT", 1), json{{"eventType", "UPDATE"}}, json{{"type", "DELETE"}},
                       json{{"payload", 1}}};
    makeChannel();

    std::mutex mutex;
    std::vector<std::pair<std::string, json>> seen;
    auto r = channel_->subscribe("lancamento", [&](const std::string& kind, const json& payload) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.emplace_back(kind, payload);
    });
    ASSERT_TRUE(r.has_value()) << r.error().message;

    ASSERT_TRUE(waitUntil([&] { return channel_->stats().delivered == 4; },
                          std::chrono::seconds(5)));
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(seen.size(), 4u);
    std::vector<std::string> kinds;
    for (const auto& s : seen)
        kinds.push_back(s.first);
    std::sort(kinds.begin(), kinds.end());
    EXPECT_EQ(kinds, (std::vector<std::string>{"*", "DELETE", "INSERT", "UPDATE"}));

    std::lock_guard<std::mutex> joinLock(script_->mutex);
    ASSERT_EQ(script_->joinedChannels.size(), 1u);
    EXPECT_EQ(script_->joinedChannels[0].topic, "realtime:lancamento");
    EXPECT_EQ(script_->joinedChannels[0].schema, "public");
    EXPECT_EQ(script_->joinedChannels[0].table, "lancamento");
}

TEST_F(RealtimeChannelTest, SecondSubscribeIsANoOp) {
    makeChannel();
    auto noop = [](const std::string&, const json&) {};
    ASSERT_TRUE(channel_->subscribe("lancamento", noop).has_value());
    ASSERT_TRUE(channel_->subscribe("lancamento", noop).has_value());

    EXPECT_EQ(script_->feedsCreated.load(), 1);
    EXPECT_EQ(script_->joins.load(), 1);
    EXPECT_TRUE(channel_->isSubscribed("lancamento"));
    EXPECT_FALSE(channel_->isSubscribed("participante"));
    EXPECT_EQ(channel_->stats().subscriptions, 1u);
    EXPECT_EQ(bridge_->subscriptionCount(), 1u);
}

TEST_F(RealtimeChannelTest, InvalidArgumentsAreRejected) {
    makeChannel();
    auto empty = channel_->subscribe("", [](const std::string&, const json&) {});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);

    auto noCallback = channel_->subscribe("lancamento", nullptr);
    ASSERT_FALSE(noCallback.has_value());
    EXPECT_EQ(noCallback.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(script_->feedsCreated.load(), 0);
}

TEST_F(RealtimeChannelTest, RejectedJoinIsReported) {
    script_->rejectJoin = true;
    makeChannel();
    auto r = channel_->subscribe("lancamento", [](const std::string&, const json&) {});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::RemoteOperationFailed);
    EXPECT_NE(r.error().message.find("unauthorized"), std::string::npos);
    EXPECT_FALSE(channel_->isSubscribed("lancamento"));
    EXPECT_EQ(bridge_->subscriptionCount(), 0u);
}

TEST_F(RealtimeChannelTest, JoinTimeoutLeavesTheFeed) {
    script_->hangJoin = true;
    RealtimeChannel::Options options;
    options.joinTimeout = std::chrono::milliseconds(100);
    makeChannel(options);

    auto r = channel_->subscribe("lancamento", [](const std::string&, const json&) {});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_TRUE(waitUntil([&] { return script_->leaves.load() == 1; }, std::chrono::seconds(5)));
    EXPECT_FALSE(channel_->isSubscribed("lancamento"));
}

TEST_F(RealtimeChannelTest, FullBacklogHoldsFeedUntilCallbacksFinish) {
    script_->events = {change("INSERT", 1), change("INSERT", 2), change("INSERT", 3)};
    RealtimeChannel::Options options;
    options.dispatchThreads = 1;
    options.maxPending = 1;
    makeChannel(options);

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<int> calls{0};
    std::vector<int> ids;
    auto r = channel_->subscribe("lancamento", [&](const std::string&, const json& payload) {
        ++calls;
        std::unique_lock<std::mutex> lock(mutex);
        ids.push_back(payload["data"]["record"]["id"].get<int>());
        cv.wait_for(lock, std::chrono::seconds(5), [&] { return release; });
    });
    ASSERT_TRUE(r.has_value());

    ASSERT_TRUE(waitUntil([&] { return calls.load() == 1 && channel_->stats().stalls >= 1; },
                          std::chrono::seconds(5)));
    {
        // The pump is parked on the second event; the third is still unread
        std::lock_guard<std::mutex> lock(script_->mutex);
        EXPECT_EQ(script_->events.size(), 1u);
    }
    EXPECT_EQ(calls.load(), 1);
    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();

    ASSERT_TRUE(waitUntil([&] { return channel_->stats().delivered == 3; },
                          std::chrono::seconds(5)));
    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(channel_->stats().pending, 0u);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(ids, (std::vector<int>{1, 2, 3}));
}

TEST_F(RealtimeChannelTest, PendingJoinDoesNotBlockOtherCallers) {
    script_->hangJoin = true;
    RealtimeChannel::Options options;
    options.joinTimeout = std::chrono::milliseconds(500);
    makeChannel(options);

    auto pending = std::async(std::launch::async, [this]() {
        return channel_->subscribe("lancamento", [](const std::string&, const json&) {});
    });
    ASSERT_TRUE(waitUntil([&] { return script_->joins.load() == 1; }, std::chrono::seconds(5)));

    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel_->isSubscribed("lancamento"));
    EXPECT_EQ(channel_->stats().subscriptions, 0u);
    auto second = channel_->subscribe("lancamento", [](const std::string&, const json&) {});
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::InvalidState);

    auto first = pending.get();
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::Timeout);
    EXPECT_EQ(script_->feedsCreated.load(), 1);
}

TEST_F(RealtimeChannelTest, CallbackExceptionsDoNotStopDelivery) {
    script_->events = {change("INSERT", 1), change("UPDATE", 1)};
    makeChannel();

    std::atomic<int> calls{0};
    ASSERT_TRUE(channel_
                    ->subscribe("lancamento",
                                [&](const std::string& kind, const json&) {
                                    ++calls;
                                    if (kind == "INSERT")
                                        throw std::runtime_error("handler bug");
                                })
                    .has_value());
    ASSERT_TRUE(waitUntil([&] { return channel_->stats().delivered == 2; },
                          std::chrono::seconds(5)));
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(RealtimeChannelTest, StoppedChannelRefusesSubscriptions) {
    makeChannel();
    channel_->stop();
    channel_->stop();
    auto r = channel_->subscribe("lancamento", [](const std::string&, const json&) {});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::SystemShutdown);
}

TEST_F(RealtimeChannelTest, BridgeShutdownLeavesActiveFeeds) {
    makeChannel();
    ASSERT_TRUE(channel_->subscribe("lancamento", [](const std::string&, const json&) {}).has_value());
    bridge_->shutdown();
    EXPECT_EQ(script_->leaves.load(), 1);
}

TEST(RealtimeKindTest, ResolutionOrder) {
    EXPECT_EQ(RealtimeChannel::resolveKind(json{{"data", {{"type", "INSERT"}}}, {"type", "x"}}),
              "INSERT");
    EXPECT_EQ(RealtimeChannel::resolveKind(json{{"data", {{"type", ""}}}, {"eventType", "DELETE"}}),
              "DELETE");
    EXPECT_EQ(RealtimeChannel::resolveKind(json{{"data", 5}, {"type", "UPDATE"}}), "UPDATE");
    EXPECT_EQ(RealtimeChannel::resolveKind(json{{"type", 3}}), "*");
    EXPECT_EQ(RealtimeChannel::resolveKind(json::array()), "*");
}
