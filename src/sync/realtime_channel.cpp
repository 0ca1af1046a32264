#include <agroledger/sync/realtime_channel.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <optional>

namespace agroledger::sync {

/// Fixed pool running subscriber callbacks with a bounded backlog
class CallbackDispatcher {
public:
    CallbackDispatcher(size_t threads, size_t maxPending)
        : pool_(threads == 0 ? 1 : threads), maxPending_(maxPending == 0 ? 1 : maxPending) {}

    ~CallbackDispatcher() { stop(); }

    /**
     * @brief Queue @p fn on the pool, suspending the caller while the backlog is full
     *
     * Returns false only once the dispatcher is stopped.
     */
    boost::asio::awaitable<bool> dispatch(std::function<void()> fn) {
        auto delay = kMinBackoff;
        bool stalled = false;
        while (!stopped_.load(std::memory_order_acquire)) {
            auto inFlight = pending_.load(std::memory_order_acquire);
            if (inFlight < maxPending_) {
                if (!pending_.compare_exchange_weak(inFlight, inFlight + 1,
                                                    std::memory_order_acq_rel))
                    continue;
                post(std::move(fn));
                co_return true;
            }

            if (!stalled) {
                stalled = true;
                const auto stalls = stalls_.fetch_add(1, std::memory_order_relaxed) + 1;
                spdlog::debug("[Realtime] Callback backlog full ({}), holding feed (stall {})",
                              maxPending_, stalls);
            }
            boost::asio::steady_timer wait(co_await boost::asio::this_coro::executor, delay);
            boost::system::error_code ec;
            co_await wait.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            delay = std::min(delay * 2, kMaxBackoff);
        }
        co_return false;
    }

    void stop() {
        bool expected = false;
        if (!stopped_.compare_exchange_strong(expected, true))
            return;
        pool_.stop();
        pool_.join();
    }

    uint64_t pending() const { return pending_.load(std::memory_order_acquire); }
    uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
    uint64_t stalls() const { return stalls_.load(std::memory_order_relaxed); }

private:
    static constexpr std::chrono::milliseconds kMinBackoff{1};
    static constexpr std::chrono::milliseconds kMaxBackoff{20};

    void post(std::function<void()> fn) {
        boost::asio::post(pool_, [this, fn = std::move(fn)]() {
            try {
                fn();
            } catch (const std::exception& e) {
                spdlog::error("[Realtime] Change callback failed: {}", e.what());
            }
            delivered_.fetch_add(1, std::memory_order_relaxed);
            pending_.fetch_sub(1, std::memory_order_acq_rel);
        });
    }

    boost::asio::thread_pool pool_;
    const uint64_t maxPending_;
    std::atomic<uint64_t> pending_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> stalls_{0};
    std::atomic<bool> stopped_{false};
};

namespace {

std::optional<std::string> stringMember(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object())
        return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty())
        return std::nullopt;
    return value;
}

boost::asio::awaitable<void> pumpFeed(std::shared_ptr<ChangeFeed> feed, std::string table,
                                      RealtimeChannel::Callback onChange,
                                      std::shared_ptr<CallbackDispatcher> dispatcher) {
    try {
        while (true) {
            auto payload = co_await feed->next();
            if (!payload)
                break;
            auto kind = RealtimeChannel::resolveKind(*payload);
            spdlog::debug("[Realtime] {} change on {}", kind, table);
            const bool queued = co_await dispatcher->dispatch(
                [onChange, kind = std::move(kind), change = std::move(*payload)]() {
                    onChange(kind, change);
                });
            if (!queued)
                break;
        }
    } catch (const std::exception& e) {
        spdlog::warn("[Realtime] Feed for {} failed: {}", table, e.what());
    }
    spdlog::info("[Realtime] Feed for {} ended", table);
}

} // namespace

RealtimeChannel::RealtimeChannel(SyncBridge& bridge, ChangeFeedFactory factory)
    : RealtimeChannel(bridge, std::move(factory), Options{}) {}

RealtimeChannel::RealtimeChannel(SyncBridge& bridge, ChangeFeedFactory factory, Options options)
    : bridge_(bridge), factory_(std::move(factory)), options_(std::move(options)),
      dispatcher_(
          std::make_shared<CallbackDispatcher>(options_.dispatchThreads, options_.maxPending)) {}

RealtimeChannel::~RealtimeChannel() {
    stop();
}

std::string RealtimeChannel::resolveKind(const nlohmann::json& payload) {
    if (payload.is_object()) {
        if (auto it = payload.find("data"); it != payload.end()) {
            if (auto kind = stringMember(*it, "type"))
                return *kind;
        }
    }
    if (auto kind = stringMember(payload, "eventType"))
        return *kind;
    if (auto kind = stringMember(payload, "type"))
        return *kind;
    return "*";
}

Result<void> RealtimeChannel::subscribe(const std::string& table, Callback onChange) {
    if (table.empty())
        return Error{ErrorCode::InvalidArgument, "Table name is required"};
    if (!onChange)
        return Error{ErrorCode::InvalidArgument, "Change callback is required"};
    if (!factory_)
        return Error{ErrorCode::NotInitialized, "No change feed factory"};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
            return Error{ErrorCode::SystemShutdown, "Realtime channel is stopped"};
        if (subscriptions_.count(table)) {
            spdlog::debug("[Realtime] Already subscribed to {}", table);
            return {};
        }
        if (!joining_.insert(table).second)
            return Error{ErrorCode::InvalidState, "Subscription to " + table + " is in progress"};
    }
    auto result = join(table, std::move(onChange));
    std::lock_guard<std::mutex> lock(mutex_);
    joining_.erase(table);
    return result;
}

Result<void> RealtimeChannel::join(const std::string& table, Callback onChange) {
    if (auto r = bridge_.init(); !r)
        return r.error();

    auto executor = bridge_.executor();
    auto feed = factory_(executor);
    if (!feed)
        return Error{ErrorCode::InternalError, "Change feed factory returned null"};

    ChannelParams params;
    params.topic = "realtime:" + table;
    params.schema = options_.schema;
    params.table = table;

    auto leaveLater = [this, feed, topic = params.topic]() {
        auto r = bridge_.spawn(topic + ":leave",
                               [feed]() -> boost::asio::awaitable<void> { co_await feed->leave(); });
        if (!r)
            spdlog::debug("[Realtime] Could not leave {}: {}", topic, r.error().message);
    };

    // The wait runs unlocked; the joining mark keeps a second caller off this table
    auto joined = boost::asio::co_spawn(
        executor, [feed, params]() -> boost::asio::awaitable<void> { co_await feed->join(params); },
        boost::asio::use_future);

    if (joined.wait_for(options_.joinTimeout) != std::future_status::ready) {
        spdlog::warn("[Realtime] Join of {} timed out after {}ms", params.topic,
                     options_.joinTimeout.count());
        leaveLater();
        return Error{ErrorCode::Timeout, "Timed out joining " + params.topic};
    }
    try {
        joined.get();
    } catch (const std::exception& e) {
        return Error{ErrorCode::RemoteOperationFailed,
                     "Failed to join " + params.topic + ": " + e.what()};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        leaveLater();
        return Error{ErrorCode::SystemShutdown, "Realtime channel stopped while joining " + table};
    }

    auto id = bridge_.registerSubscription(
        params.topic, [feed]() -> boost::asio::awaitable<void> { co_await feed->leave(); });
    if (!id)
        return id.error();
    subscriptions_.emplace(table, id.value());

    auto spawned = bridge_.spawn(
        params.topic, [feed, table, onChange = std::move(onChange),
                     dispatcher = dispatcher_]() { return pumpFeed(feed, table, onChange, dispatcher); });
    if (!spawned) {
        bridge_.forgetSubscription(id.value());
        subscriptions_.erase(table);
        return spawned.error();
    }
    spdlog::info("[Realtime] Subscribed to {}", table);
    return {};
}

bool RealtimeChannel::isSubscribed(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.count(table) > 0;
}

RealtimeChannel::Stats RealtimeChannel::stats() const {
    Stats s;
    s.delivered = dispatcher_->delivered();
    s.stalls = dispatcher_->stalls();
    s.pending = dispatcher_->pending();
    std::lock_guard<std::mutex> lock(mutex_);
    s.subscriptions = subscriptions_.size();
    return s;
}

void RealtimeChannel::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
            return;
        stopped_ = true;
    }
    dispatcher_->stop();
}

} // namespace agroledger::sync
