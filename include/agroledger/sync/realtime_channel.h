#pragma once

#include <agroledger/core/types.h>
#include <agroledger/sync/change_feed.h>
#include <agroledger/sync/sync_bridge.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace agroledger::sync {

class CallbackDispatcher;

/**
 * @brief Table change subscriptions delivered to application callbacks
 *
 * Feeds are pumped on the SyncBridge worker. Callbacks never run there: they are
 * handed to a small dispatch pool with a bounded backlog. When the backlog is full
 * the pump waits for a slot, so every change reaches its callback in feed order
 * per table.
 */
class RealtimeChannel {
public:
    using Callback = std::function<void(const std::string& kind, const nlohmann::json& payload)>;

    struct Options {
        std::string schema{"public"};
        size_t dispatchThreads{2};
        size_t maxPending{256};
        std::chrono::milliseconds joinTimeout{std::chrono::seconds(10)};
    };

    struct Stats {
        uint64_t delivered{0};
        uint64_t stalls{0}; ///< Times a feed waited on a full backlog
        uint64_t pending{0};
        size_t subscriptions{0};
    };

    RealtimeChannel(SyncBridge& bridge, ChangeFeedFactory factory);
    RealtimeChannel(SyncBridge& bridge, ChangeFeedFactory factory, Options options);
    ~RealtimeChannel();

    RealtimeChannel(const RealtimeChannel&) = delete;
    RealtimeChannel& operator=(const RealtimeChannel&) = delete;

    /**
     * @brief Subscribe to every change on @p table
     *
     * Joins the channel and waits for the server acknowledgement. A table that is
     * already subscribed is left alone and success is returned. A second call for a
     * table whose join is still pending fails with InvalidState.
     */
    Result<void> subscribe(const std::string& table, Callback onChange);

    [[nodiscard]] bool isSubscribed(const std::string& table) const;
    [[nodiscard]] Stats stats() const;

    /// Stop dispatching; queued callbacks are abandoned. Idempotent.
    void stop();

    /// Change kind of a payload: data.type, then eventType, then type, else "*"
    static std::string resolveKind(const nlohmann::json& payload);

private:
    Result<void> join(const std::string& table, Callback onChange);

    SyncBridge& bridge_;
    ChangeFeedFactory factory_;
    Options options_;
    std::shared_ptr<CallbackDispatcher> dispatcher_;

    mutable std::mutex mutex_;
    std::map<std::string, SyncBridge::SubscriptionId> subscriptions_;
    std::set<std::string> joining_;
    bool stopped_{false};
};

} // namespace agroledger::sync
