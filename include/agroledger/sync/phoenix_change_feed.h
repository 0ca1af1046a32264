#pragma once

#include <agroledger/sync/change_feed.h>
#include <agroledger/sync/remote_config.h>

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace agroledger::sync {

/**
 * @brief Realtime change feed over the Phoenix channel protocol (vsn 1.0.0)
 *
 * Connects to wss://<host>/realtime/v1/websocket, joins one postgres_changes
 * channel and keeps the socket alive with periodic heartbeats.
 */
class PhoenixChangeFeed final : public ChangeFeed,
                                public std::enable_shared_from_this<PhoenixChangeFeed> {
public:
    using Executor = boost::asio::io_context::executor_type;

    PhoenixChangeFeed(Executor executor, RemoteConfig config,
                      std::chrono::seconds heartbeatInterval = std::chrono::seconds(25));
    ~PhoenixChangeFeed() override;

    boost::asio::awaitable<void> join(const ChannelParams& params) override;
    boost::asio::awaitable<std::optional<nlohmann::json>> next() override;
    boost::asio::awaitable<void> leave() override;

    /// Phoenix frame: {"topic","event","payload","ref"}
    static nlohmann::json makeFrame(const std::string& topic, const std::string& event,
                                    nlohmann::json payload, const std::string& ref);
    static nlohmann::json joinPayload(const ChannelParams& params, const std::string& accessToken);

private:
    using WebSocket =
        boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    Executor executor_;
    RemoteConfig config_;
    std::chrono::seconds heartbeatInterval_;
    boost::asio::ssl::context ssl_;
    std::unique_ptr<WebSocket> ws_;
    boost::asio::steady_timer heartbeat_;
    std::deque<std::string> outbox_;
    std::deque<nlohmann::json> inbox_;
    std::string topic_;
    uint64_t ref_{0};
    bool writing_{false};
    bool closed_{false};

    boost::asio::awaitable<void> connect();
    boost::asio::awaitable<nlohmann::json> readFrame();
    boost::asio::awaitable<void> drainOutbox();
    boost::asio::awaitable<void> heartbeatLoop();
    void enqueue(const nlohmann::json& frame);
    std::string nextRef();
};

/// Factory producing PhoenixChangeFeed instances for RealtimeChannel
ChangeFeedFactory makePhoenixFeedFactory(RemoteConfig config);

} // namespace agroledger::sync
