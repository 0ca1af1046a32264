#include <agroledger/net/http_client.h>
#include <agroledger/sync/phoenix_change_feed.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace agroledger::sync {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using asio::use_awaitable;
using asio::ip::tcp;

namespace {

std::string stringField(const nlohmann::json& frame, const char* key) {
    if (frame.is_object() && frame.contains(key) && frame[key].is_string())
        return frame[key].get<std::string>();
    return {};
}

} // namespace

PhoenixChangeFeed::PhoenixChangeFeed(Executor executor, RemoteConfig config,
                                     std::chrono::seconds heartbeatInterval)
    : executor_(executor), config_(std::move(config)), heartbeatInterval_(heartbeatInterval),
      ssl_(asio::ssl::context::tlsv12_client), heartbeat_(executor) {
    ssl_.set_default_verify_paths();
    ssl_.set_verify_mode(asio::ssl::verify_peer);
}

PhoenixChangeFeed::~PhoenixChangeFeed() = default;

nlohmann::json PhoenixChangeFeed::makeFrame(const std::string& topic, const std::string& event,
                                            nlohmann::json payload, const std::string& ref) {
    return nlohmann::json{
        {"topic", topic}, {"event", event}, {"payload", std::move(payload)}, {"ref", ref}};
}

nlohmann::json PhoenixChangeFeed::joinPayload(const ChannelParams& params,
                                              const std::string& accessToken) {
    nlohmann::json change = {{"event", params.event}, {"schema", params.schema}, {"table", params.table}};
    return nlohmann::json{
        {"config",
         {{"broadcast", {{"self", false}}},
          {"presence", {{"key", ""}}},
          {"postgres_changes", nlohmann::json::array({change})}}},
        {"access_token", accessToken}};
}

std::string PhoenixChangeFeed::nextRef() {
    return std::to_string(++ref_);
}

asio::awaitable<void> PhoenixChangeFeed::connect() {
    const std::string host = config_.host();
    tcp::resolver resolver(executor_);
    auto endpoints = co_await resolver.async_resolve(host, "443", use_awaitable);

    ws_ = std::make_unique<WebSocket>(executor_, ssl_);
    auto& lowest = beast::get_lowest_layer(*ws_);
    lowest.expires_after(std::chrono::seconds(30));
    co_await lowest.async_connect(endpoints, use_awaitable);

    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), host.c_str())) {
        throw boost::system::system_error(static_cast<int>(::ERR_get_error()),
                                          asio::error::get_ssl_category());
    }
    ws_->next_layer().set_verify_callback(asio::ssl::host_name_verification(host));
    lowest.expires_after(std::chrono::seconds(30));
    co_await ws_->next_layer().async_handshake(asio::ssl::stream_base::client, use_awaitable);

    lowest.expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->text(true);
    const std::string target =
        "/realtime/v1/websocket?apikey=" + net::urlEncode(config_.apiKey) + "&vsn=1.0.0";
    co_await ws_->async_handshake(host, target, use_awaitable);

    closed_ = false;
    spdlog::info("[Realtime] Connected to {}", host);
}

asio::awaitable<nlohmann::json> PhoenixChangeFeed::readFrame() {
    beast::flat_buffer buffer;
    co_await ws_->async_read(buffer, use_awaitable);
    auto frame = nlohmann::json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
    if (frame.is_discarded()) {
        spdlog::debug("[Realtime] Ignoring non-JSON frame");
        co_return nlohmann::json::object();
    }
    co_return frame;
}

void PhoenixChangeFeed::enqueue(const nlohmann::json& frame) {
    outbox_.push_back(frame.dump());
    if (writing_ || !ws_)
        return;
    writing_ = true;
    asio::co_spawn(
        executor_,
        [self = shared_from_this()]() -> asio::awaitable<void> { co_await self->drainOutbox(); },
        asio::detached);
}

asio::awaitable<void> PhoenixChangeFeed::drainOutbox() {
    try {
        while (!outbox_.empty() && ws_ && !closed_) {
            std::string text = std::move(outbox_.front());
            outbox_.pop_front();
            co_await ws_->async_write(asio::buffer(text), use_awaitable);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[Realtime] Write on {} failed: {}", topic_, e.what());
        outbox_.clear();
    }
    writing_ = false;
}

asio::awaitable<void> PhoenixChangeFeed::heartbeatLoop() {
    while (!closed_) {
        heartbeat_.expires_after(heartbeatInterval_);
        boost::system::error_code ec;
        co_await heartbeat_.async_wait(asio::redirect_error(use_awaitable, ec));
        if (ec || closed_)
            co_return;
        enqueue(makeFrame("phoenix", "heartbeat", nlohmann::json::object(), nextRef()));
    }
}

asio::awaitable<void> PhoenixChangeFeed::join(const ChannelParams& params) {
    topic_ = params.topic;
    if (!ws_ || closed_)
        co_await connect();

    const std::string ref = nextRef();
    enqueue(makeFrame(topic_, "phx_join", joinPayload(params, config_.apiKey), ref));
    asio::co_spawn(
        executor_,
        [self = shared_from_this()]() -> asio::awaitable<void> { co_await self->heartbeatLoop(); },
        asio::detached);

    while (true) {
        auto frame = co_await readFrame();
        const std::string event = stringField(frame, "event");
        if (event == "phx_reply" && stringField(frame, "ref") == ref) {
            const auto& payload = frame["payload"];
            if (stringField(payload, "status") == "ok") {
                spdlog::info("[Realtime] Joined {}", topic_);
                co_return;
            }
            throw std::runtime_error("Channel join rejected: " + payload.dump());
        }
        if (event == "postgres_changes") {
            inbox_.push_back(frame.contains("payload") ? frame["payload"] : nlohmann::json::object());
        } else if (event == "phx_error" || event == "phx_close") {
            throw std::runtime_error("Channel " + topic_ + " closed during join");
        }
    }
}

asio::awaitable<std::optional<nlohmann::json>> PhoenixChangeFeed::next() {
    if (!inbox_.empty()) {
        auto payload = std::move(inbox_.front());
        inbox_.pop_front();
        co_return payload;
    }

    while (!closed_ && ws_) {
        nlohmann::json frame;
        bool finished = false;
        try {
            frame = co_await readFrame();
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed || e.code() == asio::error::operation_aborted ||
                e.code() == asio::error::eof) {
                finished = true;
            } else {
                throw;
            }
        }
        if (finished) {
            closed_ = true;
            break;
        }

        const std::string event = stringField(frame, "event");
        if (event == "postgres_changes") {
            co_return frame.contains("payload") ? frame["payload"] : nlohmann::json::object();
        }
        if ((event == "phx_close" || event == "phx_error") && stringField(frame, "topic") == topic_) {
            spdlog::warn("[Realtime] Server closed {}", topic_);
            closed_ = true;
            break;
        }
    }
    co_return std::nullopt;
}

asio::awaitable<void> PhoenixChangeFeed::leave() {
    if (!ws_ || closed_)
        co_return;

    heartbeat_.cancel();
    outbox_.clear();
    closed_ = true;

    // Let an in-flight write finish before writing the leave frame
    asio::steady_timer wait(executor_);
    while (writing_) {
        wait.expires_after(std::chrono::milliseconds(5));
        co_await wait.async_wait(use_awaitable);
    }

    const std::string frame = makeFrame(topic_, "phx_leave", nlohmann::json::object(), nextRef()).dump();
    co_await ws_->async_write(asio::buffer(frame), use_awaitable);
    co_await ws_->async_close(websocket::close_code::normal, use_awaitable);
    spdlog::info("[Realtime] Left {}", topic_);
}

ChangeFeedFactory makePhoenixFeedFactory(RemoteConfig config) {
    return [config = std::move(config)](boost::asio::io_context::executor_type executor) {
        return std::static_pointer_cast<ChangeFeed>(
            std::make_shared<PhoenixChangeFeed>(executor, config));
    };
}

} // namespace agroledger::sync
