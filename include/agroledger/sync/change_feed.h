#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace agroledger::sync {

struct ChannelParams {
    std::string topic; ///< e.g. "realtime:lancamento"
    std::string schema{"public"};
    std::string table;
    std::string event{"*"};
};

/**
 * @brief Transport for table change notifications
 *
 * All members are called on the SyncBridge worker. Failures are reported by
 * throwing (boost::system::system_error or std::runtime_error).
 */
class ChangeFeed {
public:
    virtual ~ChangeFeed() = default;

    /// Connect if needed and join the channel; returns once the server acknowledged
    virtual boost::asio::awaitable<void> join(const ChannelParams& params) = 0;

    /// Next change payload, or nullopt once the feed is closed
    virtual boost::asio::awaitable<std::optional<nlohmann::json>> next() = 0;

    /// Leave the channel and close the transport; safe to call more than once
    virtual boost::asio::awaitable<void> leave() = 0;
};

using ChangeFeedFactory =
    std::function<std::shared_ptr<ChangeFeed>(boost::asio::io_context::executor_type)>;

} // namespace agroledger::sync
