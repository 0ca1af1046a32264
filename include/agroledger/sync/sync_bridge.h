#pragma once

#include <agroledger/core/types.h>
#include <agroledger/sync/remote_client.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace agroledger::sync {

/**
 * @brief Single background scheduler that owns the remote session
 *
 * One worker thread runs an io_context for the life of the bridge. Synchronous
 * callers hand remote operations to it through submit(); each caller blocks only
 * on its own operation and operations run in submission order. Change-feed
 * coroutines are spawned on the same executor.
 *
 * Must not be called from the worker thread itself (submit would wait on itself).
 */
class SyncBridge {
public:
    using ClientFactory = std::function<Result<std::unique_ptr<RemoteClient>>()>;
    using SubscriptionId = uint64_t;
    /// Runs on the worker during shutdown to leave a subscription
    using Unsubscriber = std::function<boost::asio::awaitable<void>()>;
    using Executor = boost::asio::io_context::executor_type;

    explicit SyncBridge(ClientFactory factory);
    ~SyncBridge();

    SyncBridge(const SyncBridge&) = delete;
    SyncBridge& operator=(const SyncBridge&) = delete;

    /**
     * @brief Create the remote session on the worker
     *
     * Idempotent and safe to race: the factory runs at most once per successful init.
     * A failed init may be retried.
     */
    Result<void> init();

    [[nodiscard]] bool initialized() const { return initialized_.load(std::memory_order_acquire); }
    [[nodiscard]] bool running() const { return !stopped_.load(std::memory_order_acquire); }

    /**
     * @brief Run @p op against the session on the worker and wait for its result
     *
     * Initializes lazily. An exception thrown by @p op is reported to this caller as
     * RemoteOperationFailed; the worker keeps running.
     */
    template <typename T> Result<T> submit(std::function<Result<T>(RemoteClient&)> op) {
        if (!running())
            return Error{ErrorCode::SystemShutdown, "Sync bridge is shut down"};
        if (auto r = init(); !r)
            return r.error();

        return postAndWait<T>([this, op = std::move(op)]() -> Result<T> {
            if (!client_)
                return Error{ErrorCode::NotInitialized, "Remote session not initialized"};
            return op(*client_);
        });
    }

    /// Executor of the worker; valid until shutdown()
    Executor executor();

    /**
     * @brief Run a cooperative task on the worker
     *
     * Exceptions escaping @p task are logged with @p name and do not stop the worker.
     */
    Result<void> spawn(std::string name, std::function<boost::asio::awaitable<void>()> task);

    Result<SubscriptionId> registerSubscription(std::string name, Unsubscriber unsubscribe);
    void forgetSubscription(SubscriptionId id);
    [[nodiscard]] size_t subscriptionCount() const;

    /**
     * @brief Leave every subscription, then stop and join the worker
     *
     * Unsubscribing gets @p budget in total; timeouts and failures are logged at
     * debug and otherwise ignored. Idempotent. A call from a task running on the
     * worker is logged and ignored; the bridge keeps running.
     */
    void shutdown(std::chrono::milliseconds budget = std::chrono::seconds(2));

private:
    using WorkGuard = boost::asio::executor_work_guard<Executor>;

    ClientFactory factory_;
    std::unique_ptr<boost::asio::io_context> io_;
    std::unique_ptr<WorkGuard> workGuard_;
    std::thread worker_;
    std::unique_ptr<RemoteClient> client_; // worker thread only

    std::atomic<bool> initialized_{false};
    std::atomic<bool> stopped_{false};
    std::mutex initMutex_;
    mutable std::mutex ioMutex_;

    mutable std::mutex subsMutex_;
    std::map<SubscriptionId, std::pair<std::string, Unsubscriber>> subscriptions_;
    SubscriptionId nextSubscriptionId_{1};

    void runWorker();
    Result<void> createSession();

    template <typename T> Result<T> postAndWait(std::function<Result<T>()> fn) {
        auto promise = std::make_shared<std::promise<Result<T>>>();
        auto future = promise->get_future();
        {
            std::lock_guard<std::mutex> lock(ioMutex_);
            if (!io_)
                return Error{ErrorCode::SystemShutdown, "Sync bridge is shut down"};
            boost::asio::post(*io_, [promise, fn = std::move(fn)]() {
                try {
                    promise->set_value(fn());
                } catch (const std::exception& e) {
                    promise->set_value(Error{ErrorCode::RemoteOperationFailed, e.what()});
                } catch (...) {
                    promise->set_value(
                        Error{ErrorCode::RemoteOperationFailed, "Remote operation threw"});
                }
            });
        }

        try {
            return future.get();
        } catch (const std::future_error&) {
            // Handler dropped when the worker was torn down
            return Error{ErrorCode::SystemShutdown, "Sync bridge shut down before completion"};
        }
    }
};

} // namespace agroledger::sync
