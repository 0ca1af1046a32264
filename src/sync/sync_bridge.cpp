#include <agroledger/sync/sync_bridge.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <spdlog/spdlog.h>

#include <vector>

namespace agroledger::sync {

SyncBridge::SyncBridge(ClientFactory factory) : factory_(std::move(factory)) {
    io_ = std::make_unique<boost::asio::io_context>(1);
    workGuard_ = std::make_unique<WorkGuard>(io_->get_executor());
    worker_ = std::thread([this]() { runWorker(); });
}

SyncBridge::~SyncBridge() {
    shutdown();
}

void SyncBridge::runWorker() {
    // Exceptions escaping detached coroutines surface from run(); keep serving
    while (true) {
        try {
            io_->run();
            break;
        } catch (const std::exception& e) {
            spdlog::error("[SyncBridge] Worker task failed: {}", e.what());
        }
    }
    spdlog::debug("[SyncBridge] Worker exited");
}

Result<void> SyncBridge::createSession() {
    if (!factory_) {
        return Error{ErrorCode::NotInitialized, "No remote client factory"};
    }
    auto client = factory_();
    if (!client)
        return client.error();
    client_ = std::move(client).value();
    return {};
}

Result<void> SyncBridge::init() {
    if (initialized_.load(std::memory_order_acquire))
        return {};

    std::lock_guard<std::mutex> lock(initMutex_);
    if (initialized_.load(std::memory_order_acquire))
        return {};
    if (!running())
        return Error{ErrorCode::SystemShutdown, "Sync bridge is shut down"};

    auto r = postAndWait<void>([this]() { return createSession(); });
    if (!r) {
        spdlog::warn("[SyncBridge] Remote session init failed: {}", r.error().message);
        return r;
    }
    initialized_.store(true, std::memory_order_release);
    spdlog::info("[SyncBridge] Remote session ready");
    return {};
}

SyncBridge::Executor SyncBridge::executor() {
    std::lock_guard<std::mutex> lock(ioMutex_);
    return io_->get_executor();
}

Result<void> SyncBridge::spawn(std::string name,
                               std::function<boost::asio::awaitable<void>()> task) {
    if (!running())
        return Error{ErrorCode::SystemShutdown, "Sync bridge is shut down"};
    std::lock_guard<std::mutex> lock(ioMutex_);
    if (!io_)
        return Error{ErrorCode::SystemShutdown, "Sync bridge is shut down"};
    boost::asio::co_spawn(
        *io_,
        [name = std::move(name), task = std::move(task)]() -> boost::asio::awaitable<void> {
            try {
                co_await task();
            } catch (const std::exception& e) {
                spdlog::error("[SyncBridge] Task {} failed: {}", name, e.what());
            }
        },
        boost::asio::detached);
    return {};
}

Result<SyncBridge::SubscriptionId> SyncBridge::registerSubscription(std::string name,
                                                                  Unsubscriber unsubscribe) {
    std::lock_guard<std::mutex> lock(subsMutex_);
    if (!running())
        return Error{ErrorCode::SystemShutdown, "Sync bridge is shut down"};
    const SubscriptionId id = nextSubscriptionId_++;
    spdlog::debug("[SyncBridge] Registered subscription {} ({})", id, name);
    subscriptions_.emplace(id, std::make_pair(std::move(name), std::move(unsubscribe)));
    return id;
}

void SyncBridge::forgetSubscription(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subsMutex_);
    subscriptions_.erase(id);
}

size_t SyncBridge::subscriptionCount() const {
    std::lock_guard<std::mutex> lock(subsMutex_);
    return subscriptions_.size();
}

void SyncBridge::shutdown(std::chrono::milliseconds budget) {
    // The worker cannot join itself, and the loop it runs must outlive this call
    if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        spdlog::warn("[SyncBridge] shutdown() ignored on the worker thread");
        return;
    }

    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        return;

    std::vector<std::pair<std::string, Unsubscriber>> pending;
    {
        std::lock_guard<std::mutex> lock(subsMutex_);
        for (auto& entry : subscriptions_)
            pending.push_back(std::move(entry.second));
        subscriptions_.clear();
    }

    // Phase 1: leave subscriptions on the worker within the budget
    if (!pending.empty()) {
        auto done = std::make_shared<std::promise<void>>();
        auto finished = done->get_future();
        boost::asio::co_spawn(
            executor(),
            [pending = std::move(pending), done]() -> boost::asio::awaitable<void> {
                for (const auto& [name, unsubscribe] : pending) {
                    try {
                        co_await unsubscribe();
                    } catch (const std::exception& e) {
                        spdlog::debug("[SyncBridge] Unsubscribe of {} failed: {}", name, e.what());
                    }
                }
                done->set_value();
            },
            boost::asio::detached);

        if (finished.wait_for(budget) != std::future_status::ready) {
            spdlog::debug("[SyncBridge] Unsubscribe did not finish within {}ms", budget.count());
        }
    }

    // Phase 2: release work guard and stop the loop
    {
        std::lock_guard<std::mutex> lock(ioMutex_);
        if (workGuard_) {
            workGuard_->reset();
            workGuard_.reset();
        }
        io_->stop();
    }

    // Phase 3: join worker
    if (worker_.joinable())
        worker_.join();

    // Phase 4: drop session and any queued work; waiting callers see SystemShutdown
    client_.reset();
    {
        std::lock_guard<std::mutex> lock(ioMutex_);
        io_.reset();
    }
    initialized_.store(false, std::memory_order_release);
    spdlog::debug("[SyncBridge] Shut down");
}

} // namespace agroledger::sync
