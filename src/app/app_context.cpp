#include <agroledger/app/app_context.h>
#include <agroledger/sync/phoenix_change_feed.h>
#include <agroledger/sync/postgrest_client.h>

#include <spdlog/spdlog.h>

namespace agroledger::app {

namespace {

DailyArchiver::Options archiverOptions(const config::AppConfig& cfg) {
    DailyArchiver::Options opts;
    opts.source = cfg.storePath();
    opts.backupDir = cfg.backupDir();
    opts.statePath = cfg.backupStatePath();
    return opts;
}

lookup::LookupOptions lookupOptions(const config::AppConfig& cfg) {
    lookup::LookupOptions opts;
    opts.maxAttempts = cfg.lookupMaxAttempts;
    opts.baseDelay = cfg.lookupBaseDelay;
    opts.minInterval = cfg.lookupMinInterval;
    return opts;
}

} // namespace

AppContext::AppContext(config::AppConfig config, std::unique_ptr<store::LedgerStore> store,
                       std::shared_ptr<net::IHttpClient> http)
    : config_(std::move(config)), store_(std::move(store)), http_(std::move(http)),
      credentials_(config_.adminFilePath(), config_.usersFilePath()),
      archiver_(archiverOptions(config_)),
      lookup_(std::make_unique<lookup::IdentityLookup>(http_, config_.lookupCachePath(),
                                                       lookupOptions(config_))),
      applier_(*store_) {}

AppContext::~AppContext() {
    shutdown();
}

Result<std::unique_ptr<AppContext>> AppContext::create(Options options) {
    auto store = store::LedgerStore::open(options.config.storePath().string());
    if (!store)
        return store.error();

    std::shared_ptr<net::IHttpClient> http = options.http;
    if (!http)
        http = net::makeCurlHttpClient();
    std::unique_ptr<AppContext> ctx(
        new AppContext(std::move(options.config), std::move(store).value(), http));

    if (auto r = ctx->credentials_.ensureAdmin(); !r)
        spdlog::warn("Could not bootstrap administrator credentials: {}", r.error().message);

    if (options.remote) {
        auto remote = *options.remote;
        remote.schema = ctx->config_.remoteSchema;
        remote.ledgerTable = ctx->config_.remoteTable;
        remote.requestTimeout = ctx->config_.requestTimeout;

        auto clientFactory = options.clientFactory;
        if (!clientFactory) {
            clientFactory = [remote, http]() -> Result<std::unique_ptr<sync::RemoteClient>> {
                return sync::makePostgrestClient(remote, http);
            };
        }
        auto feedFactory =
            options.feedFactory ? options.feedFactory : sync::makePhoenixFeedFactory(remote);

        ctx->bridge_ = std::make_unique<sync::SyncBridge>(std::move(clientFactory));
        ctx->remoteLedger_ = std::make_unique<sync::RemoteLedger>(*ctx->bridge_, remote.ledgerTable);

        sync::RealtimeChannel::Options rtOptions;
        rtOptions.schema = remote.schema;
        rtOptions.dispatchThreads = ctx->config_.dispatchThreads;
        rtOptions.maxPending = ctx->config_.maxPending;
        ctx->realtime_ = std::make_unique<sync::RealtimeChannel>(
            *ctx->bridge_, std::move(feedFactory), std::move(rtOptions));
        spdlog::debug("Remote configured for {}", remote.host());
    }
    return ctx;
}

Result<sync::RemoteLedger*> AppContext::remoteLedger() {
    if (!remoteLedger_)
        return Error{ErrorCode::NotInitialized, "Remote backend is not configured"};
    return remoteLedger_.get();
}

Result<sync::RealtimeChannel*> AppContext::realtime() {
    if (!realtime_)
        return Error{ErrorCode::NotInitialized, "Remote backend is not configured"};
    return realtime_.get();
}

Result<sync::SyncBridge*> AppContext::bridge() {
    if (!bridge_)
        return Error{ErrorCode::NotInitialized, "Remote backend is not configured"};
    return bridge_.get();
}

Result<void> AppContext::watchLedger() {
    auto channel = realtime();
    if (!channel)
        return channel.error();
    return channel.value()->subscribe(
        config_.remoteTable, [this](const std::string& kind, const nlohmann::json& payload) {
            applier_(kind, payload);
        });
}

Result<size_t> AppContext::pullLedger(const store::OrdinalRange& range) {
    auto ledger = remoteLedger();
    if (!ledger)
        return ledger.error();

    auto entries = ledger.value()->fetchEntries(range);
    if (!entries)
        return entries.error();

    const auto& rows = entries.value();
    auto r = store_->withBulkTransaction([&rows](store::LedgerStore& s) -> Result<void> {
        for (const auto& entry : rows) {
            if (auto applied = s.applyRemoteEntry(entry); !applied)
                return applied;
        }
        return {};
    });
    if (!r)
        return r.error();
    spdlog::info("Pulled {} remote entries", rows.size());
    return rows.size();
}

void AppContext::shutdown() {
    if (bridge_)
        bridge_->shutdown();
    if (realtime_)
        realtime_->stop();
}

} // namespace agroledger::app
