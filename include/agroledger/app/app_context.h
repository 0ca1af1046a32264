#pragma once

#include <agroledger/app/credential_store.h>
#include <agroledger/app/daily_archiver.h>
#include <agroledger/app/remote_change_applier.h>
#include <agroledger/config/app_config.h>
#include <agroledger/lookup/identity_lookup.h>
#include <agroledger/net/http_client.h>
#include <agroledger/store/ledger_store.h>
#include <agroledger/sync/change_feed.h>
#include <agroledger/sync/realtime_channel.h>
#include <agroledger/sync/remote_config.h>
#include <agroledger/sync/remote_ledger.h>
#include <agroledger/sync/sync_bridge.h>

#include <memory>
#include <optional>

namespace agroledger::app {

/**
 * @brief Everything a process needs, built once at startup
 *
 * The local store is always opened. Remote services exist only when a RemoteConfig
 * is supplied; the session itself is created lazily on first use.
 */
class AppContext {
public:
    struct Options {
        config::AppConfig config;
        std::optional<sync::RemoteConfig> remote;
        /// Defaults to libcurl
        std::shared_ptr<net::IHttpClient> http;
        /// Defaults to the Phoenix websocket feed
        sync::ChangeFeedFactory feedFactory;
        /// Defaults to PostgREST over @ref http
        sync::SyncBridge::ClientFactory clientFactory;
    };

    /// Opens (and migrates) the store; MigrationFailed is fatal for the caller
    static Result<std::unique_ptr<AppContext>> create(Options options);

    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    const config::AppConfig& config() const { return config_; }
    store::LedgerStore& store() { return *store_; }
    CredentialStore& credentials() { return credentials_; }
    lookup::IdentityLookup& identityLookup() { return *lookup_; }
    DailyArchiver& archiver() { return archiver_; }
    RemoteChangeApplier& changeApplier() { return applier_; }

    [[nodiscard]] bool hasRemote() const { return bridge_ != nullptr; }

    /// NotInitialized when no remote is configured
    Result<sync::RemoteLedger*> remoteLedger();
    Result<sync::RealtimeChannel*> realtime();
    Result<sync::SyncBridge*> bridge();

    /// Subscribe the change applier to the remote ledger table
    Result<void> watchLedger();

    /// Pull every remote entry into the local store in one transaction; returns the count
    Result<size_t> pullLedger(const store::OrdinalRange& range = {});

    /// Leave subscriptions, stop the worker and the dispatch pool. Idempotent.
    void shutdown();

private:
    AppContext(config::AppConfig config, std::unique_ptr<store::LedgerStore> store,
               std::shared_ptr<net::IHttpClient> http);

    config::AppConfig config_;
    std::unique_ptr<store::LedgerStore> store_;
    std::shared_ptr<net::IHttpClient> http_;
    CredentialStore credentials_;
    DailyArchiver archiver_;
    std::unique_ptr<lookup::IdentityLookup> lookup_;
    RemoteChangeApplier applier_;

    std::unique_ptr<sync::SyncBridge> bridge_;
    std::unique_ptr<sync::RemoteLedger> remoteLedger_;
    std::unique_ptr<sync::RealtimeChannel> realtime_;
};

} // namespace agroledger::app
