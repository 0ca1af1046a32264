#pragma once

#include <agroledger/store/ledger_types.h>
#include <agroledger/sync/remote_mapper.h>
#include <agroledger/sync/sync_bridge.h>

#include <optional>
#include <string>
#include <vector>

namespace agroledger::sync {

struct AppUser {
    int64_t id{0};
    std::string username;
};

/**
 * @brief Ledger and account operations against the remote backend
 *
 * Every call is one SyncBridge operation, so a listing and its name lookups see
 * the same session and never interleave with other callers' work.
 */
class RemoteLedger {
public:
    explicit RemoteLedger(SyncBridge& bridge, std::string table = "lancamento");

    /**
     * @brief Display rows in @p range, newest first
     *
     * @p propertyIds restricts the listing to those properties when not empty.
     * Property and counterparty names are fetched in one batch each.
     */
    Result<std::vector<LedgerRow>> listEntries(const store::OrdinalRange& range,
                                               const std::vector<int64_t>& propertyIds = {});

    /// Full entries in @p range, for pulling into the local store
    Result<std::vector<store::LedgerEntry>> fetchEntries(const store::OrdinalRange& range);

    Result<void> upsertEntry(const store::LedgerEntry& entry);

    /// Upsert in one request; returns the number of rows sent
    Result<size_t> pushEntries(const std::vector<store::LedgerEntry>& entries);

    Result<void> deleteEntry(EntryId id);

    // Application users (server-side functions)
    Result<std::optional<AppUser>> loginUser(const std::string& username,
                                             const std::string& password);
    Result<int64_t> createAppUser(const std::string& username, const std::string& password);
    Result<bool> verifyAppUser(const std::string& username, const std::string& password);

    /// Administrator sign-in; later operations carry the session token
    Result<void> signInAdmin(const std::string& email, const std::string& password);

    const std::string& table() const { return table_; }

private:
    SyncBridge& bridge_;
    std::string table_;
};

} // namespace agroledger::sync
