#pragma once

#include <agroledger/store/database.h>
#include <agroledger/store/ledger_types.h>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agroledger::store {

/**
 * @brief Local ledger repository over the embedded database
 *
 * All access is serialized through one recursive lock so that writes issued from
 * inside withBulkTransaction() join the open scope while other threads wait.
 * Every write is durable before it returns.
 */
class LedgerStore {
public:
    using BulkFn = std::function<Result<void>(LedgerStore&)>;

    /**
     * @brief Open the store at @p path, migrating it to the current schema
     *
     * Fails with ErrorCode::MigrationFailed if the schema cannot be brought up to date.
     * @p busyTimeout bounds how long a write waits on another connection's lock.
     */
    static Result<std::unique_ptr<LedgerStore>>
    open(const std::string& path,
         std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));

    explicit LedgerStore(std::unique_ptr<Database> db);
    ~LedgerStore();

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    // Ledger entries
    Result<EntryId> createEntry(const LedgerEntry& entry);
    Result<void> updateEntry(const LedgerEntry& entry);
    Result<void> deleteEntry(EntryId id);
    Result<std::optional<LedgerEntry>> getEntry(EntryId id);

    /**
     * @brief Entries in range, newest first (ordinal date desc, then id desc)
     */
    Result<std::vector<LedgerEntry>> listEntries(const OrdinalRange& range,
                                                 const EntryFilter& filter = {});

    /**
     * @brief Insert or replace an entry keyed by its identifier
     *
     * Used for rows coming from the remote backend; the identifier is kept as is.
     */
    Result<void> applyRemoteEntry(const LedgerEntry& entry);

    /**
     * @brief Record an entry with its running balance
     *
     * The closing balance is the account's previous signed balance plus credit minus
     * debit. When @p entry carries an existing id it is updated and every later entry
     * of the account is re-chained.
     */
    Result<EntryId> postEntry(LedgerEntry entry);

    // Reference entities
    Result<int64_t> createProperty(const Property& property);
    Result<void> updateProperty(const Property& property);
    Result<void> deleteProperty(int64_t id);
    Result<std::optional<Property>> getProperty(int64_t id);
    Result<std::vector<Property>> listProperties();

    Result<int64_t> createAccount(const Account& account);
    Result<void> updateAccount(const Account& account);
    Result<void> deleteAccount(int64_t id);
    Result<std::optional<Account>> getAccount(int64_t id);
    Result<std::vector<Account>> listAccounts();

    Result<int64_t> createCounterparty(const Counterparty& counterparty);
    Result<void> updateCounterparty(const Counterparty& counterparty);
    Result<void> deleteCounterparty(int64_t id);
    Result<std::optional<Counterparty>> getCounterparty(int64_t id);
    Result<std::vector<Counterparty>> listCounterparties();
    Result<std::optional<Counterparty>> findCounterpartyByTaxId(const std::string& taxId);

    /// Insert or update by tax id (digits only); returns the counterparty id
    Result<int64_t> upsertCounterparty(const std::string& taxId, const std::string& name, int kind);

    Result<std::optional<ProfileParams>> getProfileParams(const std::string& profile);
    Result<void> upsertProfileParams(const ProfileParams& params);

    // Derived reads
    Result<std::vector<AccountBalance>> accountBalances();
    Result<std::optional<AccountBalance>> accountBalance(int64_t accountId);
    Result<std::vector<CategorySummary>> categorySummary(const OrdinalRange& range = {});

    /// Sum over accounts of the latest signed balance, or the opening balance if none
    Result<double> totalBalance();
    Result<DateBounds> dateBounds();
    Result<PeriodTotals> periodTotals(const OrdinalRange& range);
    Result<std::vector<MonthlyTotals>> monthlyTotals(const OrdinalRange& range);

    /// Signed balance of the account's last entry before @p beforeId (or overall); 0 if none
    Result<double> previousBalance(int64_t accountId, std::optional<EntryId> beforeId = {});

    /// Re-chain closing balances of entries after @p fromId; returns rows updated
    Result<int> recomputeBalanceChain(int64_t accountId, EntryId fromId);

    /// Entry with the same document digits and counterparty, if any
    Result<std::optional<EntryId>> findDuplicateDocument(const std::string& documentNumber,
                                                         int64_t counterpartyId,
                                                         std::optional<EntryId> excludeId = {});

    /**
     * @brief Run @p fn inside one exclusive write transaction
     *
     * Commits if @p fn succeeds. If it returns an error or throws, every write made in
     * the scope is rolled back and the failure is returned.
     */
    Result<void> withBulkTransaction(const BulkFn& fn);

    [[nodiscard]] const std::string& path() const;

private:
    std::unique_ptr<Database> db_;
    mutable std::recursive_mutex mutex_;

    Result<void> inWriteScope(const std::function<Result<void>()>& fn);
    Result<EntryId> insertEntry(const LedgerEntry& entry, bool withId);
};

/// Keep only ASCII digits
std::string digitsOnly(const std::string& text);

} // namespace agroledger::store
