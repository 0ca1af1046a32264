#pragma once

#include <agroledger/store/database.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agroledger::store {

/**
 * @brief Column introduced after the first ledger schema
 */
struct AdditiveColumn {
    std::string table;
    std::string column;
    std::string definition; ///< Type and default, as used by ALTER TABLE ADD COLUMN
};

/**
 * @brief Phases of the ledger table rebuild
 *
 * The rebuild moves a ledger table declared without AUTOINCREMENT to the current
 * declaration while keeping every identifier. All phases share one transaction.
 */
enum class RebuildState {
    Detect,
    QuiesceDependents,
    StageNew,
    Copy,
    Swap,
    RecreateDependents,
    Commit
};

const char* rebuildStateName(RebuildState state);

/**
 * @brief Brings a ledger database file to the current schema
 *
 * Steps run in order, each inside its own transaction:
 *  1. create missing tables
 *  2. add columns introduced after the first schema
 *  3. rebuild the ledger table if it lacks AUTOINCREMENT
 *  4. raise the identifier sequence to at least MAX(id)
 *  5. backfill ordinal dates from the date text
 *  6. create indexes and derived views
 *
 * Running it again on a current database changes nothing.
 */
class SchemaManager {
public:
    /// Invoked on entry to each rebuild phase; an error aborts and rolls back the rebuild
    using RebuildObserver = std::function<Result<void>(RebuildState)>;

    explicit SchemaManager(Database& db);

    /**
     * @brief Open (creating if needed) and migrate the database at @p path
     *
     * Any failure is reported as ErrorCode::MigrationFailed.
     */
    static Result<std::unique_ptr<Database>> open(const std::string& path);

    Result<void> migrate();

    void setRebuildObserver(RebuildObserver observer);

    static const std::vector<AdditiveColumn>& additiveColumns();

private:
    Database& db_;
    RebuildObserver rebuildObserver_;

    Result<void> runStep(const char* name, const std::function<Result<void>()>& step);

    Result<void> createTables();
    Result<void> addMissingColumns();
    Result<bool> ledgerNeedsRebuild();
    Result<void> rebuildLedgerTable();
    Result<void> enterState(RebuildState state);
    Result<void> reconcileSequences();
    Result<void> backfillOrdinalDates();
    Result<void> createIndexesAndViews();
    Result<void> dropViews();
    Result<std::optional<std::string>> storedViewDdl(const std::string& view);
    Result<std::vector<std::string>> tableColumns(const std::string& table);
};

} // namespace agroledger::store
