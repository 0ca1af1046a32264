#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <agroledger/store/ordinal_date.h>
#include <agroledger/store/schema_manager.h>

namespace agroledger::store {

namespace {

constexpr const char* kLedgerTable = "ledger_entry";
constexpr const char* kLegacyLedgerTable = "ledger_entry_legacy";

const char* kCreateProperty = R"(
CREATE TABLE IF NOT EXISTS property (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    code TEXT NOT NULL UNIQUE,
    country TEXT NOT NULL DEFAULT 'BR',
    currency TEXT NOT NULL DEFAULT 'BRL',
    itr_code TEXT,
    caepf TEXT,
    state_registration TEXT,
    name TEXT NOT NULL,
    address TEXT,
    number TEXT,
    complement TEXT,
    district TEXT,
    state TEXT,
    city_code TEXT,
    zip TEXT,
    exploration_type INTEGER NOT NULL DEFAULT 1,
    share REAL NOT NULL DEFAULT 100,
    total_area REAL DEFAULT 0,
    used_area REAL DEFAULT 0,
    created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
))";

const char* kCreateAccount = R"(
CREATE TABLE IF NOT EXISTS account (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    code TEXT NOT NULL UNIQUE,
    country TEXT NOT NULL DEFAULT 'BR',
    bank_code TEXT,
    bank_name TEXT,
    branch TEXT,
    number TEXT,
    opening_balance REAL NOT NULL DEFAULT 0,
    opened_at TEXT
))";

const char* kCreateCounterparty = R"(
CREATE TABLE IF NOT EXISTS counterparty (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    tax_id TEXT NOT NULL UNIQUE,
    name TEXT NOT NULL,
    kind INTEGER NOT NULL DEFAULT 0,
    created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
))";

const char* kCreateProfileParams = R"(
CREATE TABLE IF NOT EXISTS profile_params (
    profile TEXT PRIMARY KEY,
    version TEXT NOT NULL DEFAULT '0001',
    start_indicator INTEGER NOT NULL DEFAULT 0,
    special_situation INTEGER NOT NULL DEFAULT 0,
    ident TEXT,
    name TEXT,
    street TEXT,
    number TEXT,
    complement TEXT,
    district TEXT,
    state TEXT,
    city_code TEXT,
    zip TEXT,
    phone TEXT,
    email TEXT,
    updated_at TEXT DEFAULT ''
))";

// No CHECK constraints on the ledger table; LedgerStore validates what it writes.
const char* kCreateLedgerEntry = R"(
CREATE TABLE IF NOT EXISTS ledger_entry (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    entry_date TEXT,
    property_id INTEGER REFERENCES property(id),
    account_id INTEGER REFERENCES account(id),
    document_number TEXT,
    document_type TEXT,
    description TEXT DEFAULT '',
    counterparty_id INTEGER REFERENCES counterparty(id),
    kind INTEGER DEFAULT 1,
    credit REAL DEFAULT 0,
    debit REAL DEFAULT 0,
    closing_balance REAL DEFAULT 0,
    balance_sign TEXT DEFAULT 'P',
    author TEXT DEFAULT '',
    category TEXT,
    ordinal_date INTEGER,
    affected_area REAL,
    quantity REAL,
    unit TEXT
))";

const char* kIndexes[] = {
    "CREATE INDEX IF NOT EXISTS idx_ledger_entry_ordinal "
    "ON ledger_entry(ordinal_date DESC, id DESC)",
    "CREATE INDEX IF NOT EXISTS idx_ledger_entry_account ON ledger_entry(account_id, id)",
    "CREATE INDEX IF NOT EXISTS idx_ledger_entry_property ON ledger_entry(property_id)",
    "CREATE INDEX IF NOT EXISTS idx_ledger_entry_counterparty ON ledger_entry(counterparty_id)",
    "CREATE INDEX IF NOT EXISTS idx_ledger_entry_category ON ledger_entry(category)",
};

const char* kCreateAccountBalanceView = R"(
CREATE VIEW account_balance AS
SELECT e.account_id AS account_id,
       e.id AS last_entry_id,
       CASE WHEN e.balance_sign = 'P' THEN e.closing_balance ELSE -e.closing_balance END AS balance
FROM ledger_entry e
WHERE e.id = (SELECT MAX(i.id) FROM ledger_entry i WHERE i.account_id = e.account_id))";

const char* kCreateCategorySummaryView = R"(
CREATE VIEW category_summary AS
SELECT COALESCE(category, '') AS category,
       ordinal_date / 10000 AS year,
       (ordinal_date / 100) % 100 AS month,
       SUM(COALESCE(credit, 0)) AS total_credit,
       SUM(COALESCE(debit, 0)) AS total_debit
FROM ledger_entry
WHERE ordinal_date IS NOT NULL
GROUP BY COALESCE(category, ''), ordinal_date / 10000, (ordinal_date / 100) % 100)";

struct ViewDefinition {
    const char* name;
    const char* ddl;
};

const ViewDefinition kViews[] = {
    {"account_balance", kCreateAccountBalanceView},
    {"category_summary", kCreateCategorySummaryView},
};

const char* kDependentViews[] = {"account_balance", "category_summary"};

const char* kSequencedTables[] = {"property", "account", "counterparty", "ledger_entry"};

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Whitespace and case are not significant when comparing stored DDL
std::string canonicalDdl(const std::string& sql) {
    std::string out;
    out.reserve(sql.size());
    for (unsigned char c : sql) {
        if (!std::isspace(c))
            out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

Error migrationError(const char* step, const Error& cause) {
    return Error{ErrorCode::MigrationFailed,
                 std::string("Schema step '") + step + "' failed: " + cause.message};
}

} // namespace

const char* rebuildStateName(RebuildState state) {
    switch (state) {
        case RebuildState::Detect:
            return "detect";
        case RebuildState::QuiesceDependents:
            return "quiesce-dependents";
        case RebuildState::StageNew:
            return "stage-new";
        case RebuildState::Copy:
            return "copy";
        case RebuildState::Swap:
            return "swap";
        case RebuildState::RecreateDependents:
            return "recreate-dependents";
        case RebuildState::Commit:
            return "commit";
    }
    return "unknown";
}

SchemaManager::SchemaManager(Database& db) : db_(db) {}

const std::vector<AdditiveColumn>& SchemaManager::additiveColumns() {
    static const std::vector<AdditiveColumn> columns = {
        {kLedgerTable, "category", "TEXT DEFAULT NULL"},
        {kLedgerTable, "ordinal_date", "INTEGER DEFAULT NULL"},
        {kLedgerTable, "affected_area", "REAL DEFAULT NULL"},
        {kLedgerTable, "quantity", "REAL DEFAULT NULL"},
        {kLedgerTable, "unit", "TEXT DEFAULT NULL"},
        {"profile_params", "updated_at", "TEXT DEFAULT ''"},
    };
    return columns;
}

Result<std::unique_ptr<Database>> SchemaManager::open(const std::string& path) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::MigrationFailed,
                         "Cannot create directory " + parent.string() + ": " + ec.message()};
        }
    }

    auto db = std::make_unique<Database>();
    if (auto r = db->open(path, ConnectionMode::Create); !r) {
        return migrationError("open", r.error());
    }

    SchemaManager manager(*db);
    if (auto r = manager.migrate(); !r) {
        return r.error();
    }
    return std::move(db);
}

void SchemaManager::setRebuildObserver(RebuildObserver observer) {
    rebuildObserver_ = std::move(observer);
}

Result<void> SchemaManager::migrate() {
    spdlog::debug("Migrating ledger schema at {}", db_.path());

    if (auto r = runStep("create-tables", [this] { return createTables(); }); !r)
        return r;
    if (auto r = runStep("additive-columns", [this] { return addMissingColumns(); }); !r)
        return r;

    auto rebuild = ledgerNeedsRebuild();
    if (!rebuild)
        return migrationError("detect", rebuild.error());
    if (rebuild.value()) {
        if (auto r = runStep("rebuild-ledger", [this] { return rebuildLedgerTable(); }); !r)
            return r;
    }

    if (auto r = runStep("reconcile-sequences", [this] { return reconcileSequences(); }); !r)
        return r;
    if (auto r = runStep("backfill-ordinal-dates", [this] { return backfillOrdinalDates(); }); !r)
        return r;
    if (auto r = runStep("indexes-and-views", [this] { return createIndexesAndViews(); }); !r)
        return r;

    spdlog::debug("Ledger schema is current");
    return {};
}

Result<void> SchemaManager::runStep(const char* name, const std::function<Result<void>()>& step) {
    Result<void> result;
    try {
        result = db_.transaction([&]() -> Result<void> { return step(); });
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    }
    if (!result) {
        spdlog::error("Schema step '{}' failed: {}", name, result.error().message);
        return migrationError(name, result.error());
    }
    return {};
}

Result<void> SchemaManager::createTables() {
    for (const char* ddl : {kCreateProperty, kCreateAccount, kCreateCounterparty,
                            kCreateProfileParams, kCreateLedgerEntry}) {
        if (auto r = db_.execute(ddl); !r)
            return r;
    }
    return {};
}

Result<void> SchemaManager::addMissingColumns() {
    for (const auto& col : additiveColumns()) {
        auto exists = db_.columnExists(col.table, col.column);
        if (!exists)
            return exists.error();
        if (exists.value())
            continue;

        spdlog::info("Adding column {}.{}", col.table, col.column);
        auto r = db_.execute("ALTER TABLE " + col.table + " ADD COLUMN " + col.column + " " +
                             col.definition);
        if (!r)
            return r;
    }
    return {};
}

Result<bool> SchemaManager::ledgerNeedsRebuild() {
    auto stmtResult =
        db_.prepare("SELECT sql FROM sqlite_master WHERE type='table' AND name=?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, kLedgerTable); !r)
        return r.error();
    auto step = stmt.step();
    if (!step)
        return step.error();
    if (!step.value())
        return false;

    return toUpper(stmt.getString(0)).find("AUTOINCREMENT") == std::string::npos;
}

Result<void> SchemaManager::enterState(RebuildState state) {
    spdlog::debug("Ledger rebuild: {}", rebuildStateName(state));
    if (rebuildObserver_)
        return rebuildObserver_(state);
    return {};
}

Result<std::vector<std::string>> SchemaManager::tableColumns(const std::string& table) {
    auto stmtResult = db_.prepare("PRAGMA table_info(" + table + ")");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    std::vector<std::string> columns;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        columns.push_back(stmt.getString(1));
    }
    return columns;
}

Result<void> SchemaManager::dropViews() {
    for (const char* view : kDependentViews) {
        if (auto r = db_.execute(std::string("DROP VIEW IF EXISTS ") + view); !r)
            return r;
    }
    return {};
}

Result<void> SchemaManager::rebuildLedgerTable() {
    spdlog::info("Rebuilding {} to keep identifiers monotonic", kLedgerTable);

    RebuildState state = RebuildState::Detect;
    std::vector<std::string> shared;
    while (true) {
        if (auto r = enterState(state); !r)
            return r;

        switch (state) {
            case RebuildState::Detect: {
                auto before = db_.queryInt64("SELECT COUNT(*) FROM ledger_entry");
                if (!before)
                    return before.error();
                spdlog::debug("Ledger rebuild will carry {} rows", before.value().value_or(0));
                state = RebuildState::QuiesceDependents;
                break;
            }
            case RebuildState::QuiesceDependents: {
                if (auto r = dropViews(); !r)
                    return r;
                state = RebuildState::StageNew;
                break;
            }
            case RebuildState::StageNew: {
                auto r = db_.execute(std::string("ALTER TABLE ") + kLedgerTable + " RENAME TO " +
                                     kLegacyLedgerTable);
                if (!r)
                    return r;
                if (auto c = db_.execute(kCreateLedgerEntry); !c)
                    return c;
                state = RebuildState::Copy;
                break;
            }
            case RebuildState::Copy: {
                auto legacyCols = tableColumns(kLegacyLedgerTable);
                if (!legacyCols)
                    return legacyCols.error();
                auto currentCols = tableColumns(kLedgerTable);
                if (!currentCols)
                    return currentCols.error();

                for (const auto& col : currentCols.value()) {
                    const auto& legacy = legacyCols.value();
                    if (std::find(legacy.begin(), legacy.end(), col) != legacy.end())
                        shared.push_back(col);
                }
                if (std::find(shared.begin(), shared.end(), "id") == shared.end()) {
                    return Error{ErrorCode::InvalidData, "Legacy ledger table has no id column"};
                }

                std::string columnList;
                for (size_t i = 0; i < shared.size(); ++i) {
                    if (i > 0)
                        columnList += ", ";
                    columnList += shared[i];
                }
                auto r = db_.execute(std::string("INSERT INTO ") + kLedgerTable + " (" +
                                     columnList + ") SELECT " + columnList + " FROM " +
                                     kLegacyLedgerTable + " ORDER BY id");
                if (!r)
                    return r;
                state = RebuildState::Swap;
                break;
            }
            case RebuildState::Swap: {
                if (auto r = db_.execute(std::string("DROP TABLE ") + kLegacyLedgerTable); !r)
                    return r;
                state = RebuildState::RecreateDependents;
                break;
            }
            case RebuildState::RecreateDependents: {
                if (auto r = createIndexesAndViews(); !r)
                    return r;
                state = RebuildState::Commit;
                break;
            }
            case RebuildState::Commit:
                spdlog::info("Ledger rebuild copied {} columns", shared.size());
                return {};
        }
    }
}

Result<void> SchemaManager::reconcileSequences() {
    for (const char* table : kSequencedTables) {
        auto maxId = db_.queryInt64(std::string("SELECT MAX(id) FROM ") + table);
        if (!maxId)
            return maxId.error();
        if (!maxId.value())
            continue;

        auto stmtResult = db_.prepare("SELECT seq FROM sqlite_sequence WHERE name=?");
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, table); !r)
            return r;
        auto step = stmt.step();
        if (!step)
            return step.error();

        const int64_t highest = *maxId.value();
        if (!step.value()) {
            spdlog::info("Seeding identifier sequence for {} at {}", table, highest);
            auto insert = db_.prepare("INSERT INTO sqlite_sequence (name, seq) VALUES (?, ?)");
            if (!insert)
                return insert.error();
            auto ins = std::move(insert).value();
            if (auto r = ins.bindAll(table, highest); !r)
                return r;
            if (auto r = ins.execute(); !r)
                return r;
        } else if (stmt.getInt64(0) < highest) {
            spdlog::warn("Identifier sequence for {} behind MAX(id) ({} < {}), raising", table,
                         stmt.getInt64(0), highest);
            auto update = db_.prepare("UPDATE sqlite_sequence SET seq = ? WHERE name = ?");
            if (!update)
                return update.error();
            auto upd = std::move(update).value();
            if (auto r = upd.bindAll(highest, table); !r)
                return r;
            if (auto r = upd.execute(); !r)
                return r;
        }
    }
    return {};
}

Result<void> SchemaManager::backfillOrdinalDates() {
    auto stmtResult =
        db_.prepare("SELECT id, entry_date FROM ledger_entry WHERE ordinal_date IS NULL");
    if (!stmtResult)
        return stmtResult.error();
    auto select = std::move(stmtResult).value();

    std::vector<std::pair<int64_t, CalendarDate>> parsed;
    size_t unparsed = 0;
    while (true) {
        auto step = select.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        if (auto date = parseLedgerDate(select.getString(1))) {
            parsed.emplace_back(select.getInt64(0), *date);
        } else {
            ++unparsed;
        }
    }

    if (parsed.empty()) {
        if (unparsed > 0)
            spdlog::debug("{} ledger rows have dates in no known encoding", unparsed);
        return {};
    }

    // Parsed dates are stored back as YYYY-MM-DD so text and key agree
    auto updateResult =
        db_.prepare("UPDATE ledger_entry SET ordinal_date = ?, entry_date = ? WHERE id = ?");
    if (!updateResult)
        return updateResult.error();
    auto update = std::move(updateResult).value();
    for (const auto& [id, date] : parsed) {
        if (auto r = update.bindAll(toOrdinal(date), toIsoString(date), id); !r)
            return r;
        if (auto r = update.execute(); !r)
            return r;
        if (auto r = update.reset(); !r)
            return r;
    }

    spdlog::info("Backfilled ordinal dates for {} ledger rows ({} left unset)", parsed.size(),
                 unparsed);
    return {};
}

Result<std::optional<std::string>> SchemaManager::storedViewDdl(const std::string& view) {
    auto stmtResult = db_.prepare("SELECT sql FROM sqlite_master WHERE type='view' AND name = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, view); !r)
        return r.error();
    auto step = stmt.step();
    if (!step)
        return step.error();
    if (!step.value())
        return std::optional<std::string>{};
    return std::optional<std::string>{stmt.getString(0)};
}

Result<void> SchemaManager::createIndexesAndViews() {
    for (const char* ddl : kIndexes) {
        if (auto r = db_.execute(ddl); !r)
            return r;
    }
    for (const auto& view : kViews) {
        auto stored = storedViewDdl(view.name);
        if (!stored)
            return stored.error();
        if (stored.value() && canonicalDdl(*stored.value()) == canonicalDdl(view.ddl))
            continue;

        // Missing or defined by an older release
        if (stored.value())
            spdlog::info("Replacing outdated view {}", view.name);
        if (auto r = db_.execute(std::string("DROP VIEW IF EXISTS ") + view.name); !r)
            return r;
        if (auto r = db_.execute(view.ddl); !r)
            return r;
    }
    return {};
}

} // namespace agroledger::store
