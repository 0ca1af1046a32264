#include <spdlog/spdlog.h>
#include <cmath>
#include <variant>
#include <agroledger/store/ledger_store.h>
#include <agroledger/store/ordinal_date.h>
#include <agroledger/store/schema_manager.h>

namespace agroledger::store {

namespace {

using Lock = std::lock_guard<std::recursive_mutex>;
using Param = std::variant<int64_t, std::string>;

const std::vector<std::string> kEntryColumns = {
    "id",          "entry_date",      "property_id",  "account_id",    "document_number",
    "document_type", "description",   "counterparty_id", "kind",       "credit",
    "debit",       "closing_balance", "balance_sign", "author",        "category",
    "ordinal_date", "affected_area",  "quantity",     "unit"};

constexpr const char* kPropertyColumns =
    "id, code, country, currency, itr_code, caepf, state_registration, name, address, number, "
    "complement, district, state, city_code, zip, exploration_type, share, total_area, used_area";

constexpr const char* kAccountColumns =
    "id, code, country, bank_code, bank_name, branch, number, opening_balance, opened_at";

constexpr const char* kCounterpartyColumns = "id, tax_id, name, kind";

constexpr const char* kProfileColumns =
    "profile, version, start_indicator, special_situation, ident, name, street, number, "
    "complement, district, state, city_code, zip, phone, email, updated_at";

std::string joinColumns(const std::vector<std::string>& columns, size_t skip = 0) {
    std::string out;
    for (size_t i = skip; i < columns.size(); ++i) {
        if (i > skip)
            out += ", ";
        out += columns[i];
    }
    return out;
}

std::string placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        out += (i == 0 ? "?" : ", ?");
    }
    return out;
}

template <typename... Args>
Result<void> execPrepared(Database& db, const std::string& sql, Args&&... args) {
    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bindAll(std::forward<Args>(args)...); !r)
        return r;
    return stmt.execute();
}

template <typename T, typename Reader, typename... Args>
Result<std::vector<T>> queryRows(Database& db, const std::string& sql, Reader read,
                                 Args&&... args) {
    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bindAll(std::forward<Args>(args)...); !r)
        return r.error();

    std::vector<T> rows;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        rows.push_back(read(stmt));
    }
    return rows;
}

template <typename T> Result<std::optional<T>> firstRow(Result<std::vector<T>> rows) {
    if (!rows)
        return rows.error();
    if (rows.value().empty())
        return std::optional<T>{};
    return std::optional<T>{std::move(rows.value().front())};
}

Result<void> bindParams(Statement& stmt, const std::vector<Param>& params) {
    int index = 1;
    for (const auto& p : params) {
        auto r = std::visit([&](const auto& v) { return stmt.bind(index, v); }, p);
        if (!r)
            return r;
        ++index;
    }
    return {};
}

void applyRange(QueryBuilder& qb, std::vector<Param>& params, const OrdinalRange& range,
                const std::string& column = "ordinal_date") {
    if (range.from) {
        qb.andWhere(column + " >= ?");
        params.emplace_back(*range.from);
    }
    if (range.to) {
        qb.andWhere(column + " <= ?");
        params.emplace_back(*range.to);
    }
}

LedgerEntry readEntry(const Statement& s) {
    LedgerEntry e;
    e.id = s.getInt64(0);
    e.date = s.getString(1);
    e.propertyId = s.getInt64(2);
    e.accountId = s.getInt64(3);
    e.documentNumber = s.getString(4);
    e.documentType = s.getString(5);
    e.description = s.getString(6);
    e.counterpartyId = s.getOptionalInt64(7);
    e.kind = entryKindFromCode(s.getInt(8)).value_or(EntryKind::Advance);
    e.credit = s.getDouble(9);
    e.debit = s.getDouble(10);
    e.closingBalance = s.getDouble(11);
    e.balanceSign = s.getString(12) == "P" ? BalanceSign::Positive : BalanceSign::Negative;
    e.author = s.getString(13);
    e.category = s.getOptionalString(14);
    e.ordinalDate = s.getOptionalInt64(15);
    e.affectedArea = s.getOptionalDouble(16);
    e.quantity = s.getOptionalDouble(17);
    e.unit = s.getOptionalString(18);
    return e;
}

Property readProperty(const Statement& s) {
    Property p;
    p.id = s.getInt64(0);
    p.code = s.getString(1);
    p.country = s.getString(2);
    p.currency = s.getString(3);
    p.itrCode = s.getString(4);
    p.caepf = s.getString(5);
    p.stateRegistration = s.getString(6);
    p.name = s.getString(7);
    p.address = s.getString(8);
    p.number = s.getString(9);
    p.complement = s.getString(10);
    p.district = s.getString(11);
    p.state = s.getString(12);
    p.cityCode = s.getString(13);
    p.zip = s.getString(14);
    p.explorationType = s.getInt(15);
    p.share = s.getDouble(16);
    p.totalArea = s.getDouble(17);
    p.usedArea = s.getDouble(18);
    return p;
}

Account readAccount(const Statement& s) {
    Account a;
    a.id = s.getInt64(0);
    a.code = s.getString(1);
    a.country = s.getString(2);
    a.bankCode = s.getString(3);
    a.bankName = s.getString(4);
    a.branch = s.getString(5);
    a.number = s.getString(6);
    a.openingBalance = s.getDouble(7);
    a.openedAt = s.getString(8);
    return a;
}

Counterparty readCounterparty(const Statement& s) {
    return Counterparty{s.getInt64(0), s.getString(1), s.getString(2), s.getInt(3)};
}

ProfileParams readProfile(const Statement& s) {
    ProfileParams p;
    p.profile = s.getString(0);
    p.version = s.getString(1);
    p.startIndicator = s.getInt(2);
    p.specialSituation = s.getInt(3);
    p.ident = s.getString(4);
    p.name = s.getString(5);
    p.street = s.getString(6);
    p.number = s.getString(7);
    p.complement = s.getString(8);
    p.district = s.getString(9);
    p.state = s.getString(10);
    p.cityCode = s.getString(11);
    p.zip = s.getString(12);
    p.phone = s.getString(13);
    p.email = s.getString(14);
    p.updatedAt = s.getString(15);
    return p;
}

// Canonical date, derived ordinal and enum range checks
Result<LedgerEntry> normalizeEntry(LedgerEntry entry) {
    auto date = parseLedgerDate(entry.date);
    if (!date) {
        return Error{ErrorCode::ValidationError, "Unrecognized entry date '" + entry.date + "'"};
    }
    entry.date = toIsoString(*date);
    entry.ordinalDate = toOrdinal(*date);

    if (!entryKindFromCode(static_cast<int>(entry.kind))) {
        return Error{ErrorCode::ValidationError, "Invalid entry kind"};
    }
    if (!balanceSignFromChar(static_cast<char>(entry.balanceSign))) {
        return Error{ErrorCode::ValidationError, "Invalid balance sign"};
    }
    return entry;
}

Result<void> bindEntry(Statement& stmt, const LedgerEntry& e, int firstIndex) {
    int i = firstIndex;
    Result<void> r;
    auto next = [&](auto&& value) {
        if (r)
            r = stmt.bind(i++, value);
    };
    next(e.date);
    next(e.propertyId);
    next(e.accountId);
    next(e.documentNumber);
    next(e.documentType);
    next(e.description);
    next(e.counterpartyId);
    next(static_cast<int>(e.kind));
    next(e.credit);
    next(e.debit);
    next(e.closingBalance);
    next(std::string(1, static_cast<char>(e.balanceSign)));
    next(e.author);
    next(e.category);
    next(e.ordinalDate);
    next(e.affectedArea);
    next(e.quantity);
    next(e.unit);
    return r;
}

} // namespace

std::string digitsOnly(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c >= '0' && c <= '9')
            out.push_back(c);
    }
    return out;
}

Result<std::unique_ptr<LedgerStore>> LedgerStore::open(const std::string& path,
                                                       std::chrono::milliseconds busyTimeout) {
    auto dbResult = SchemaManager::open(path);
    if (!dbResult)
        return dbResult.error();

    auto db = std::move(dbResult).value();
    if (auto r = db->setBusyTimeout(busyTimeout); !r)
        return r.error();
    if (auto r = db->execute("PRAGMA synchronous=FULL"); !r) {
        return Error{ErrorCode::DatabaseError, "Failed to set synchronous mode: " + r.error().message};
    }
    spdlog::info("Opened ledger store {}", path);
    return std::make_unique<LedgerStore>(std::move(db));
}

LedgerStore::LedgerStore(std::unique_ptr<Database> db) : db_(std::move(db)) {}

LedgerStore::~LedgerStore() = default;

const std::string& LedgerStore::path() const {
    return db_->path();
}

Result<void> LedgerStore::inWriteScope(const std::function<Result<void>()>& fn) {
    if (db_->inTransaction())
        return fn();
    try {
        return db_->transaction(fn, TransactionMode::Immediate);
    } catch (const std::exception& e) {
        return Error{ErrorCode::TransactionAborted, e.what()};
    }
}

// --- Ledger entries -------------------------------------------------------

Result<EntryId> LedgerStore::insertEntry(const LedgerEntry& entry, bool withId) {
    std::string sql = withId ? "INSERT OR REPLACE INTO ledger_entry (" + joinColumns(kEntryColumns) +
                                   ") VALUES (" + placeholders(kEntryColumns.size()) + ")"
                             : "INSERT INTO ledger_entry (" + joinColumns(kEntryColumns, 1) +
                                   ") VALUES (" + placeholders(kEntryColumns.size() - 1) + ")";
    auto stmtResult = db_->prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    int first = 1;
    if (withId) {
        if (auto r = stmt.bind(1, entry.id); !r)
            return r.error();
        first = 2;
    }
    if (auto r = bindEntry(stmt, entry, first); !r)
        return r.error();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return withId ? entry.id : db_->lastInsertRowId();
}

Result<EntryId> LedgerStore::createEntry(const LedgerEntry& entry) {
    auto normalized = normalizeEntry(entry);
    if (!normalized)
        return normalized.error();

    Lock lock(mutex_);
    auto id = insertEntry(normalized.value(), false);
    if (id)
        spdlog::debug("Created ledger entry {}", id.value());
    return id;
}

Result<void> LedgerStore::updateEntry(const LedgerEntry& entry) {
    auto normalized = normalizeEntry(entry);
    if (!normalized)
        return normalized.error();

    std::string assignments;
    for (size_t i = 1; i < kEntryColumns.size(); ++i) {
        if (i > 1)
            assignments += ", ";
        assignments += kEntryColumns[i] + " = ?";
    }

    Lock lock(mutex_);
    auto stmtResult = db_->prepare("UPDATE ledger_entry SET " + assignments + " WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = bindEntry(stmt, normalized.value(), 1); !r)
        return r;
    if (auto r = stmt.bind(static_cast<int>(kEntryColumns.size()), entry.id); !r)
        return r;
    if (auto r = stmt.execute(); !r)
        return r;
    if (db_->changes() == 0) {
        return Error{ErrorCode::NotFound, "Ledger entry " + std::to_string(entry.id) + " not found"};
    }
    return {};
}

Result<void> LedgerStore::deleteEntry(EntryId id) {
    Lock lock(mutex_);
    if (auto r = execPrepared(*db_, "DELETE FROM ledger_entry WHERE id = ?", id); !r)
        return r;
    if (db_->changes() == 0) {
        return Error{ErrorCode::NotFound, "Ledger entry " + std::to_string(id) + " not found"};
    }
    spdlog::debug("Deleted ledger entry {}", id);
    return {};
}

Result<std::optional<LedgerEntry>> LedgerStore::getEntry(EntryId id) {
    Lock lock(mutex_);
    return firstRow(queryRows<LedgerEntry>(
        *db_, "SELECT " + joinColumns(kEntryColumns) + " FROM ledger_entry WHERE id = ?", readEntry,
        id));
}

Result<std::vector<LedgerEntry>> LedgerStore::listEntries(const OrdinalRange& range,
                                                          const EntryFilter& filter) {
    QueryBuilder qb;
    std::vector<Param> params;
    qb.select(kEntryColumns).from("ledger_entry");
    applyRange(qb, params, range);

    if (!filter.propertyIds.empty()) {
        qb.andWhere("property_id IN (" + placeholders(filter.propertyIds.size()) + ")");
        for (auto id : filter.propertyIds)
            params.emplace_back(id);
    }
    if (filter.accountId) {
        qb.andWhere("account_id = ?");
        params.emplace_back(*filter.accountId);
    }
    if (filter.counterpartyId) {
        qb.andWhere("counterparty_id = ?");
        params.emplace_back(*filter.counterpartyId);
    }
    if (filter.kind) {
        qb.andWhere("kind = ?");
        params.emplace_back(static_cast<int64_t>(*filter.kind));
    }
    if (filter.category) {
        qb.andWhere("category = ?");
        params.emplace_back(*filter.category);
    }
    qb.orderBy("ordinal_date DESC, id DESC");
    if (filter.limit)
        qb.limit(*filter.limit);

    Lock lock(mutex_);
    auto stmtResult = db_->prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = bindParams(stmt, params); !r)
        return r.error();

    std::vector<LedgerEntry> entries;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        entries.push_back(readEntry(stmt));
    }
    return entries;
}

Result<void> LedgerStore::applyRemoteEntry(const LedgerEntry& entry) {
    if (entry.id <= 0) {
        return Error{ErrorCode::ValidationError, "Remote entry has no identifier"};
    }
    auto normalized = normalizeEntry(entry);
    if (!normalized)
        return normalized.error();

    Lock lock(mutex_);
    auto r = insertEntry(normalized.value(), true);
    if (!r)
        return r.error();
    return {};
}

Result<EntryId> LedgerStore::postEntry(LedgerEntry entry) {
    Lock lock(mutex_);
    const bool editing = entry.id > 0;
    auto previous = editing ? previousBalance(entry.accountId, entry.id)
                            : previousBalance(entry.accountId);
    if (!previous)
        return previous.error();

    const double running = previous.value() + entry.credit - entry.debit;
    entry.closingBalance = std::fabs(running);
    entry.balanceSign = running >= 0 ? BalanceSign::Positive : BalanceSign::Negative;

    EntryId id = entry.id;
    auto r = inWriteScope([&]() -> Result<void> {
        if (!editing) {
            auto created = createEntry(entry);
            if (!created)
                return created.error();
            id = created.value();
            return {};
        }
        if (auto u = updateEntry(entry); !u)
            return u;
        auto chained = recomputeBalanceChain(entry.accountId, entry.id);
        if (!chained)
            return chained.error();
        return {};
    });
    if (!r)
        return r.error();
    return id;
}

// --- Properties -----------------------------------------------------------

Result<int64_t> LedgerStore::createProperty(const Property& p) {
    Lock lock(mutex_);
    auto r = execPrepared(
        *db_,
        "INSERT INTO property (code, country, currency, itr_code, caepf, state_registration, name, "
        "address, number, complement, district, state, city_code, zip, exploration_type, share, "
        "total_area, used_area) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        p.code, p.country, p.currency, p.itrCode, p.caepf, p.stateRegistration, p.name, p.address,
        p.number, p.complement, p.district, p.state, p.cityCode, p.zip, p.explorationType, p.share,
        p.totalArea, p.usedArea);
    if (!r)
        return r.error();
    return db_->lastInsertRowId();
}

Result<void> LedgerStore::updateProperty(const Property& p) {
    Lock lock(mutex_);
    auto r = execPrepared(
        *db_,
        "UPDATE property SET code = ?, country = ?, currency = ?, itr_code = ?, caepf = ?, "
        "state_registration = ?, name = ?, address = ?, number = ?, complement = ?, district = ?, "
        "state = ?, city_code = ?, zip = ?, exploration_type = ?, share = ?, total_area = ?, "
        "used_area = ? WHERE id = ?",
        p.code, p.country, p.currency, p.itrCode, p.caepf, p.stateRegistration, p.name, p.address,
        p.number, p.complement, p.district, p.state, p.cityCode, p.zip, p.explorationType, p.share,
        p.totalArea, p.usedArea, p.id);
    if (!r)
        return r;
    if (db_->changes() == 0)
        return Error{ErrorCode::NotFound, "Property " + std::to_string(p.id) + " not found"};
    return {};
}

Result<void> LedgerStore::deleteProperty(int64_t id) {
    Lock lock(mutex_);
    return execPrepared(*db_, "DELETE FROM property WHERE id = ?", id);
}

Result<std::optional<Property>> LedgerStore::getProperty(int64_t id) {
    Lock lock(mutex_);
    return firstRow(queryRows<Property>(
        *db_, std::string("SELECT ") + kPropertyColumns + " FROM property WHERE id = ?",
        readProperty, id));
}

Result<std::vector<Property>> LedgerStore::listProperties() {
    Lock lock(mutex_);
    return queryRows<Property>(
        *db_, std::string("SELECT ") + kPropertyColumns + " FROM property ORDER BY name",
        readProperty);
}

// --- Accounts -------------------------------------------------------------

Result<int64_t> LedgerStore::createAccount(const Account& a) {
    Lock lock(mutex_);
    auto r = execPrepared(*db_,
                          "INSERT INTO account (code, country, bank_code, bank_name, branch, "
                          "number, opening_balance, opened_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                          a.code, a.country, a.bankCode, a.bankName, a.branch, a.number,
                          a.openingBalance, a.openedAt);
    if (!r)
        return r.error();
    return db_->lastInsertRowId();
}

Result<void> LedgerStore::updateAccount(const Account& a) {
    Lock lock(mutex_);
    auto r = execPrepared(*db_,
                          "UPDATE account SET code = ?, country = ?, bank_code = ?, bank_name = ?, "
                          "branch = ?, number = ?, opening_balance = ?, opened_at = ? WHERE id = ?",
                          a.code, a.country, a.bankCode, a.bankName, a.branch, a.number,
                          a.openingBalance, a.openedAt, a.id);
    if (!r)
        return r;
    if (db_->changes() == 0)
        return Error{ErrorCode::NotFound, "Account " + std::to_string(a.id) + " not found"};
    return {};
}

Result<void> LedgerStore::deleteAccount(int64_t id) {
    Lock lock(mutex_);
    return execPrepared(*db_, "DELETE FROM account WHERE id = ?", id);
}

Result<std::optional<Account>> LedgerStore::getAccount(int64_t id) {
    Lock lock(mutex_);
    return firstRow(queryRows<Account>(
        *db_, std::string("SELECT ") + kAccountColumns + " FROM account WHERE id = ?", readAccount,
        id));
}

Result<std::vector<Account>> LedgerStore::listAccounts() {
    Lock lock(mutex_);
    return queryRows<Account>(
        *db_, std::string("SELECT ") + kAccountColumns + " FROM account ORDER BY code", readAccount);
}

// --- Counterparties -------------------------------------------------------

Result<int64_t> LedgerStore::createCounterparty(const Counterparty& c) {
    Lock lock(mutex_);
    auto r = execPrepared(*db_, "INSERT INTO counterparty (tax_id, name, kind) VALUES (?, ?, ?)",
                          digitsOnly(c.taxId), c.name, c.kind);
    if (!r)
        return r.error();
    return db_->lastInsertRowId();
}

Result<void> LedgerStore::updateCounterparty(const Counterparty& c) {
    Lock lock(mutex_);
    auto r = execPrepared(*db_, "UPDATE counterparty SET tax_id = ?, name = ?, kind = ? WHERE id = ?",
                          digitsOnly(c.taxId), c.name, c.kind, c.id);
    if (!r)
        return r;
    if (db_->changes() == 0)
        return Error{ErrorCode::NotFound, "Counterparty " + std::to_string(c.id) + " not found"};
    return {};
}

Result<void> LedgerStore::deleteCounterparty(int64_t id) {
    Lock lock(mutex_);
    return execPrepared(*db_, "DELETE FROM counterparty WHERE id = ?", id);
}

Result<std::optional<Counterparty>> LedgerStore::getCounterparty(int64_t id) {
    Lock lock(mutex_);
    return firstRow(queryRows<Counterparty>(
        *db_, std::string("SELECT ") + kCounterpartyColumns + " FROM counterparty WHERE id = ?",
        readCounterparty, id));
}

Result<std::vector<Counterparty>> LedgerStore::listCounterparties() {
    Lock lock(mutex_);
    return queryRows<Counterparty>(
        *db_, std::string("SELECT ") + kCounterpartyColumns + " FROM counterparty ORDER BY name",
        readCounterparty);
}

Result<std::optional<Counterparty>> LedgerStore::findCounterpartyByTaxId(const std::string& taxId) {
    Lock lock(mutex_);
    return firstRow(queryRows<Counterparty>(
        *db_, std::string("SELECT ") + kCounterpartyColumns + " FROM counterparty WHERE tax_id = ?",
        readCounterparty, digitsOnly(taxId)));
}

Result<int64_t> LedgerStore::upsertCounterparty(const std::string& taxId, const std::string& name,
                                                int kind) {
    const std::string digits = digitsOnly(taxId);
    if (digits.empty()) {
        return Error{ErrorCode::ValidationError, "Counterparty tax id has no digits"};
    }

    Lock lock(mutex_);
    auto r = execPrepared(*db_,
                          "INSERT INTO counterparty (tax_id, name, kind) VALUES (?, ?, ?) "
                          "ON CONFLICT(tax_id) DO UPDATE SET name = excluded.name, "
                          "kind = excluded.kind",
                          digits, name, kind);
    if (!r)
        return r.error();

    auto found = findCounterpartyByTaxId(digits);
    if (!found)
        return found.error();
    if (!found.value())
        return Error{ErrorCode::InternalError, "Counterparty vanished after upsert"};
    return found.value()->id;
}

// --- Profile parameters ---------------------------------------------------

Result<std::optional<ProfileParams>> LedgerStore::getProfileParams(const std::string& profile) {
    Lock lock(mutex_);
    return firstRow(queryRows<ProfileParams>(
        *db_, std::string("SELECT ") + kProfileColumns + " FROM profile_params WHERE profile = ?",
        readProfile, profile));
}

Result<void> LedgerStore::upsertProfileParams(const ProfileParams& p) {
    if (p.profile.empty()) {
        return Error{ErrorCode::ValidationError, "Profile name is required"};
    }
    Lock lock(mutex_);
    return execPrepared(
        *db_,
        "INSERT OR REPLACE INTO profile_params (profile, version, start_indicator, "
        "special_situation, ident, name, street, number, complement, district, state, city_code, "
        "zip, phone, email, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
        "strftime('%Y-%m-%dT%H:%M:%S', 'now'))",
        p.profile, p.version, p.startIndicator, p.specialSituation, p.ident, p.name, p.street,
        p.number, p.complement, p.district, p.state, p.cityCode, p.zip, p.phone, p.email);
}

// --- Derived reads --------------------------------------------------------

Result<std::vector<AccountBalance>> LedgerStore::accountBalances() {
    Lock lock(mutex_);
    return queryRows<AccountBalance>(
        *db_, "SELECT account_id, last_entry_id, balance FROM account_balance ORDER BY account_id",
        [](const Statement& s) {
            return AccountBalance{s.getInt64(0), s.getInt64(1), s.getDouble(2)};
        });
}

Result<std::optional<AccountBalance>> LedgerStore::accountBalance(int64_t accountId) {
    Lock lock(mutex_);
    return firstRow(queryRows<AccountBalance>(
        *db_, "SELECT account_id, last_entry_id, balance FROM account_balance WHERE account_id = ?",
        [](const Statement& s) {
            return AccountBalance{s.getInt64(0), s.getInt64(1), s.getDouble(2)};
        },
        accountId));
}

Result<std::vector<CategorySummary>> LedgerStore::categorySummary(const OrdinalRange& range) {
    QueryBuilder qb;
    std::vector<Param> params;
    qb.select({"category", "year", "month", "total_credit", "total_debit"})
        .from("category_summary");
    OrdinalRange months;
    if (range.from)
        months.from = *range.from / 100;
    if (range.to)
        months.to = *range.to / 100;
    applyRange(qb, params, months, "(year * 100 + month)");
    qb.orderBy("year, month, category");

    Lock lock(mutex_);
    auto stmtResult = db_->prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = bindParams(stmt, params); !r)
        return r.error();

    std::vector<CategorySummary> rows;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        rows.push_back(CategorySummary{stmt.getString(0), stmt.getInt(1), stmt.getInt(2),
                                       stmt.getDouble(3), stmt.getDouble(4)});
    }
    return rows;
}

Result<double> LedgerStore::totalBalance() {
    Lock lock(mutex_);
    auto rows = queryRows<double>(
        *db_,
        "SELECT COALESCE(SUM(COALESCE(b.balance, a.opening_balance)), 0) "
        "FROM account a LEFT JOIN account_balance b ON b.account_id = a.id",
        [](const Statement& s) { return s.getDouble(0); });
    if (!rows)
        return rows.error();
    return rows.value().empty() ? 0.0 : rows.value().front();
}

Result<DateBounds> LedgerStore::dateBounds() {
    Lock lock(mutex_);
    auto rows = queryRows<DateBounds>(
        *db_, "SELECT MIN(ordinal_date), MAX(ordinal_date) FROM ledger_entry",
        [](const Statement& s) {
            return DateBounds{s.getOptionalInt64(0), s.getOptionalInt64(1)};
        });
    if (!rows)
        return rows.error();
    return rows.value().empty() ? DateBounds{} : rows.value().front();
}

Result<PeriodTotals> LedgerStore::periodTotals(const OrdinalRange& range) {
    QueryBuilder qb;
    std::vector<Param> params;
    qb.select({"COALESCE(SUM(CASE WHEN kind = 1 THEN credit ELSE 0 END), 0)",
               "COALESCE(SUM(CASE WHEN kind = 2 THEN debit ELSE 0 END), 0)"})
        .from("ledger_entry");
    applyRange(qb, params, range);

    Lock lock(mutex_);
    auto stmtResult = db_->prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = bindParams(stmt, params); !r)
        return r.error();
    auto step = stmt.step();
    if (!step)
        return step.error();
    if (!step.value())
        return PeriodTotals{};
    return PeriodTotals{stmt.getDouble(0), stmt.getDouble(1)};
}

Result<std::vector<MonthlyTotals>> LedgerStore::monthlyTotals(const OrdinalRange& range) {
    QueryBuilder qb;
    std::vector<Param> params;
    qb.select({"ordinal_date / 100 AS year_month", "COALESCE(SUM(credit), 0)",
               "COALESCE(SUM(debit), 0)"})
        .from("ledger_entry")
        .where("ordinal_date IS NOT NULL");
    applyRange(qb, params, range);
    qb.groupBy("year_month").orderBy("year_month");

    Lock lock(mutex_);
    auto stmtResult = db_->prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = bindParams(stmt, params); !r)
        return r.error();

    std::vector<MonthlyTotals> rows;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        rows.push_back(MonthlyTotals{stmt.getInt64(0), stmt.getDouble(1), stmt.getDouble(2)});
    }
    return rows;
}

Result<double> LedgerStore::previousBalance(int64_t accountId, std::optional<EntryId> beforeId) {
    Lock lock(mutex_);
    constexpr const char* kSigned =
        "SELECT CASE balance_sign WHEN 'P' THEN closing_balance ELSE -closing_balance END "
        "FROM ledger_entry WHERE account_id = ?";
    auto read = [](const Statement& s) { return s.getDouble(0); };
    auto rows = beforeId ? queryRows<double>(*db_,
                                             std::string(kSigned) +
                                                 " AND id < ? ORDER BY id DESC LIMIT 1",
                                             read, accountId, *beforeId)
                         : queryRows<double>(*db_,
                                             std::string(kSigned) + " ORDER BY id DESC LIMIT 1",
                                             read, accountId);
    if (!rows)
        return rows.error();
    return rows.value().empty() ? 0.0 : rows.value().front();
}

Result<int> LedgerStore::recomputeBalanceChain(int64_t accountId, EntryId fromId) {
    Lock lock(mutex_);
    auto anchor = getEntry(fromId);
    if (!anchor)
        return anchor.error();
    if (!anchor.value() || anchor.value()->accountId != accountId) {
        return Error{ErrorCode::NotFound, "Entry " + std::to_string(fromId) +
                                              " does not belong to account " +
                                              std::to_string(accountId)};
    }

    struct Movement {
        EntryId id;
        double credit;
        double debit;
    };
    auto later = queryRows<Movement>(
        *db_, "SELECT id, credit, debit FROM ledger_entry WHERE account_id = ? AND id > ? ORDER BY id",
        [](const Statement& s) { return Movement{s.getInt64(0), s.getDouble(1), s.getDouble(2)}; },
        accountId, fromId);
    if (!later)
        return later.error();

    double running = anchor.value()->signedClosingBalance();
    int updated = 0;
    auto r = inWriteScope([&]() -> Result<void> {
        for (const auto& m : later.value()) {
            running += m.credit - m.debit;
            auto u = execPrepared(*db_,
                                  "UPDATE ledger_entry SET closing_balance = ?, balance_sign = ? "
                                  "WHERE id = ?",
                                  std::fabs(running), running >= 0 ? "P" : "N", m.id);
            if (!u)
                return u;
            ++updated;
        }
        return {};
    });
    if (!r)
        return r.error();
    return updated;
}

Result<std::optional<EntryId>> LedgerStore::findDuplicateDocument(const std::string& documentNumber,
                                                                  int64_t counterpartyId,
                                                                  std::optional<EntryId> excludeId) {
    const std::string wanted = digitsOnly(documentNumber);
    if (wanted.empty())
        return std::optional<EntryId>{};

    Lock lock(mutex_);
    struct Candidate {
        EntryId id;
        std::string document;
    };
    auto rows = queryRows<Candidate>(
        *db_,
        "SELECT id, COALESCE(document_number, '') FROM ledger_entry WHERE counterparty_id = ? "
        "ORDER BY id",
        [](const Statement& s) { return Candidate{s.getInt64(0), s.getString(1)}; },
        counterpartyId);
    if (!rows)
        return rows.error();

    for (const auto& c : rows.value()) {
        if (excludeId && c.id == *excludeId)
            continue;
        if (digitsOnly(c.document) == wanted)
            return std::optional<EntryId>{c.id};
    }
    return std::optional<EntryId>{};
}

// --- Bulk scope -----------------------------------------------------------

Result<void> LedgerStore::withBulkTransaction(const BulkFn& fn) {
    Lock lock(mutex_);
    if (db_->inTransaction()) {
        // Nested scope on the owning thread joins the outer transaction
        return fn(*this);
    }

    if (auto r = db_->beginTransaction(TransactionMode::Exclusive); !r)
        return r;

    Result<void> result;
    try {
        result = fn(*this);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::TransactionAborted,
                       std::string("Bulk transaction aborted: ") + e.what()};
    } catch (...) {
        (void)db_->rollback();
        throw;
    }

    if (!result) {
        if (auto rb = db_->rollback(); !rb) {
            spdlog::error("Bulk transaction rollback failed: {}", rb.error().message);
        }
        spdlog::warn("Bulk transaction rolled back: {}", result.error().message);
        return result;
    }

    if (auto c = db_->commit(); !c) {
        (void)db_->rollback();
        return c;
    }
    return {};
}

} // namespace agroledger::store
