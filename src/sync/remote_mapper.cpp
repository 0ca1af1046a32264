#include <agroledger/store/ordinal_date.h>
#include <agroledger/sync/remote_mapper.h>

#include <algorithm>
#include <cmath>

namespace agroledger::sync {

namespace {

bool present(const nlohmann::json& row, const char* key) {
    return row.is_object() && row.contains(key) && !row[key].is_null();
}

double numberOr(const nlohmann::json& row, const char* key, double fallback = 0.0) {
    if (!present(row, key))
        return fallback;
    const auto& v = row[key];
    if (v.is_number())
        return v.get<double>();
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::optional<int64_t> integerOf(const nlohmann::json& row, const char* key) {
    if (!present(row, key))
        return std::nullopt;
    const auto& v = row[key];
    if (v.is_number_integer())
        return v.get<int64_t>();
    if (v.is_number())
        return static_cast<int64_t>(std::llround(v.get<double>()));
    if (v.is_string()) {
        try {
            return static_cast<int64_t>(std::stoll(v.get<std::string>()));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string textOf(const nlohmann::json& row, const char* key) {
    if (!present(row, key))
        return {};
    const auto& v = row[key];
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_number_integer())
        return std::to_string(v.get<int64_t>());
    return v.dump();
}

std::string lookupName(const NameMap& names, const std::optional<int64_t>& id) {
    if (!id)
        return {};
    auto it = names.find(*id);
    return it == names.end() ? std::string() : it->second;
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

LedgerRow toLocalTuple(const nlohmann::json& row, const NameMap& propertyNames,
                       const NameMap& counterpartyNames) {
    LedgerRow out;
    out.id = integerOf(row, columns::kId).value_or(0);

    const std::string rawDate = textOf(row, columns::kDate);
    if (auto date = store::parseLedgerDate(rawDate)) {
        out.date = store::toDisplayString(*date);
    } else {
        out.date = rawDate;
    }

    out.propertyName = lookupName(propertyNames, integerOf(row, columns::kProperty));
    out.documentNumber = textOf(row, columns::kDocumentNumber);
    out.counterpartyName = lookupName(counterpartyNames, integerOf(row, columns::kCounterparty));
    out.description = textOf(row, columns::kDescription);
    out.kindLabel = store::entryKindLabel(static_cast<int>(integerOf(row, columns::kKind).value_or(0)));
    out.credit = numberOr(row, columns::kCredit);
    out.debit = numberOr(row, columns::kDebit);

    const double magnitude = numberOr(row, columns::kClosingBalance);
    out.signedBalance = textOf(row, columns::kBalanceSign) == "P" ? magnitude : -magnitude;
    out.author = textOf(row, columns::kAuthor);
    return out;
}

nlohmann::json toRemoteRow(const store::LedgerEntry& entry) {
    nlohmann::json row;
    if (entry.id > 0)
        row[columns::kId] = entry.id;

    if (auto date = store::parseLedgerDate(entry.date)) {
        row[columns::kDate] = store::toIsoString(*date);
        row[columns::kOrdinalDate] = store::toOrdinal(*date);
    } else {
        row[columns::kDate] = entry.date;
        row[columns::kOrdinalDate] =
            entry.ordinalDate ? nlohmann::json(*entry.ordinalDate) : nlohmann::json(nullptr);
    }

    row[columns::kProperty] = entry.propertyId;
    row[columns::kAccount] = entry.accountId;
    row[columns::kDocumentNumber] =
        entry.documentNumber.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.documentNumber);
    if (allDigits(entry.documentType) && entry.documentType.size() <= 18) {
        row[columns::kDocumentType] = std::stoll(entry.documentType);
    } else {
        row[columns::kDocumentType] = entry.documentType;
    }
    row[columns::kDescription] = entry.description;
    row[columns::kCounterparty] =
        entry.counterpartyId ? nlohmann::json(*entry.counterpartyId) : nlohmann::json(nullptr);
    row[columns::kKind] = static_cast<int>(entry.kind);
    row[columns::kCredit] = entry.credit;
    row[columns::kDebit] = entry.debit;
    row[columns::kClosingBalance] = entry.closingBalance;
    row[columns::kBalanceSign] = std::string(1, static_cast<char>(entry.balanceSign));
    row[columns::kAuthor] = entry.author;
    row[columns::kCategory] = entry.category ? nlohmann::json(*entry.category) : nlohmann::json(nullptr);
    row[columns::kAffectedArea] =
        entry.affectedArea ? nlohmann::json(*entry.affectedArea) : nlohmann::json(nullptr);
    row[columns::kQuantity] = entry.quantity ? nlohmann::json(*entry.quantity) : nlohmann::json(nullptr);
    row[columns::kUnit] = entry.unit ? nlohmann::json(*entry.unit) : nlohmann::json(nullptr);
    return row;
}

Result<store::LedgerEntry> toEntry(const nlohmann::json& row) {
    auto id = integerOf(row, columns::kId);
    if (!id || *id <= 0) {
        return Error{ErrorCode::InvalidData, "Remote ledger row without id"};
    }

    store::LedgerEntry e;
    e.id = *id;
    e.date = textOf(row, columns::kDate);
    e.ordinalDate = integerOf(row, columns::kOrdinalDate);
    e.propertyId = integerOf(row, columns::kProperty).value_or(0);
    e.accountId = integerOf(row, columns::kAccount).value_or(0);
    e.documentNumber = textOf(row, columns::kDocumentNumber);
    e.documentType = textOf(row, columns::kDocumentType);
    e.description = textOf(row, columns::kDescription);
    e.counterpartyId = integerOf(row, columns::kCounterparty);
    e.kind = store::entryKindFromCode(static_cast<int>(integerOf(row, columns::kKind).value_or(0)))
                 .value_or(store::EntryKind::Advance);
    e.credit = numberOr(row, columns::kCredit);
    e.debit = numberOr(row, columns::kDebit);
    e.closingBalance = std::fabs(numberOr(row, columns::kClosingBalance));
    e.balanceSign = textOf(row, columns::kBalanceSign) == "P" ? store::BalanceSign::Positive
                                                                : store::BalanceSign::Negative;
    e.author = textOf(row, columns::kAuthor);
    if (present(row, columns::kCategory))
        e.category = textOf(row, columns::kCategory);
    if (present(row, columns::kAffectedArea))
        e.affectedArea = numberOr(row, columns::kAffectedArea);
    if (present(row, columns::kQuantity))
        e.quantity = numberOr(row, columns::kQuantity);
    if (present(row, columns::kUnit))
        e.unit = textOf(row, columns::kUnit);
    return e;
}

std::vector<int64_t> distinctIds(const nlohmann::json& rows, const char* column) {
    std::vector<int64_t> ids;
    if (!rows.is_array())
        return ids;
    for (const auto& row : rows) {
        auto id = integerOf(row, column);
        if (id && std::find(ids.begin(), ids.end(), *id) == ids.end())
            ids.push_back(*id);
    }
    return ids;
}

} // namespace agroledger::sync
