#pragma once

#include <agroledger/core/types.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agroledger::store {

enum class EntryKind : int { Revenue = 1, Expense = 2, Advance = 3 };

enum class BalanceSign : char { Positive = 'P', Negative = 'N' };

/// Label for a remote or stored kind code; anything other than 1 or 2 is an advance
const char* entryKindLabel(int code);
std::optional<EntryKind> entryKindFromCode(int code);
std::optional<BalanceSign> balanceSignFromChar(char c);

inline double signedBalance(double magnitude, BalanceSign sign) {
    return sign == BalanceSign::Positive ? magnitude : -magnitude;
}

struct LedgerEntry {
    EntryId id = 0;
    std::string date;   ///< Canonical YYYY-MM-DD once stored
    std::optional<int64_t> ordinalDate;
    int64_t propertyId = 0;
    int64_t accountId = 0;
    std::string documentNumber;
    std::string documentType;
    std::string description;
    std::optional<int64_t> counterpartyId;
    EntryKind kind = EntryKind::Revenue;
    double credit = 0.0;
    double debit = 0.0;
    double closingBalance = 0.0;
    BalanceSign balanceSign = BalanceSign::Positive;
    std::string author;
    std::optional<std::string> category;
    std::optional<double> affectedArea;
    std::optional<double> quantity;
    std::optional<std::string> unit;

    double signedClosingBalance() const { return signedBalance(closingBalance, balanceSign); }
};

struct Property {
    int64_t id = 0;
    std::string code;
    std::string country = "BR";
    std::string currency = "BRL";
    std::string itrCode;
    std::string caepf;
    std::string stateRegistration;
    std::string name;
    std::string address;
    std::string number;
    std::string complement;
    std::string district;
    std::string state;
    std::string cityCode;
    std::string zip;
    int explorationType = 1;
    double share = 100.0;
    double totalArea = 0.0;
    double usedArea = 0.0;
};

struct Account {
    int64_t id = 0;
    std::string code;
    std::string country = "BR";
    std::string bankCode;
    std::string bankName;
    std::string branch;
    std::string number;
    double openingBalance = 0.0;
    std::string openedAt;
};

struct Counterparty {
    int64_t id = 0;
    std::string taxId; ///< CPF or CNPJ digits
    std::string name;
    int kind = 0;
};

/// Declarant parameters, one row per profile
struct ProfileParams {
    std::string profile;
    std::string version = "0001";
    int startIndicator = 0;
    int specialSituation = 0;
    std::string ident;
    std::string name;
    std::string street;
    std::string number;
    std::string complement;
    std::string district;
    std::string state;
    std::string cityCode;
    std::string zip;
    std::string phone;
    std::string email;
    std::string updatedAt;
};

/// Inclusive range over ordinal dates; unset bounds are open
struct OrdinalRange {
    std::optional<int64_t> from;
    std::optional<int64_t> to;
};

struct EntryFilter {
    std::vector<int64_t> propertyIds;
    std::optional<int64_t> accountId;
    std::optional<int64_t> counterpartyId;
    std::optional<EntryKind> kind;
    std::optional<std::string> category;
    std::optional<int> limit;
};

struct AccountBalance {
    int64_t accountId = 0;
    EntryId lastEntryId = 0;
    double balance = 0.0; ///< Signed
};

struct CategorySummary {
    std::string category;
    int year = 0;
    int month = 0;
    double totalCredit = 0.0;
    double totalDebit = 0.0;
};

struct PeriodTotals {
    double revenue = 0.0; ///< Credits of revenue entries
    double expense = 0.0; ///< Debits of expense entries
};

struct MonthlyTotals {
    int64_t yearMonth = 0; ///< YYYYMM
    double credit = 0.0;
    double debit = 0.0;
};

struct DateBounds {
    std::optional<int64_t> earliest;
    std::optional<int64_t> latest;
};

} // namespace agroledger::store
