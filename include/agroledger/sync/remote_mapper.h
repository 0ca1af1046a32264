#pragma once

#include <agroledger/store/ledger_types.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace agroledger::sync {

using NameMap = std::unordered_map<int64_t, std::string>;

/**
 * @brief Flat display row consumed by the presentation and report layers
 *
 * Field order matches the ledger grid: id, date (DD/MM/YYYY), property name,
 * document number, counterparty name, description, kind label, credit, debit,
 * signed balance, author.
 */
struct LedgerRow {
    int64_t id{0};
    std::string date;
    std::string propertyName;
    std::string documentNumber;
    std::string counterpartyName;
    std::string description;
    std::string kindLabel;
    double credit{0.0};
    double debit{0.0};
    double signedBalance{0.0};
    std::string author;
};

/// Remote ledger table column names
namespace columns {
inline constexpr const char* kId = "id";
inline constexpr const char* kDate = "data";
inline constexpr const char* kProperty = "cod_imovel";
inline constexpr const char* kAccount = "cod_conta";
inline constexpr const char* kDocumentNumber = "num_doc";
inline constexpr const char* kDocumentType = "tipo_doc";
inline constexpr const char* kDescription = "historico";
inline constexpr const char* kCounterparty = "id_participante";
inline constexpr const char* kKind = "tipo_lanc";
inline constexpr const char* kCredit = "valor_entrada";
inline constexpr const char* kDebit = "valor_saida";
inline constexpr const char* kClosingBalance = "saldo_final";
inline constexpr const char* kBalanceSign = "natureza_saldo";
inline constexpr const char* kAuthor = "usuario";
inline constexpr const char* kCategory = "categoria";
inline constexpr const char* kOrdinalDate = "data_ord";
inline constexpr const char* kAffectedArea = "area_afetada";
inline constexpr const char* kQuantity = "quantidade";
inline constexpr const char* kUnit = "unidade_medida";
} // namespace columns

/**
 * @brief Remote row to display row
 *
 * Missing names resolve to empty strings. The balance is negated unless the sign
 * is 'P'. Kind 1 is Revenue, 2 is Expense, anything else is Advance.
 */
LedgerRow toLocalTuple(const nlohmann::json& row, const NameMap& propertyNames,
                       const NameMap& counterpartyNames);

/// Entry to a full remote row (ISO date, ordinal key); written whole, never merged
nlohmann::json toRemoteRow(const store::LedgerEntry& entry);

/// Remote row to entry; InvalidData if the row has no usable id
Result<store::LedgerEntry> toEntry(const nlohmann::json& row);

/// Distinct non-null integer values of @p column, in first-seen order
std::vector<int64_t> distinctIds(const nlohmann::json& rows, const char* column);

} // namespace agroledger::sync
