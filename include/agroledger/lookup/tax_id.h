#pragma once

#include <optional>
#include <string>

namespace agroledger::lookup {

enum class TaxIdKind { Cpf, Cnpj };

const char* taxIdKindName(TaxIdKind kind);

/// Kind implied by the digit count (11 CPF, 14 CNPJ); punctuation is ignored
std::optional<TaxIdKind> detectTaxIdKind(const std::string& taxId);

/// Check digits of an individual taxpayer number (11 digits)
bool isValidCpf(const std::string& taxId);

/// Check digits of a company taxpayer number (14 digits)
bool isValidCnpj(const std::string& taxId);

bool isValidTaxId(const std::string& taxId, TaxIdKind kind);

/// 000.000.000-00 or 00.000.000/0000-00; other input is returned unchanged
std::string formatTaxId(const std::string& taxId);

} // namespace agroledger::lookup
