#include <agroledger/lookup/tax_id.h>
#include <agroledger/store/ledger_store.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>

namespace agroledger::lookup {

namespace {

template <size_t N> int checkDigit(const std::string& digits, const std::array<int, N>& weights) {
    int sum = 0;
    for (size_t i = 0; i < N; ++i)
        sum += (digits[i] - '0') * weights[i];
    const int rest = sum % 11;
    return rest < 2 ? 0 : 11 - rest;
}

bool allSame(const std::string& digits) {
    return std::all_of(digits.begin(), digits.end(), [&](char c) { return c == digits.front(); });
}

} // namespace

const char* taxIdKindName(TaxIdKind kind) {
    return kind == TaxIdKind::Cpf ? "cpf" : "cnpj";
}

std::optional<TaxIdKind> detectTaxIdKind(const std::string& taxId) {
    const auto digits = store::digitsOnly(taxId);
    if (digits.size() == 11)
        return TaxIdKind::Cpf;
    if (digits.size() == 14)
        return TaxIdKind::Cnpj;
    return std::nullopt;
}

bool isValidCpf(const std::string& taxId) {
    const auto d = store::digitsOnly(taxId);
    if (d.size() != 11 || allSame(d))
        return false;

    static constexpr std::array<int, 9> first{10, 9, 8, 7, 6, 5, 4, 3, 2};
    static constexpr std::array<int, 10> second{11, 10, 9, 8, 7, 6, 5, 4, 3, 2};
    return checkDigit(d, first) == d[9] - '0' && checkDigit(d, second) == d[10] - '0';
}

bool isValidCnpj(const std::string& taxId) {
    const auto d = store::digitsOnly(taxId);
    if (d.size() != 14 || allSame(d))
        return false;

    static constexpr std::array<int, 12> first{5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
    static constexpr std::array<int, 13> second{6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
    return checkDigit(d, first) == d[12] - '0' && checkDigit(d, second) == d[13] - '0';
}

bool isValidTaxId(const std::string& taxId, TaxIdKind kind) {
    return kind == TaxIdKind::Cpf ? isValidCpf(taxId) : isValidCnpj(taxId);
}

std::string formatTaxId(const std::string& taxId) {
    const auto d = store::digitsOnly(taxId);
    if (d.size() == 11) {
        return fmt::format("{}.{}.{}-{}", d.substr(0, 3), d.substr(3, 3), d.substr(6, 3),
                           d.substr(9, 2));
    }
    if (d.size() == 14) {
        return fmt::format("{}.{}.{}/{}-{}", d.substr(0, 2), d.substr(2, 3), d.substr(5, 3),
                           d.substr(8, 4), d.substr(12, 2));
    }
    return taxId;
}

} // namespace agroledger::lookup
