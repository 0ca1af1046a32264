#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agroledger::store {

struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;

    bool operator==(const CalendarDate&) const = default;
};

/**
 * @brief Parse a ledger date in either stored encoding
 *
 * Accepts day-first ("DD/MM/YYYY", "DD-MM-YYYY") and year-first ("YYYY-MM-DD",
 * "YYYY/MM/DD") text. A trailing time component after 'T' or ' ' is ignored.
 * Returns nullopt for anything else, including impossible calendar dates.
 */
std::optional<CalendarDate> parseLedgerDate(std::string_view text);

/// year*10000 + month*100 + day
int64_t toOrdinal(const CalendarDate& date);
std::optional<CalendarDate> fromOrdinal(int64_t ordinal);

std::string toIsoString(const CalendarDate& date);
std::string toDisplayString(const CalendarDate& date);

bool isValidDate(const CalendarDate& date);

} // namespace agroledger::store
