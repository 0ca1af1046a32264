#include <spdlog/fmt/fmt.h>
#include <agroledger/store/ordinal_date.h>

namespace agroledger::store {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year))
        return 29;
    return kDays[month - 1];
}

std::optional<int> parseDigits(std::string_view text) {
    if (text.empty())
        return std::nullopt;
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9')
            return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

bool isValidDate(const CalendarDate& date) {
    if (date.year < 1 || date.year > 9999)
        return false;
    if (date.month < 1 || date.month > 12)
        return false;
    return date.day >= 1 && date.day <= daysInMonth(date.year, date.month);
}

std::optional<CalendarDate> parseLedgerDate(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    if (auto cut = text.find_first_of("T "); cut != std::string_view::npos)
        text = text.substr(0, cut);
    if (text.size() != 10)
        return std::nullopt;

    CalendarDate date;
    if (text[2] == text[5] && (text[2] == '/' || text[2] == '-')) {
        auto day = parseDigits(text.substr(0, 2));
        auto month = parseDigits(text.substr(3, 2));
        auto year = parseDigits(text.substr(6, 4));
        if (!day || !month || !year)
            return std::nullopt;
        date = CalendarDate{*year, *month, *day};
    } else if (text[4] == text[7] && (text[4] == '-' || text[4] == '/')) {
        auto year = parseDigits(text.substr(0, 4));
        auto month = parseDigits(text.substr(5, 2));
        auto day = parseDigits(text.substr(8, 2));
        if (!day || !month || !year)
            return std::nullopt;
        date = CalendarDate{*year, *month, *day};
    } else {
        return std::nullopt;
    }

    if (!isValidDate(date))
        return std::nullopt;
    return date;
}

int64_t toOrdinal(const CalendarDate& date) {
    return static_cast<int64_t>(date.year) * 10000 + date.month * 100 + date.day;
}

std::optional<CalendarDate> fromOrdinal(int64_t ordinal) {
    CalendarDate date{static_cast<int>(ordinal / 10000), static_cast<int>((ordinal / 100) % 100),
                      static_cast<int>(ordinal % 100)};
    if (!isValidDate(date))
        return std::nullopt;
    return date;
}

std::string toIsoString(const CalendarDate& date) {
    return fmt::format("{:04d}-{:02d}-{:02d}", date.year, date.month, date.day);
}

std::string toDisplayString(const CalendarDate& date) {
    return fmt::format("{:02d}/{:02d}/{:04d}", date.day, date.month, date.year);
}

} // namespace agroledger::store
