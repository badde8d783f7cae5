#include "DateParser.h"
#include "CommonUtils.h"

#include <regex>

namespace DateParser {
namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

int expandTwoDigitYear(int year) {
    if (year >= 100) return year;
    return year > 50 ? 1900 + year : 2000 + year;
}
} // namespace

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::optional<DrawDate> makeDate(int year, int month, int day) {
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;
    return DrawDate{year, month, day};
}

std::optional<DrawDate> parse(const std::string& text) {
    // The leading group keeps the day from starting in the middle of a longer digit run.
    static const std::regex kDayMonthYear(R"((?:^|\D)(\d{1,2})[/\-.](\d{1,2})[/\-.](\d{4}|\d{2})(?!\d))");

    std::smatch m;
    if (!std::regex_search(text, m, kDayMonthYear)) return std::nullopt;

    const int day = std::stoi(m[1].str());
    const int month = std::stoi(m[2].str());
    const int year = expandTwoDigitYear(std::stoi(m[3].str()));
    return makeDate(year, month, day);
}

std::optional<DrawDate> parse(const Cell& cell) {
    if (!std::holds_alternative<std::string>(cell)) return std::nullopt;
    return parse(std::get<std::string>(cell));
}

std::optional<DrawDate> parseIso(const std::string& text) {
    const std::string s = CommonUtils::trim(text);
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    int year = 0;
    int month = 0;
    int day = 0;
    if (!parseFixedInt(s, 0, 4, year) || !parseFixedInt(s, 5, 2, month) || !parseFixedInt(s, 8, 2, day)) {
        return std::nullopt;
    }
    return makeDate(year, month, day);
}

} // namespace DateParser
