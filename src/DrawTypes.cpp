#include "DrawTypes.h"
#include "CommonUtils.h"
#include "DateParser.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <tuple>

std::string cellToString(const Cell& cell) {
    if (std::holds_alternative<std::string>(cell)) return std::get<std::string>(cell);
    if (std::holds_alternative<double>(cell)) {
        const double v = std::get<double>(cell);
        if (std::isfinite(v) && std::floor(v) == v && std::abs(v) < 1e15) {
            return std::to_string(static_cast<long long>(v));
        }
        std::string out = std::to_string(v);
        const size_t dot = out.find('.');
        if (dot != std::string::npos) {
            size_t last = out.find_last_not_of('0');
            if (last == dot) --last;
            out.erase(last + 1);
        }
        return out;
    }
    return "";
}

std::optional<double> cellToNumber(const Cell& cell) {
    if (std::holds_alternative<double>(cell)) {
        const double v = std::get<double>(cell);
        if (!std::isfinite(v)) return std::nullopt;
        return v;
    }
    if (!std::holds_alternative<std::string>(cell)) return std::nullopt;

    std::string s = CommonUtils::trim(std::get<std::string>(cell));
    if (!s.empty() && s.front() == '+') s.erase(s.begin());
    if (s.empty()) return std::nullopt;

    double out = 0.0;
    const char* b = s.data();
    const char* e = b + s.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(out)) return std::nullopt;
    return out;
}

std::optional<int> cellToIntegerIn(const Cell& cell, int lo, int hi) {
    const auto value = cellToNumber(cell);
    if (!value || std::floor(*value) != *value) return std::nullopt;
    if (*value < static_cast<double>(lo) || *value > static_cast<double>(hi)) return std::nullopt;
    return static_cast<int>(*value);
}

int64_t DrawDate::toDays() const {
    return DateParser::daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string DrawDate::toDisplayString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", day, month, year);
    return buf;
}

std::string DrawDate::toIsoString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool operator==(const DrawDate& a, const DrawDate& b) {
    return std::tie(a.year, a.month, a.day) == std::tie(b.year, b.month, b.day);
}
bool operator!=(const DrawDate& a, const DrawDate& b) { return !(a == b); }
bool operator<(const DrawDate& a, const DrawDate& b) {
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}
bool operator<=(const DrawDate& a, const DrawDate& b) { return !(b < a); }
bool operator>(const DrawDate& a, const DrawDate& b) { return b < a; }
bool operator>=(const DrawDate& a, const DrawDate& b) { return !(a < b); }
