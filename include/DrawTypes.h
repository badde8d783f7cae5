#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// One cell of an untrusted source table: blank, native number, or text.
using Cell = std::variant<std::monostate, double, std::string>;
using RawRow = std::vector<Cell>;
using RawGrid = std::vector<RawRow>;

std::string cellToString(const Cell& cell);

/**
 * @brief Numeric view of a cell.
 * @details Native numbers pass through; text must be a complete decimal literal
 *          (surrounding whitespace allowed). Blank cells and partial matches yield nullopt.
 */
std::optional<double> cellToNumber(const Cell& cell);

// Integral numeric view of a cell restricted to [lo, hi].
std::optional<int> cellToIntegerIn(const Cell& cell, int lo, int hi);

struct DrawDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    int64_t toDays() const;
    std::string toDisplayString() const;  // dd/mm/yyyy
    std::string toIsoString() const;      // yyyy-mm-dd
};

bool operator==(const DrawDate& a, const DrawDate& b);
bool operator!=(const DrawDate& a, const DrawDate& b);
bool operator<(const DrawDate& a, const DrawDate& b);
bool operator<=(const DrawDate& a, const DrawDate& b);
bool operator>(const DrawDate& a, const DrawDate& b);
bool operator>=(const DrawDate& a, const DrawDate& b);

struct Draw {
    std::string contestId;
    std::vector<int> numbers;  // unique, ascending
    DrawDate date;
};

// Consolidated draws, newest first.
using DrawHistory = std::vector<Draw>;
