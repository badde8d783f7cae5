#pragma once

#include "DrawTypes.h"

#include <cstdint>
#include <optional>
#include <string>

namespace DateParser {

bool isLeapYear(int year);
int daysInMonth(int year, int month);
int64_t daysFromCivil(int y, unsigned m, unsigned d);

/**
 * @brief Builds a calendar date, rejecting impossible day/month/year combinations.
 */
std::optional<DrawDate> makeDate(int year, int month, int day);

/**
 * @brief Extracts the first day[sep]month[sep]year pattern (sep is '/', '-' or '.').
 * @details Day and month take 1-2 digits, the year 2 or 4. Years below 100 map to
 *          1900+year when above 50 and to 2000+year otherwise.
 * @return nullopt when the pattern is absent or names an impossible date.
 */
std::optional<DrawDate> parse(const std::string& text);
std::optional<DrawDate> parse(const Cell& cell);

// yyyy-mm-dd, used for command-line date bounds.
std::optional<DrawDate> parseIso(const std::string& text);

} // namespace DateParser
