#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level tokenization for delimited-text draw exports.
// Cells come back as trimmed text; typing happens in TableReader.
struct ParseLimits {
	size_t maxFieldBytes = 1024 * 1024;
	size_t maxColumns = 4096;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one record. Quoted fields may contain the delimiter, doubled quotes and newlines.
 * @param malformed set when the record ends inside an open quote.
 * @param limitExceeded set when a field or the column count passes the limits.
 * @return empty vector for a blank line or at end of stream.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  bool* limitExceeded = nullptr,
									  const ParseLimits& limits = ParseLimits{});

/**
 * @brief Picks ',' ';' or '\t' by counting occurrences outside quotes; ',' on ties or no hits.
 */
char detectDelimiter(const std::string& sample);
}
