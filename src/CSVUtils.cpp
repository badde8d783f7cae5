#include "CSVUtils.h"

#include <array>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;

    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) {
        return;
    }

    is.get();
    const int second = is.peek();
    if (second == EOF || static_cast<unsigned char>(second) != 0xBB) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        return;
    }

    is.get();
    const int third = is.peek();
    if (third == EOF || static_cast<unsigned char>(third) != 0xBF) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        is.unget();
        return;
    }

    is.get();
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      bool* limitExceeded,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (limitExceeded) *limitExceeded = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool currentFieldQuoted = false;
    bool hasRecordData = false;
    bool exceeded = false;
    char c;

    auto pushField = [&]() {
        // Text after a closing quote is kept, the quotes themselves are not.
        row.push_back(trimUnquotedField(val));
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) exceeded = true;
    };

    auto append = [&](char ch) {
        val += ch;
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) exceeded = true;
    };

    while (!exceeded && is.get(c)) {
        if (c == '"') {
            hasRecordData = true;
            if (!inQuotes && CSVUtils::trimUnquotedField(val).empty()) {
                val.clear();
                inQuotes = true;
                currentFieldQuoted = true;
            } else if (inQuotes) {
                if (is.peek() == '"') {
                    is.get();
                    append('"');
                } else {
                    inQuotes = false;
                }
            }
            // A stray quote inside an unquoted field is dropped.
        } else if (c == delimiter && !inQuotes) {
            pushField();
            val.clear();
            currentFieldQuoted = false;
            hasRecordData = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (inQuotes) {
                append('\n');
            } else {
                break;
            }
        } else {
            append(c);
            hasRecordData = true;
        }
    }

    if (exceeded) {
        if (limitExceeded) *limitExceeded = true;
        return {};
    }

    if (inQuotes && malformed) {
        *malformed = true;
    }

    if (hasRecordData || !val.empty() || currentFieldQuoted) {
        pushField();
    }

    if (row.size() == 1 && row[0].empty() && !currentFieldQuoted) {
        return {};
    }

    return row;
}

char detectDelimiter(const std::string& sample) {
    static const std::array<char, 3> kCandidates = {',', ';', '\t'};
    std::array<size_t, 3> counts{0, 0, 0};

    bool inQuotes = false;
    for (char c : sample) {
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (inQuotes) continue;
        for (size_t i = 0; i < kCandidates.size(); ++i) {
            if (c == kCandidates[i]) ++counts[i];
        }
    }

    size_t best = 0;
    for (size_t i = 1; i < kCandidates.size(); ++i) {
        if (counts[i] > counts[best]) best = i;
    }
    return kCandidates[best];
}
} // namespace CSVUtils
