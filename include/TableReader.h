#pragma once

#include "DrawTypes.h"

#include <istream>
#include <string>

enum class ContainerKind { AUTO, DELIMITED_TEXT, SPREADSHEET };

struct TableReadOptions {
    ContainerKind kind = ContainerKind::AUTO;
    // 0 sniffs ',', ';' or '\t' from the first ten non-empty lines.
    char delimiter = 0;
};

class TableReader {
public:
    /**
     * @brief Reads a draw export from disk into a RawGrid.
     * @details .xlsx/.xls go through xlsx2csv/xls2csv (first sheet), .gz/.zip through gzip/unzip;
     *          everything else is read as delimited text.
     * @throws LottoLens::MalformedFileError when the file cannot be opened, converted or tokenized.
     */
    static RawGrid readFile(const std::string& path, const TableReadOptions& options = TableReadOptions{});

    /**
     * @brief Tokenizes delimited text.
     * @param nativeNumbers true for converted spreadsheets: every numeric cell becomes a number.
     *        false for plain text: cells holding '/', '-' or '.' stay text so dates survive.
     * @throws LottoLens::MalformedFileError naming sourceName on unterminated quotes, binary content
     *         or oversized records.
     */
    static RawGrid parseDelimited(std::istream& in,
                                  const std::string& sourceName,
                                  char delimiter = 0,
                                  bool nativeNumbers = false);

    static ContainerKind inferKind(const std::string& path);
};
