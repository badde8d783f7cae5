#pragma once

#include "DrawTypes.h"
#include "HeaderLocator.h"
#include "LotteryProfile.h"

#include <cstddef>
#include <optional>
#include <vector>

enum class RowRejection { NONE, MISSING_CONTEST, INVALID_DATE, WRONG_DRAW_SIZE };

struct ExtractionStats {
    size_t rowsScanned = 0;
    size_t accepted = 0;
    size_t missingContest = 0;
    size_t invalidDate = 0;
    size_t wrongDrawSize = 0;
};

class DrawExtractor {
public:
    /**
     * @brief Turns every row below the header into a Draw, dropping rows that fail validation.
     * @details Rows are never repaired: a row whose deduplicated in-range numbers do not
     *          count exactly drawSize is discarded, not truncated or padded.
     */
    static std::vector<Draw> extract(const RawGrid& grid,
                                     const ColumnLayout& layout,
                                     const LotteryProfile& profile,
                                     ExtractionStats* stats = nullptr);

    static std::optional<Draw> extractRow(const RawRow& row,
                                          const ColumnLayout& layout,
                                          const LotteryProfile& profile,
                                          RowRejection* rejection = nullptr);
};
