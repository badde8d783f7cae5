#pragma once

#include "DrawTypes.h"
#include "LotteryProfile.h"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct ColumnLayout {
    size_t headerRow = 0;
    size_t contestColumn = 0;
    size_t dateColumn = 0;
    // Empty when the layout came from the loose strategy: draw numbers are then
    // collected from every cell of a data row.
    std::vector<size_t> numberColumns;

    bool scansWholeRow() const noexcept { return numberColumns.empty(); }
};

// What the scan did see, so the failure can name the missing columns.
struct HeaderNotFound {
    bool contestSeen = false;
    bool dateSeen = false;
    size_t mostNumberSlots = 0;

    std::string describe(const LotteryProfile& profile) const;
};

using HeaderMatch = std::variant<ColumnLayout, HeaderNotFound>;

class HeaderLocator {
public:
    static constexpr size_t kMaxScanRows = 10;

    /**
     * @brief Tries the strict then the loose strategy over the first kMaxScanRows rows.
     */
    static HeaderMatch locate(const RawGrid& grid, const LotteryProfile& profile);

    /**
     * @brief locate() that turns HeaderNotFound into an exception.
     * @throws LottoLens::HeaderNotFoundError listing the missing required columns.
     */
    static ColumnLayout require(const RawGrid& grid, const LotteryProfile& profile);

    // Strict: contest, date and at least drawSize number-slot labels in one row.
    static std::optional<ColumnLayout> matchStrict(const RawGrid& grid, const LotteryProfile& profile);
    // Loose: contest and date labels, and the next row holds drawSize in-range numbers.
    static std::optional<ColumnLayout> matchLoose(const RawGrid& grid, const LotteryProfile& profile);

    static bool isContestLabel(const std::string& label);
    static bool isDateLabel(const std::string& label);
    static bool isNumberSlotLabel(const std::string& label);
};
