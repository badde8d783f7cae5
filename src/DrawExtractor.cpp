#include "DrawExtractor.h"
#include "CommonUtils.h"
#include "DateParser.h"

#include <set>

namespace {
const Cell kBlank{};

const Cell& cellAt(const RawRow& row, size_t column) {
    return column < row.size() ? row[column] : kBlank;
}

void reject(RowRejection* out, RowRejection reason) {
    if (out) *out = reason;
}
} // namespace

std::optional<Draw> DrawExtractor::extractRow(const RawRow& row,
                                              const ColumnLayout& layout,
                                              const LotteryProfile& profile,
                                              RowRejection* rejection) {
    reject(rejection, RowRejection::NONE);

    std::string contest = CommonUtils::trim(cellToString(cellAt(row, layout.contestColumn)));
    if (contest.empty()) {
        reject(rejection, RowRejection::MISSING_CONTEST);
        return std::nullopt;
    }

    const auto date = DateParser::parse(cellAt(row, layout.dateColumn));
    if (!date) {
        reject(rejection, RowRejection::INVALID_DATE);
        return std::nullopt;
    }

    // A source listing the same ball twice must count it once.
    std::set<int> numbers;
    auto collect = [&](const Cell& cell) {
        if (auto n = cellToIntegerIn(cell, 1, profile.totalNumbers)) numbers.insert(*n);
    };
    if (layout.scansWholeRow()) {
        for (const auto& cell : row) collect(cell);
    } else {
        for (size_t column : layout.numberColumns) collect(cellAt(row, column));
    }

    if (numbers.size() != static_cast<size_t>(profile.drawSize)) {
        reject(rejection, RowRejection::WRONG_DRAW_SIZE);
        return std::nullopt;
    }

    Draw draw;
    draw.contestId = std::move(contest);
    draw.numbers.assign(numbers.begin(), numbers.end());
    draw.date = *date;
    return draw;
}

std::vector<Draw> DrawExtractor::extract(const RawGrid& grid,
                                         const ColumnLayout& layout,
                                         const LotteryProfile& profile,
                                         ExtractionStats* stats) {
    std::vector<Draw> draws;
    ExtractionStats local;
    for (size_t r = layout.headerRow + 1; r < grid.size(); ++r) {
        ++local.rowsScanned;
        RowRejection reason = RowRejection::NONE;
        auto draw = extractRow(grid[r], layout, profile, &reason);
        switch (reason) {
            case RowRejection::MISSING_CONTEST: ++local.missingContest; break;
            case RowRejection::INVALID_DATE: ++local.invalidDate; break;
            case RowRejection::WRONG_DRAW_SIZE: ++local.wrongDrawSize; break;
            case RowRejection::NONE: break;
        }
        if (!draw) continue;
        ++local.accepted;
        draws.push_back(std::move(*draw));
    }
    if (stats) *stats = local;
    return draws;
}
