#include "HeaderLocator.h"
#include "CommonUtils.h"
#include "LottoLensExceptions.h"

#include <algorithm>
#include <regex>

namespace {
struct RowLabels {
    std::optional<size_t> contest;
    std::optional<size_t> date;
    std::vector<size_t> numberSlots;
};

RowLabels classifyRow(const RawRow& row) {
    RowLabels labels;
    for (size_t c = 0; c < row.size(); ++c) {
        const std::string text = CommonUtils::toLower(cellToString(row[c]));
        if (text.empty()) continue;
        if (!labels.contest && HeaderLocator::isContestLabel(text)) labels.contest = c;
        if (!labels.date && HeaderLocator::isDateLabel(text)) labels.date = c;
        if (HeaderLocator::isNumberSlotLabel(text)) labels.numberSlots.push_back(c);
    }
    return labels;
}

size_t scanLimit(const RawGrid& grid) {
    return std::min(grid.size(), HeaderLocator::kMaxScanRows);
}

size_t countInRangeNumbers(const RawRow& row, const LotteryProfile& profile) {
    size_t count = 0;
    for (const auto& cell : row) {
        if (cellToIntegerIn(cell, 1, profile.totalNumbers)) ++count;
    }
    return count;
}

using Strategy = std::optional<ColumnLayout> (*)(const RawGrid&, const LotteryProfile&);

const Strategy kStrategies[] = {
    &HeaderLocator::matchStrict,
    &HeaderLocator::matchLoose,
};
} // namespace

std::string HeaderNotFound::describe(const LotteryProfile& profile) const {
    std::vector<std::string> missing;
    if (!contestSeen) missing.emplace_back("contest");
    if (!dateSeen) missing.emplace_back("date");

    const size_t need = static_cast<size_t>(profile.drawSize);
    std::string message;
    if (!missing.empty()) {
        message = "missing required columns: ";
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) message += ", ";
            message += missing[i];
        }
        if (mostNumberSlots < need) {
            message += "; number slots found " + std::to_string(mostNumberSlots) + " of " + std::to_string(need);
        }
        return message;
    }
    return "contest and date columns found, but neither " + std::to_string(need) +
           " number-slot columns nor a following row with " + std::to_string(need) +
           " numbers in [1, " + std::to_string(profile.totalNumbers) + "] (number slots found " +
           std::to_string(mostNumberSlots) + ")";
}

bool HeaderLocator::isContestLabel(const std::string& label) {
    const std::string t = CommonUtils::toLower(label);
    return t.find("concurso") != std::string::npos || t.find("contest") != std::string::npos;
}

bool HeaderLocator::isDateLabel(const std::string& label) {
    const std::string t = CommonUtils::toLower(label);
    return t.find("data") != std::string::npos || t.find("date") != std::string::npos;
}

bool HeaderLocator::isNumberSlotLabel(const std::string& label) {
    static const std::regex kSlot(R"((bola|dezena|ball|number|d)\s*_?\d+)", std::regex::icase);
    return std::regex_search(label, kSlot);
}

std::optional<ColumnLayout> HeaderLocator::matchStrict(const RawGrid& grid, const LotteryProfile& profile) {
    const size_t need = static_cast<size_t>(profile.drawSize);
    for (size_t r = 0; r < scanLimit(grid); ++r) {
        RowLabels labels = classifyRow(grid[r]);
        if (!labels.contest || !labels.date || labels.numberSlots.size() < need) continue;

        ColumnLayout layout;
        layout.headerRow = r;
        layout.contestColumn = *labels.contest;
        layout.dateColumn = *labels.date;
        layout.numberColumns.assign(labels.numberSlots.begin(), labels.numberSlots.begin() + static_cast<long>(need));
        return layout;
    }
    return std::nullopt;
}

std::optional<ColumnLayout> HeaderLocator::matchLoose(const RawGrid& grid, const LotteryProfile& profile) {
    const size_t need = static_cast<size_t>(profile.drawSize);
    for (size_t r = 0; r < scanLimit(grid); ++r) {
        RowLabels labels = classifyRow(grid[r]);
        if (!labels.contest || !labels.date) continue;
        if (r + 1 >= grid.size()) continue;
        if (countInRangeNumbers(grid[r + 1], profile) < need) continue;

        ColumnLayout layout;
        layout.headerRow = r;
        layout.contestColumn = *labels.contest;
        layout.dateColumn = *labels.date;
        return layout;
    }
    return std::nullopt;
}

HeaderMatch HeaderLocator::locate(const RawGrid& grid, const LotteryProfile& profile) {
    for (Strategy strategy : kStrategies) {
        if (auto layout = strategy(grid, profile)) return *layout;
    }

    HeaderNotFound notFound;
    for (size_t r = 0; r < scanLimit(grid); ++r) {
        const RowLabels labels = classifyRow(grid[r]);
        notFound.contestSeen = notFound.contestSeen || labels.contest.has_value();
        notFound.dateSeen = notFound.dateSeen || labels.date.has_value();
        notFound.mostNumberSlots = std::max(notFound.mostNumberSlots, labels.numberSlots.size());
    }
    return notFound;
}

ColumnLayout HeaderLocator::require(const RawGrid& grid, const LotteryProfile& profile) {
    HeaderMatch match = locate(grid, profile);
    if (const auto* notFound = std::get_if<HeaderNotFound>(&match)) {
        throw LottoLens::HeaderNotFoundError(notFound->describe(profile));
    }
    return std::get<ColumnLayout>(std::move(match));
}
