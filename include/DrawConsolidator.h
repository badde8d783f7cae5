#pragma once

#include "DrawTypes.h"
#include "LotteryProfile.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class DrawConsolidator {
public:
    /**
     * @brief Merges one file's draws. A contest already present is overwritten in place.
     */
    void add(const std::vector<Draw>& draws);

    size_t size() const noexcept { return draws_.size(); }

    /**
     * @brief Returns the merged draws ordered newest to oldest.
     * @details Draws sharing a date keep their first-merge order.
     * @throws LottoLens::NoValidDrawsError when nothing was merged.
     */
    DrawHistory finish(const LotteryProfile& profile) const;

    // Merges per-file draw lists in the given order.
    static DrawHistory consolidate(const std::vector<std::vector<Draw>>& perFile, const LotteryProfile& profile);

    // Inclusive bounds; a missing bound is open. Order is preserved.
    static DrawHistory filterByDateRange(const DrawHistory& history,
                                         const std::optional<DrawDate>& from,
                                         const std::optional<DrawDate>& to);

    // Case-insensitive substring match on the contest id or the dd/mm/yyyy date.
    static std::vector<Draw> search(const std::vector<Draw>& draws, const std::string& term);

private:
    std::vector<Draw> draws_;
    std::unordered_map<std::string, size_t> indexByContest_;
};
