#include "DrawConsolidator.h"
#include "CommonUtils.h"
#include "LottoLensExceptions.h"

#include <algorithm>
#include <iterator>

void DrawConsolidator::add(const std::vector<Draw>& draws) {
    for (const auto& draw : draws) {
        const auto it = indexByContest_.find(draw.contestId);
        if (it != indexByContest_.end()) {
            draws_[it->second] = draw;
            continue;
        }
        indexByContest_.emplace(draw.contestId, draws_.size());
        draws_.push_back(draw);
    }
}

DrawHistory DrawConsolidator::finish(const LotteryProfile& profile) const {
    if (draws_.empty()) {
        throw LottoLens::NoValidDrawsError(
            "No valid draws found in the provided files. Check that the files contain rows with a valid date and " +
            std::to_string(profile.drawSize) + " distinct numbers between 1 and " + std::to_string(profile.totalNumbers) + ".");
    }

    DrawHistory history = draws_;
    std::stable_sort(history.begin(), history.end(), [](const Draw& a, const Draw& b) {
        return a.date > b.date;
    });
    return history;
}

DrawHistory DrawConsolidator::consolidate(const std::vector<std::vector<Draw>>& perFile, const LotteryProfile& profile) {
    DrawConsolidator consolidator;
    for (const auto& draws : perFile) consolidator.add(draws);
    return consolidator.finish(profile);
}

DrawHistory DrawConsolidator::filterByDateRange(const DrawHistory& history,
                                                const std::optional<DrawDate>& from,
                                                const std::optional<DrawDate>& to) {
    DrawHistory out;
    out.reserve(history.size());
    std::copy_if(history.begin(), history.end(), std::back_inserter(out), [&](const Draw& draw) {
        if (from && draw.date < *from) return false;
        if (to && draw.date > *to) return false;
        return true;
    });
    return out;
}

std::vector<Draw> DrawConsolidator::search(const std::vector<Draw>& draws, const std::string& term) {
    const std::string needle = CommonUtils::toLower(CommonUtils::trim(term));
    if (needle.empty()) return draws;

    std::vector<Draw> out;
    for (const auto& draw : draws) {
        if (CommonUtils::toLower(draw.contestId).find(needle) != std::string::npos ||
            draw.date.toDisplayString().find(needle) != std::string::npos) {
            out.push_back(draw);
        }
    }
    return out;
}
