#pragma once

#include "DrawTypes.h"
#include "LotteryProfile.h"

#include <cstddef>
#include <string>
#include <vector>

struct NumberFrequency {
    int number = 0;
    size_t count = 0;
};

struct PairFrequency {
    int first = 0;
    int second = 0;
    size_t count = 0;
};

struct ParityBucket {
    int evenCount = 0;
    int oddCount = 0;
    size_t count = 0;

    std::string label() const;
};

struct IntervalStats {
    int number = 0;
    size_t currentDelay = 0;
    double averageInterval = 0.0;
    size_t maxDelay = 0;
};

struct RepeatedDraw {
    std::vector<int> numbers;
    std::vector<std::string> contestIds;
};

struct StatisticsBundle {
    size_t totalDraws = 0;
    // Count descending, ties by number ascending; one entry per number of the range.
    std::vector<NumberFrequency> frequencies;
    std::vector<PairFrequency> topPairs;
    std::vector<ParityBucket> parity;
    // Indexed by number - 1.
    std::vector<IntervalStats> intervals;
    std::vector<RepeatedDraw> repeatedDraws;
    std::vector<Draw> lastDraws;
    // Indexed by number - 1; contest ids newest first.
    std::vector<std::vector<std::string>> drawsByNumber;

    const IntervalStats& intervalFor(int number) const { return intervals.at(static_cast<size_t>(number - 1)); }
    const std::vector<std::string>& contestsFor(int number) const { return drawsByNumber.at(static_cast<size_t>(number - 1)); }
};

class StatisticsAggregator {
public:
    static constexpr size_t kTopPairs = 10;
    static constexpr size_t kLastDraws = 10;

    /**
     * @brief Computes the full statistics bundle for a newest-first history.
     * @details Accepts any DrawHistory, including a date-filtered or empty one. Numbers outside
     *          [1, totalNumbers] are not counted.
     */
    static StatisticsBundle aggregate(const DrawHistory& history, const LotteryProfile& profile);

    static std::vector<NumberFrequency> frequencies(const DrawHistory& history, const LotteryProfile& profile);
    static std::vector<PairFrequency> topPairs(const DrawHistory& history,
                                               const LotteryProfile& profile,
                                               size_t limit = kTopPairs);
    static std::vector<ParityBucket> parityDistribution(const DrawHistory& history);
    static std::vector<IntervalStats> intervals(const DrawHistory& history, const LotteryProfile& profile);
    static std::vector<RepeatedDraw> repeatedDraws(const DrawHistory& history);
    static std::vector<std::vector<std::string>> drawsByNumber(const DrawHistory& history, const LotteryProfile& profile);
};
