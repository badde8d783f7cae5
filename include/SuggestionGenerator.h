#pragma once

#include "LotteryProfile.h"
#include "StatisticsAggregator.h"

#include <random>
#include <vector>

struct Suggestions {
    std::vector<int> hot;
    std::vector<int> cold;
    std::vector<int> mixed;
};

/**
 * Builds tickets from a frequency table. Holds no state between calls: every call draws
 * fresh picks from the generator it is given, so a seeded generator reproduces its output.
 */
class SuggestionGenerator {
public:
    static constexpr size_t kCustomPicksPerSide = 2;

    /**
     * @brief hot, cold and mixed tickets of exactly betSize ascending unique numbers.
     * @details When a pool is smaller than the share asked of it, the ticket is completed with
     *          numbers picked uniformly from the rest of the range.
     */
    static Suggestions generate(const std::vector<NumberFrequency>& frequencies,
                                const LotteryProfile& profile,
                                std::mt19937& rng);

    /**
     * @brief Two chosen hot and two chosen cold numbers completed from the neutral pool
     *        (neither hot nor cold), then from the rest of the range if that runs out.
     * @throws LottoLens::ConfigurationException when the picks are not 2+2 distinct numbers of the
     *         respective pools, or do not fit in betSize.
     */
    static std::vector<int> custom(const std::vector<NumberFrequency>& frequencies,
                                   const LotteryProfile& profile,
                                   const std::vector<int>& hotPicks,
                                   const std::vector<int>& coldPicks,
                                   std::mt19937& rng);

    static std::vector<int> hotPool(const std::vector<NumberFrequency>& frequencies, const LotteryProfile& profile);
    static std::vector<int> coldPool(const std::vector<NumberFrequency>& frequencies, const LotteryProfile& profile);

    // Uniform sample without replacement, returned ascending. Takes the whole pool when count exceeds it.
    static std::vector<int> pickRandom(const std::vector<int>& pool, size_t count, std::mt19937& rng);
};
