#include "SuggestionGenerator.h"
#include "LottoLensExceptions.h"

#include <algorithm>
#include <unordered_set>

namespace {
std::vector<NumberFrequency> rankByFrequency(const std::vector<NumberFrequency>& frequencies) {
    std::vector<NumberFrequency> ranked = frequencies;
    std::sort(ranked.begin(), ranked.end(), [](const NumberFrequency& a, const NumberFrequency& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.number < b.number;
    });
    return ranked;
}

std::vector<int> rangeExcluding(const LotteryProfile& profile, const std::unordered_set<int>& excluded) {
    std::vector<int> out;
    for (int n = 1; n <= profile.totalNumbers; ++n) {
        if (excluded.count(n) == 0) out.push_back(n);
    }
    return out;
}

// Completes or trims `chosen` to exactly `target` numbers and sorts it.
std::vector<int> settleToSize(std::vector<int> chosen,
                              size_t target,
                              const LotteryProfile& profile,
                              std::mt19937& rng) {
    std::unordered_set<int> seen;
    std::vector<int> unique;
    for (int n : chosen) {
        if (seen.insert(n).second) unique.push_back(n);
    }

    if (unique.size() < target) {
        const auto filler = SuggestionGenerator::pickRandom(rangeExcluding(profile, seen), target - unique.size(), rng);
        unique.insert(unique.end(), filler.begin(), filler.end());
    } else if (unique.size() > target) {
        unique = SuggestionGenerator::pickRandom(unique, target, rng);
    }

    std::sort(unique.begin(), unique.end());
    return unique;
}

void requirePicks(const std::vector<int>& picks,
                  const std::vector<int>& pool,
                  const char* side) {
    if (picks.size() != SuggestionGenerator::kCustomPicksPerSide) {
        throw LottoLens::ConfigurationException(std::string("custom game needs exactly ") +
                                                std::to_string(SuggestionGenerator::kCustomPicksPerSide) + " " + side + " numbers");
    }
    for (int n : picks) {
        if (std::find(pool.begin(), pool.end(), n) == pool.end()) {
            throw LottoLens::ConfigurationException(std::to_string(n) + " is not one of the " + side + " numbers");
        }
    }
}
} // namespace

std::vector<int> SuggestionGenerator::pickRandom(const std::vector<int>& pool, size_t count, std::mt19937& rng) {
    std::vector<int> shuffled = pool;
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    if (shuffled.size() > count) shuffled.resize(count);
    std::sort(shuffled.begin(), shuffled.end());
    return shuffled;
}

std::vector<int> SuggestionGenerator::hotPool(const std::vector<NumberFrequency>& frequencies, const LotteryProfile& profile) {
    const auto ranked = rankByFrequency(frequencies);
    const size_t take = std::min(ranked.size(), static_cast<size_t>(std::max(profile.hotCount, 0)));
    std::vector<int> pool;
    pool.reserve(take);
    for (size_t i = 0; i < take; ++i) pool.push_back(ranked[i].number);
    return pool;
}

std::vector<int> SuggestionGenerator::coldPool(const std::vector<NumberFrequency>& frequencies, const LotteryProfile& profile) {
    const auto ranked = rankByFrequency(frequencies);
    const size_t take = std::min(ranked.size(), static_cast<size_t>(std::max(profile.coldCount, 0)));
    std::vector<int> pool;
    pool.reserve(take);
    for (size_t i = ranked.size() - take; i < ranked.size(); ++i) pool.push_back(ranked[i].number);
    return pool;
}

Suggestions SuggestionGenerator::generate(const std::vector<NumberFrequency>& frequencies,
                                          const LotteryProfile& profile,
                                          std::mt19937& rng) {
    const auto hot = hotPool(frequencies, profile);
    const auto cold = coldPool(frequencies, profile);
    const size_t betSize = static_cast<size_t>(profile.betSize);

    Suggestions out;
    out.hot = settleToSize(pickRandom(hot, betSize, rng), betSize, profile, rng);
    out.cold = settleToSize(pickRandom(cold, betSize, rng), betSize, profile, rng);

    const size_t hotHalf = (betSize + 1) / 2;
    const size_t coldHalf = betSize - hotHalf;
    std::vector<int> mixed = pickRandom(hot, hotHalf, rng);
    const auto mixedCold = pickRandom(cold, coldHalf, rng);
    mixed.insert(mixed.end(), mixedCold.begin(), mixedCold.end());
    out.mixed = settleToSize(std::move(mixed), betSize, profile, rng);
    return out;
}

std::vector<int> SuggestionGenerator::custom(const std::vector<NumberFrequency>& frequencies,
                                             const LotteryProfile& profile,
                                             const std::vector<int>& hotPicks,
                                             const std::vector<int>& coldPicks,
                                             std::mt19937& rng) {
    const auto hot = hotPool(frequencies, profile);
    const auto cold = coldPool(frequencies, profile);
    requirePicks(hotPicks, hot, "hot");
    requirePicks(coldPicks, cold, "cold");

    std::vector<int> base = hotPicks;
    base.insert(base.end(), coldPicks.begin(), coldPicks.end());
    std::unordered_set<int> chosen(base.begin(), base.end());
    if (chosen.size() != base.size()) {
        throw LottoLens::ConfigurationException("custom game numbers must be distinct");
    }
    const size_t betSize = static_cast<size_t>(profile.betSize);
    if (base.size() > betSize) {
        throw LottoLens::ConfigurationException("custom game picks exceed bet size " + std::to_string(betSize));
    }

    std::unordered_set<int> extremes(hot.begin(), hot.end());
    extremes.insert(cold.begin(), cold.end());
    extremes.insert(base.begin(), base.end());
    const auto filler = pickRandom(rangeExcluding(profile, extremes), betSize - base.size(), rng);
    base.insert(base.end(), filler.begin(), filler.end());

    // Neutral pool exhausted: settleToSize draws the rest from the whole range.
    return settleToSize(std::move(base), betSize, profile, rng);
}
