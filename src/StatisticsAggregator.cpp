#include "StatisticsAggregator.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <utility>

namespace {
// Per-number running state for the chronological interval pass.
struct NumberTrack {
    int64_t lastSeen = -1;
    size_t gapCount = 0;
    size_t gapSum = 0;
    size_t maxGap = 0;
};

size_t arenaSize(const LotteryProfile& profile) {
    return static_cast<size_t>(std::max(profile.totalNumbers, 0)) + 1;
}
} // namespace

std::string ParityBucket::label() const {
    return std::to_string(evenCount) + " even / " + std::to_string(oddCount) + " odd";
}

std::vector<NumberFrequency> StatisticsAggregator::frequencies(const DrawHistory& history, const LotteryProfile& profile) {
    std::vector<size_t> counts(arenaSize(profile), 0);
    for (const auto& draw : history) {
        for (int n : draw.numbers) {
            if (profile.inRange(n)) ++counts[static_cast<size_t>(n)];
        }
    }

    std::vector<NumberFrequency> out;
    out.reserve(counts.size() - 1);
    for (int n = 1; n <= profile.totalNumbers; ++n) {
        out.push_back({n, counts[static_cast<size_t>(n)]});
    }
    std::sort(out.begin(), out.end(), [](const NumberFrequency& a, const NumberFrequency& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.number < b.number;
    });
    return out;
}

std::vector<PairFrequency> StatisticsAggregator::topPairs(const DrawHistory& history,
                                                          const LotteryProfile& profile,
                                                          size_t limit) {
    // Keyed sparsely on lo * stride + hi; only pairs that occur take memory.
    const auto stride = static_cast<uint64_t>(arenaSize(profile));
    std::unordered_map<uint64_t, size_t> counts;
    std::vector<std::pair<int, int>> encounterOrder;

    for (const auto& draw : history) {
        const auto& nums = draw.numbers;
        for (size_t i = 0; i < nums.size(); ++i) {
            if (!profile.inRange(nums[i])) continue;
            for (size_t j = i + 1; j < nums.size(); ++j) {
                if (!profile.inRange(nums[j]) || nums[i] == nums[j]) continue;
                const int lo = std::min(nums[i], nums[j]);
                const int hi = std::max(nums[i], nums[j]);
                size_t& slot = counts[static_cast<uint64_t>(lo) * stride + static_cast<uint64_t>(hi)];
                if (slot == 0) encounterOrder.emplace_back(lo, hi);
                ++slot;
            }
        }
    }

    std::vector<PairFrequency> out;
    out.reserve(encounterOrder.size());
    for (const auto& [lo, hi] : encounterOrder) {
        out.push_back({lo, hi, counts.at(static_cast<uint64_t>(lo) * stride + static_cast<uint64_t>(hi))});
    }
    std::stable_sort(out.begin(), out.end(), [](const PairFrequency& a, const PairFrequency& b) {
        return a.count > b.count;
    });
    if (out.size() > limit) out.resize(limit);
    return out;
}

std::vector<ParityBucket> StatisticsAggregator::parityDistribution(const DrawHistory& history) {
    std::vector<ParityBucket> buckets;
    std::map<std::pair<int, int>, size_t> indexByKey;

    for (const auto& draw : history) {
        const int evens = static_cast<int>(std::count_if(draw.numbers.begin(), draw.numbers.end(), [](int n) {
            return n % 2 == 0;
        }));
        const int odds = static_cast<int>(draw.numbers.size()) - evens;
        const auto key = std::make_pair(evens, odds);
        const auto it = indexByKey.find(key);
        if (it == indexByKey.end()) {
            indexByKey.emplace(key, buckets.size());
            buckets.push_back({evens, odds, 1});
        } else {
            ++buckets[it->second].count;
        }
    }

    std::stable_sort(buckets.begin(), buckets.end(), [](const ParityBucket& a, const ParityBucket& b) {
        return a.count > b.count;
    });
    return buckets;
}

std::vector<IntervalStats> StatisticsAggregator::intervals(const DrawHistory& history, const LotteryProfile& profile) {
    std::vector<NumberTrack> tracks(arenaSize(profile));
    const size_t length = history.size();

    // Oldest to newest; i is the chronological index.
    for (size_t i = 0; i < length; ++i) {
        const Draw& draw = history[length - 1 - i];
        for (int n : draw.numbers) {
            if (!profile.inRange(n)) continue;
            NumberTrack& track = tracks[static_cast<size_t>(n)];
            const auto idx = static_cast<int64_t>(i);
            if (track.lastSeen == idx) continue;
            if (track.lastSeen >= 0) {
                const auto gap = static_cast<size_t>(idx - track.lastSeen);
                track.gapSum += gap;
                ++track.gapCount;
                track.maxGap = std::max(track.maxGap, gap);
            }
            track.lastSeen = idx;
        }
    }

    std::vector<IntervalStats> out;
    out.reserve(tracks.size() - 1);
    for (int n = 1; n <= profile.totalNumbers; ++n) {
        const NumberTrack& track = tracks[static_cast<size_t>(n)];
        IntervalStats stats;
        stats.number = n;
        stats.averageInterval = track.gapCount > 0
            ? static_cast<double>(track.gapSum) / static_cast<double>(track.gapCount)
            : 0.0;
        stats.maxDelay = track.maxGap;
        stats.currentDelay = track.lastSeen >= 0
            ? length - 1 - static_cast<size_t>(track.lastSeen)
            : length;
        out.push_back(stats);
    }
    return out;
}

std::vector<RepeatedDraw> StatisticsAggregator::repeatedDraws(const DrawHistory& history) {
    std::vector<RepeatedDraw> groups;
    std::map<std::vector<int>, size_t> indexByNumbers;

    for (const auto& draw : history) {
        const auto it = indexByNumbers.find(draw.numbers);
        if (it == indexByNumbers.end()) {
            indexByNumbers.emplace(draw.numbers, groups.size());
            groups.push_back({draw.numbers, {draw.contestId}});
        } else {
            groups[it->second].contestIds.push_back(draw.contestId);
        }
    }

    std::vector<RepeatedDraw> out;
    for (auto& group : groups) {
        if (group.contestIds.size() > 1) out.push_back(std::move(group));
    }
    return out;
}

std::vector<std::vector<std::string>> StatisticsAggregator::drawsByNumber(const DrawHistory& history,
                                                                          const LotteryProfile& profile) {
    std::vector<std::vector<std::string>> out(static_cast<size_t>(std::max(profile.totalNumbers, 0)));
    for (const auto& draw : history) {
        for (int n : draw.numbers) {
            if (profile.inRange(n)) out[static_cast<size_t>(n - 1)].push_back(draw.contestId);
        }
    }
    return out;
}

StatisticsBundle StatisticsAggregator::aggregate(const DrawHistory& history, const LotteryProfile& profile) {
    StatisticsBundle bundle;
    bundle.totalDraws = history.size();
    bundle.frequencies = frequencies(history, profile);
    bundle.topPairs = topPairs(history, profile);
    bundle.parity = parityDistribution(history);
    bundle.intervals = intervals(history, profile);
    bundle.repeatedDraws = repeatedDraws(history);
    bundle.drawsByNumber = drawsByNumber(history, profile);
    const size_t lastCount = std::min(history.size(), kLastDraws);
    bundle.lastDraws.assign(history.begin(), history.begin() + static_cast<long>(lastCount));
    return bundle;
}
