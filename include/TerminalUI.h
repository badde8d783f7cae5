#pragma once
#include "DrawIngestor.h"
#include "LotteryProfile.h"
#include "StatisticsAggregator.h"
#include "SuggestionGenerator.h"
#include <vector>
#include <string>

class TerminalUI {
public:
    static void printFileOutcomes(const std::vector<FileOutcome>& outcomes);
    static void printOverview(const LotteryProfile& profile, const DrawHistory& analyzed, size_t consolidatedDraws);

    // Frequency display
    static void printHotCold(const StatisticsBundle& stats, const LotteryProfile& profile);
    static void printTopPairs(const std::vector<PairFrequency>& pairs);
    static void printParity(const std::vector<ParityBucket>& parity, size_t totalDraws);

    // Delay display
    static void printIntervalTable(const std::vector<IntervalStats>& intervals);
    static void printRepeatedDraws(const std::vector<RepeatedDraw>& repeated);
    static void printLastDraws(const std::vector<Draw>& draws);

    static void printSuggestions(const Suggestions& suggestions, const std::string& heading);
    static void printCustomGame(const std::vector<int>& numbers, const std::vector<int>& hotPicks, const std::vector<int>& coldPicks);
};
