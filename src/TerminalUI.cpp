#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iostream>
#include <iomanip>

namespace {
constexpr const char* kRule = "============================================================================================================\n";

void printBanner(const std::string& title) {
    const std::string decorated = " " + title + " ";
    const size_t width = 108;
    const size_t side = decorated.size() < width ? (width - decorated.size()) / 2 : 0;
    std::string line = std::string(side, '=') + decorated;
    line += std::string(width > line.size() ? width - line.size() : 0, '=');
    std::cout << "\n" << line << "\n";
}

std::vector<int> numbersOf(const std::vector<NumberFrequency>& freq, size_t count, bool fromTop) {
    std::vector<int> out;
    count = std::min(count, freq.size());
    for (size_t i = 0; i < count; ++i) {
        out.push_back(fromTop ? freq[i].number : freq[freq.size() - 1 - i].number);
    }
    return out;
}
} // namespace

void TerminalUI::printFileOutcomes(const std::vector<FileOutcome>& outcomes) {
    size_t maxNameLen = 15;
    for (const auto& o : outcomes) maxNameLen = std::max(maxNameLen, o.fileName.length());

    int w = static_cast<int>(maxNameLen) + 2;
    printBanner("SOURCE FILES");
    std::cout << std::left
              << std::setw(w) << "File"
              << std::setw(10) << "Status"
              << std::setw(10) << "Rows"
              << std::setw(10) << "Draws"
              << "Note\n";
    std::cout << std::string(w + 40, '-') << "\n";

    for (const auto& o : outcomes) {
        std::cout << std::left << std::setw(w) << o.fileName
                  << std::setw(10) << (o.ok ? "ok" : "FAILED")
                  << std::setw(10) << o.extraction.rowsScanned
                  << std::setw(10) << o.extraction.accepted
                  << (o.ok ? "" : o.error) << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printOverview(const LotteryProfile& profile, const DrawHistory& analyzed, size_t consolidatedDraws) {
    printBanner("DRAW HISTORY");
    std::cout << "    Game: " << profile.name << " (" << profile.drawSize << " of " << profile.totalNumbers
              << ", bet " << profile.betSize << ")\n";
    std::cout << "    Consolidated contests: " << consolidatedDraws << "\n";
    std::cout << "    Analyzed contests:     " << analyzed.size() << "\n";
    if (!analyzed.empty()) {
        std::cout << "    Period: " << analyzed.back().date.toDisplayString() << " -> "
                  << analyzed.front().date.toDisplayString() << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printHotCold(const StatisticsBundle& stats, const LotteryProfile& profile) {
    printBanner("HOT / COLD NUMBERS");
    const auto hot = numbersOf(stats.frequencies, static_cast<size_t>(profile.hotCount), true);
    const auto cold = numbersOf(stats.frequencies, static_cast<size_t>(profile.coldCount), false);

    std::cout << std::left << std::setw(20) << "Hot (most drawn)" << std::setw(12) << "Count"
              << std::setw(20) << "Cold (least drawn)" << "Count\n";
    std::cout << std::string(64, '-') << "\n";
    const size_t rows = std::max(hot.size(), cold.size());
    for (size_t i = 0; i < rows; ++i) {
        if (i < hot.size()) {
            std::cout << std::left << std::setw(20) << hot[i] << std::setw(12) << stats.frequencies[i].count;
        } else {
            std::cout << std::string(32, ' ');
        }
        if (i < cold.size()) {
            std::cout << std::left << std::setw(20) << cold[i]
                      << stats.frequencies[stats.frequencies.size() - 1 - i].count;
        }
        std::cout << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printTopPairs(const std::vector<PairFrequency>& pairs) {
    printBanner("TOP PAIRS");
    if (pairs.empty()) {
        std::cout << "        -> No pair was drawn together yet.\n";
        std::cout << kRule;
        return;
    }
    for (size_t i = 0; i < pairs.size(); ++i) {
        std::cout << "    " << std::right << std::setw(2) << (i + 1) << ". "
                  << std::setw(3) << pairs[i].first << " + " << std::left << std::setw(5) << pairs[i].second
                  << pairs[i].count << "x\n";
    }
    std::cout << kRule;
}

void TerminalUI::printParity(const std::vector<ParityBucket>& parity, size_t totalDraws) {
    printBanner("EVEN / ODD SPLIT");
    for (const auto& bucket : parity) {
        const double share = totalDraws == 0 ? 0.0 : 100.0 * static_cast<double>(bucket.count) / static_cast<double>(totalDraws);
        std::cout << "    " << std::left << std::setw(20) << bucket.label()
                  << std::right << std::setw(8) << bucket.count
                  << std::setw(10) << std::fixed << std::setprecision(1) << share << "%\n";
    }
    std::cout << kRule;
}

void TerminalUI::printIntervalTable(const std::vector<IntervalStats>& intervals) {
    printBanner("DELAYS");
    std::cout << std::left
              << std::setw(10) << "Number"
              << std::setw(16) << "Current delay"
              << std::setw(16) << "Avg interval"
              << "Max delay\n";
    std::cout << std::string(52, '-') << "\n";
    for (const auto& s : intervals) {
        std::cout << std::left << std::setw(10) << s.number
                  << std::setw(16) << s.currentDelay
                  << std::setw(16) << CommonUtils::toFixed(s.averageInterval, 2)
                  << s.maxDelay << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printRepeatedDraws(const std::vector<RepeatedDraw>& repeated) {
    printBanner("REPEATED COMBINATIONS");
    if (repeated.empty()) {
        std::cout << "        -> Every analyzed draw is a unique combination.\n";
        std::cout << kRule;
        return;
    }
    for (const auto& r : repeated) {
        std::cout << "    [" << CommonUtils::joinInts(r.numbers, " ") << "] in contests ";
        for (size_t i = 0; i < r.contestIds.size(); ++i) {
            std::cout << (i ? ", " : "") << r.contestIds[i];
        }
        std::cout << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printLastDraws(const std::vector<Draw>& draws) {
    printBanner("LATEST DRAWS");
    for (const auto& d : draws) {
        std::cout << "    " << std::left << std::setw(10) << d.contestId
                  << std::setw(14) << d.date.toDisplayString()
                  << CommonUtils::joinInts(d.numbers, " ") << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printSuggestions(const Suggestions& suggestions, const std::string& heading) {
    printBanner(heading);
    std::cout << "    Hot:   " << CommonUtils::joinInts(suggestions.hot, " ") << "\n";
    std::cout << "    Cold:  " << CommonUtils::joinInts(suggestions.cold, " ") << "\n";
    std::cout << "    Mixed: " << CommonUtils::joinInts(suggestions.mixed, " ") << "\n";
    std::cout << kRule;
}

void TerminalUI::printCustomGame(const std::vector<int>& numbers, const std::vector<int>& hotPicks, const std::vector<int>& coldPicks) {
    printBanner("CUSTOM GAME");
    std::cout << "    Picks: hot " << CommonUtils::joinInts(hotPicks, " ")
              << " | cold " << CommonUtils::joinInts(coldPicks, " ") << "\n";
    std::cout << "    Game:  " << CommonUtils::joinInts(numbers, " ") << "\n";
    std::cout << kRule;
}
