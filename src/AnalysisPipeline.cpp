#include "AnalysisPipeline.h"
#include "CommonUtils.h"
#include "DrawConsolidator.h"

#include <algorithm>
#include <iostream>

AnalysisResult AnalysisPipeline::analyze(const std::vector<std::string>& paths,
                                         const LotteryProfile& profile,
                                         const AnalysisOptions& options,
                                         std::mt19937& rng) {
    IngestionResult ingestion = DrawIngestor::ingest(paths, profile, options.ingest);

    AnalysisResult base;
    base.fileNames = std::move(ingestion.fileNames);
    base.outcomes = std::move(ingestion.outcomes);
    base.history = std::move(ingestion.history);

    if (options.ingest.verbose) {
        std::cout << "[LottoLens][Consolidate] " << base.history.size() << " unique contests from "
                  << base.fileNames.size() << " file(s), " << base.history.back().date.toDisplayString()
                  << " to " << base.history.front().date.toDisplayString() << "\n";
    }

    return reanalyze(base, profile, options.from, options.to, rng);
}

AnalysisResult AnalysisPipeline::reanalyze(const AnalysisResult& base,
                                           const LotteryProfile& profile,
                                           const std::optional<DrawDate>& from,
                                           const std::optional<DrawDate>& to,
                                           std::mt19937& rng) {
    AnalysisResult result;
    result.fileNames = base.fileNames;
    result.outcomes = base.outcomes;
    result.history = base.history;
    result.analyzed = (from || to) ? DrawConsolidator::filterByDateRange(base.history, from, to) : base.history;

    if (result.analyzed.empty()) {
        std::cerr << "[LottoLens][Warning] No draws fall inside the selected date range.\n";
    }

    result.stats = StatisticsAggregator::aggregate(result.analyzed, profile);
    result.suggestions = SuggestionGenerator::generate(result.stats.frequencies, profile, rng);
    return result;
}

ReportEngine AnalysisPipeline::buildReport(const AnalysisResult& result, const LotteryProfile& profile) {
    ReportEngine report;
    const StatisticsBundle& stats = result.stats;

    report.addTitle("LottoLens Report: " + profile.name);
    std::string period = "no draws in range";
    if (!result.analyzed.empty()) {
        period = result.analyzed.back().date.toDisplayString() + " to " + result.analyzed.front().date.toDisplayString();
    }
    report.addParagraph("Analyzed " + std::to_string(stats.totalDraws) + " of " + std::to_string(result.history.size()) +
                        " consolidated contests (" + period + "). Game: " + std::to_string(profile.drawSize) + " of " +
                        std::to_string(profile.totalNumbers) + ", bet size " + std::to_string(profile.betSize) + ".");

    std::vector<std::vector<std::string>> fileRows;
    for (const auto& o : result.outcomes) {
        fileRows.push_back({o.fileName, o.ok ? "ok" : "failed", std::to_string(o.extraction.accepted), o.ok ? "" : o.error});
    }
    report.addTable("Source Files", {"File", "Status", "Draws", "Error"}, fileRows);

    const size_t hotCount = std::min(static_cast<size_t>(profile.hotCount), stats.frequencies.size());
    const size_t coldCount = std::min(static_cast<size_t>(profile.coldCount), stats.frequencies.size());
    std::vector<std::vector<std::string>> hotRows;
    for (size_t i = 0; i < hotCount; ++i) {
        hotRows.push_back({std::to_string(stats.frequencies[i].number), std::to_string(stats.frequencies[i].count)});
    }
    report.addTable("Hot Numbers", {"Number", "Frequency"}, hotRows);
    std::vector<std::vector<std::string>> coldRows;
    for (size_t i = 0; i < coldCount; ++i) {
        const auto& f = stats.frequencies[stats.frequencies.size() - 1 - i];
        coldRows.push_back({std::to_string(f.number), std::to_string(f.count)});
    }
    report.addTable("Cold Numbers", {"Number", "Frequency"}, coldRows);

    std::vector<std::vector<std::string>> pairRows;
    for (const auto& p : stats.topPairs) {
        pairRows.push_back({std::to_string(p.first) + " + " + std::to_string(p.second), std::to_string(p.count)});
    }
    report.addTable("Top Pairs", {"Pair", "Draws"}, pairRows);

    std::vector<std::vector<std::string>> parityRows;
    for (const auto& b : stats.parity) {
        const double share = stats.totalDraws == 0 ? 0.0 : 100.0 * static_cast<double>(b.count) / static_cast<double>(stats.totalDraws);
        parityRows.push_back({b.label(), std::to_string(b.count), CommonUtils::toFixed(share, 1) + "%"});
    }
    report.addTable("Even / Odd Split", {"Split", "Draws", "Share"}, parityRows);

    report.addHeading("Repeated Combinations");
    std::vector<std::string> repeated;
    for (const auto& r : stats.repeatedDraws) {
        std::string contests;
        for (size_t i = 0; i < r.contestIds.size(); ++i) contests += (i ? ", " : "") + r.contestIds[i];
        repeated.push_back(CommonUtils::joinInts(r.numbers, " ") + " (contests " + contests + ")");
    }
    report.addBulletList(repeated);

    std::vector<std::vector<std::string>> lastRows;
    for (const auto& d : stats.lastDraws) {
        lastRows.push_back({d.contestId, d.date.toDisplayString(), CommonUtils::joinInts(d.numbers, " ")});
    }
    report.addTable("Latest Draws", {"Contest", "Date", "Numbers"}, lastRows);

    std::vector<std::vector<std::string>> delayRows;
    for (const auto& s : stats.intervals) {
        delayRows.push_back({std::to_string(s.number), std::to_string(s.currentDelay),
                             CommonUtils::toFixed(s.averageInterval, 2), std::to_string(s.maxDelay)});
    }
    report.addTable("Delays", {"Number", "Current Delay", "Average Interval", "Max Delay"}, delayRows);

    report.addTable("Suggested Games", {"Strategy", "Numbers"},
                    {{"Hot", CommonUtils::joinInts(result.suggestions.hot, " ")},
                     {"Cold", CommonUtils::joinInts(result.suggestions.cold, " ")},
                     {"Mixed", CommonUtils::joinInts(result.suggestions.mixed, " ")}});
    return report;
}
