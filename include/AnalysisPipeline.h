#pragma once

#include "DrawIngestor.h"
#include "LotteryProfile.h"
#include "ReportEngine.h"
#include "StatisticsAggregator.h"
#include "SuggestionGenerator.h"

#include <optional>
#include <random>
#include <string>
#include <vector>

struct AnalysisOptions {
    IngestOptions ingest;
    std::optional<DrawDate> from;
    std::optional<DrawDate> to;
};

struct AnalysisResult {
    std::vector<std::string> fileNames;
    std::vector<FileOutcome> outcomes;
    // Every consolidated draw, kept so a new date range needs no re-parse.
    DrawHistory history;
    // The draws the statistics were computed on.
    DrawHistory analyzed;
    StatisticsBundle stats;
    Suggestions suggestions;
};

class AnalysisPipeline {
public:
    /**
     * @brief Ingests, consolidates, optionally date-filters, aggregates and suggests.
     * @throws LottoLens::FileProcessingError, LottoLens::NoValidDrawsError.
     */
    static AnalysisResult analyze(const std::vector<std::string>& paths,
                                  const LotteryProfile& profile,
                                  const AnalysisOptions& options,
                                  std::mt19937& rng);

    /**
     * @brief Recomputes statistics and suggestions of `base` over a new date range.
     */
    static AnalysisResult reanalyze(const AnalysisResult& base,
                                    const LotteryProfile& profile,
                                    const std::optional<DrawDate>& from,
                                    const std::optional<DrawDate>& to,
                                    std::mt19937& rng);

    // Markdown summary: sources, totals, hot/cold, pairs, parity, repeats, delays, suggestions.
    static ReportEngine buildReport(const AnalysisResult& result, const LotteryProfile& profile);
};
