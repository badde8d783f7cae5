#include "AnalysisConfig.h"
#include "AnalysisPipeline.h"
#include "LottoLensExceptions.h"
#include "SnapshotExporter.h"
#include "SuggestionGenerator.h"
#include "TerminalUI.h"
#include <iostream>
#include <random>
#include <string>

namespace {
std::mt19937 makeRng(const AnalysisConfig& config) {
    if (config.seed) return std::mt19937(*config.seed);
    std::random_device rd;
    return std::mt19937(rd());
}

void printResult(const AnalysisResult& result, const LotteryProfile& profile, bool verbose) {
    TerminalUI::printFileOutcomes(result.outcomes);
    TerminalUI::printOverview(profile, result.analyzed, result.history.size());
    TerminalUI::printLastDraws(result.stats.lastDraws);
    TerminalUI::printHotCold(result.stats, profile);
    TerminalUI::printTopPairs(result.stats.topPairs);
    TerminalUI::printParity(result.stats.parity, result.stats.totalDraws);
    TerminalUI::printRepeatedDraws(result.stats.repeatedDraws);
    if (verbose) TerminalUI::printIntervalTable(result.stats.intervals);
    TerminalUI::printSuggestions(result.suggestions, "SUGGESTED GAMES");
}

void writeOutputs(const AnalysisConfig& config, const AnalysisResult& result, const LotteryProfile& profile) {
    if (!config.reportFile.empty()) {
        AnalysisPipeline::buildReport(result, profile).save(config.reportFile);
        std::cout << "[LottoLens][Report] Markdown report written to " << config.reportFile << "\n";
    }
    if (!config.exportCsvPath.empty()) {
        SnapshotExporter::writeNumberCsv(result.stats, config.exportCsvPath);
        std::cout << "[LottoLens][Export] Per-number statistics written to " << config.exportCsvPath << "\n";
    }
    if (!config.exportParquetPath.empty()) {
        std::string parquetError;
        if (SnapshotExporter::writeHistoryParquet(result.history, profile, config.exportParquetPath, parquetError)) {
            std::cout << "[LottoLens][Export] Draw history written to " << config.exportParquetPath << "\n";
        } else {
            std::cerr << "[LottoLens][Warning] Parquet export skipped: " << parquetError << "\n";
        }
    }
}
} // namespace

int main(int argc, char* argv[]) {
    AnalysisConfig config;
    try {
        config = AnalysisConfig::fromArgs(argc, argv);
    } catch (const LottoLens::ConfigurationException& e) {
        std::cerr << "[LottoLens][Error] " << e.what() << "\n\n" << AnalysisConfig::usage(argv[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << AnalysisConfig::usage(argv[0]);
        return 0;
    }

    try {
        const LotteryProfile profile = config.profile();
        std::mt19937 rng = makeRng(config);

        AnalysisOptions options;
        options.ingest.read.delimiter = config.delimiter;
        options.ingest.failFast = config.strict;
        options.ingest.verbose = config.verbose;
        options.from = config.from;
        options.to = config.to;

        std::cout << "[LottoLens][Ingest] Reading " << config.inputPaths.size() << " file(s) as " << profile.name << "...\n";
        const AnalysisResult result = AnalysisPipeline::analyze(config.inputPaths, profile, options, rng);
        printResult(result, profile, config.verbose);

        for (int round = 1; round <= config.regenerateRounds; ++round) {
            const Suggestions again = SuggestionGenerator::generate(result.stats.frequencies, profile, rng);
            TerminalUI::printSuggestions(again, "SUGGESTED GAMES (ROUND " + std::to_string(round + 1) + ")");
        }

        if (!config.customHot.empty()) {
            const auto game = SuggestionGenerator::custom(result.stats.frequencies, profile,
                                                          config.customHot, config.customCold, rng);
            TerminalUI::printCustomGame(game, config.customHot, config.customCold);
        }

        writeOutputs(config, result, profile);
    } catch (const LottoLens::ConfigurationException& e) {
        std::cerr << "[LottoLens][Error] " << e.what() << "\n";
        return 2;
    } catch (const LottoLens::LottoLensException& e) {
        std::cerr << "[LottoLens][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[LottoLens][Exception] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
