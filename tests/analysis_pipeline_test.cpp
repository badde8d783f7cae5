// End-to-end tests: files on disk through ingestion, consolidation, statistics and exports.

#include <gtest/gtest.h>

#include "AnalysisPipeline.h"
#include "DrawIngestor.h"
#include "LottoLensExceptions.h"
#include "SnapshotExporter.h"

#include <filesystem>
#include <fstream>
#include <numeric>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

const char* kSemicolonExport =
    "Resultado Mega-Sena\n"
    "Concurso;Data do Sorteio;Bola1;Bola2;Bola3;Bola4;Bola5;Bola6\n"
    "1;11/03/1996;4;5;30;33;41;52\n"
    "2;18/03/1996;9;37;39;41;43;49\n"
    "500;01/01/2000;1;2;3;4;5;6\n";

const char* kCommaExport =
    "Concurso,Data,Bola1,Bola2,Bola3,Bola4,Bola5,Bola6\n"
    "500,01/01/2000,10,20,30,40,50,60\n"
    "3,25/03/1996,10,11,29,30,36,47\n";

class AnalysisPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               (std::string("lottolens_pipeline_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
        profile_ = LotteryProfile::preset("mega-sena");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        const fs::path path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    AnalysisResult run(const std::vector<std::string>& paths, AnalysisOptions options = AnalysisOptions{}) {
        std::mt19937 rng(2024);
        return AnalysisPipeline::analyze(paths, profile_, options, rng);
    }

    static std::vector<std::string> contestsOf(const DrawHistory& history) {
        std::vector<std::string> out;
        for (const auto& d : history) out.push_back(d.contestId);
        return out;
    }

    fs::path dir_;
    LotteryProfile profile_;
};

}  // namespace

TEST_F(AnalysisPipelineTest, MergesFilesNewestFirstWithLaterFileWinning) {
    const AnalysisResult result = run({write("a.csv", kSemicolonExport), write("b.csv", kCommaExport)});

    EXPECT_EQ(result.fileNames, (std::vector<std::string>{"a.csv", "b.csv"}));
    EXPECT_EQ(contestsOf(result.history), (std::vector<std::string>{"500", "3", "2", "1"}));
    EXPECT_EQ(result.history.front().numbers, (std::vector<int>{10, 20, 30, 40, 50, 60}));
    EXPECT_EQ(result.analyzed.size(), 4u);

    ASSERT_EQ(result.outcomes.size(), 2u);
    EXPECT_TRUE(result.outcomes[0].ok);
    EXPECT_EQ(result.outcomes[0].extraction.accepted, 3u);
    EXPECT_EQ(result.outcomes[1].extraction.accepted, 2u);
}

TEST_F(AnalysisPipelineTest, StatisticsCoverMergedHistory) {
    const AnalysisResult result = run({write("a.csv", kSemicolonExport), write("b.csv", kCommaExport)});
    const StatisticsBundle& stats = result.stats;

    EXPECT_EQ(stats.totalDraws, 4u);
    ASSERT_EQ(stats.frequencies.size(), 60u);
    const size_t total = std::accumulate(stats.frequencies.begin(), stats.frequencies.end(), size_t{0},
                                         [](size_t acc, const NumberFrequency& f) { return acc + f.count; });
    EXPECT_EQ(total, 24u);
    EXPECT_EQ(stats.frequencies.front().number, 30);
    EXPECT_EQ(stats.frequencies.front().count, 3u);

    const auto& thirty = stats.intervalFor(30);
    EXPECT_EQ(thirty.currentDelay, 0u);
    EXPECT_DOUBLE_EQ(thirty.averageInterval, 1.5);
    EXPECT_EQ(thirty.maxDelay, 2u);

    EXPECT_EQ(result.suggestions.hot.size(), 6u);
    EXPECT_EQ(result.suggestions.cold.size(), 6u);
    EXPECT_EQ(result.suggestions.mixed.size(), 6u);
}

TEST_F(AnalysisPipelineTest, SameFileTwiceMatchesOnce) {
    const std::string path = write("a.csv", kSemicolonExport);
    const AnalysisResult once = run({path});
    const AnalysisResult twice = run({path, path});

    EXPECT_EQ(contestsOf(once.history), contestsOf(twice.history));
    for (size_t i = 0; i < once.history.size(); ++i) {
        EXPECT_EQ(once.history[i].numbers, twice.history[i].numbers);
    }
    EXPECT_EQ(once.stats.totalDraws, twice.stats.totalDraws);
}

TEST_F(AnalysisPipelineTest, FailFastReportsOffendingFile) {
    const std::string good = write("a.csv", kSemicolonExport);
    const std::string bad = write("bad.csv", "foo,bar\n1,2\n");

    AnalysisOptions options;
    options.ingest.failFast = true;
    try {
        run({good, bad}, options);
        FAIL() << "expected FileProcessingError";
    } catch (const LottoLens::FileProcessingError& e) {
        EXPECT_EQ(e.fileName(), "bad.csv");
        EXPECT_NE(std::string(e.what()).find("Header not found"), std::string::npos);
    }
}

TEST_F(AnalysisPipelineTest, LenientBatchSkipsFailedFiles) {
    const std::string good = write("a.csv", kSemicolonExport);
    const std::string bad = write("bad.csv", "foo,bar\n1,2\n");
    const std::string missing = (dir_ / "missing.csv").string();

    AnalysisOptions options;
    options.ingest.failFast = false;
    const AnalysisResult result = run({good, bad, missing}, options);

    ASSERT_EQ(result.outcomes.size(), 3u);
    EXPECT_TRUE(result.outcomes[0].ok);
    EXPECT_FALSE(result.outcomes[1].ok);
    EXPECT_FALSE(result.outcomes[2].ok);
    EXPECT_NE(result.outcomes[2].error.find("does not exist"), std::string::npos);
    EXPECT_EQ(result.history.size(), 3u);
}

TEST_F(AnalysisPipelineTest, NoSurvivingDrawsIsAnError) {
    const std::string path = write("dates.csv",
                                   "Concurso,Data,Bola1,Bola2,Bola3,Bola4,Bola5,Bola6\n"
                                   "1,31/02/2024,1,2,3,4,5,6\n"
                                   "2,soon,1,2,3,4,5,6\n");
    EXPECT_THROW(run({path}), LottoLens::NoValidDrawsError);
}

TEST_F(AnalysisPipelineTest, DateRangeRestrictsStatisticsOnly) {
    AnalysisOptions options;
    options.from = DrawDate{1996, 3, 18};
    options.to = DrawDate{1996, 3, 25};
    const AnalysisResult result = run({write("a.csv", kSemicolonExport), write("b.csv", kCommaExport)}, options);

    EXPECT_EQ(result.history.size(), 4u);
    EXPECT_EQ(contestsOf(result.analyzed), (std::vector<std::string>{"3", "2"}));
    EXPECT_EQ(result.stats.totalDraws, 2u);

    std::mt19937 rng(1);
    const AnalysisResult empty = AnalysisPipeline::reanalyze(result, profile_, DrawDate{1990, 1, 1}, DrawDate{1990, 12, 31}, rng);
    EXPECT_EQ(empty.history.size(), 4u);
    EXPECT_TRUE(empty.analyzed.empty());
    EXPECT_EQ(empty.stats.totalDraws, 0u);
    for (const auto& f : empty.stats.frequencies) EXPECT_EQ(f.count, 0u);
    EXPECT_EQ(empty.suggestions.mixed.size(), 6u);
}

TEST_F(AnalysisPipelineTest, ReportAndSnapshotExports) {
    const AnalysisResult result = run({write("a.csv", kSemicolonExport), write("b.csv", kCommaExport)});

    const std::string markdown = AnalysisPipeline::buildReport(result, profile_).markdown();
    EXPECT_NE(markdown.find("# LottoLens Report: Mega-Sena"), std::string::npos);
    EXPECT_NE(markdown.find("## Hot Numbers"), std::string::npos);
    EXPECT_NE(markdown.find("## Top Pairs"), std::string::npos);
    EXPECT_NE(markdown.find("## Delays"), std::string::npos);
    EXPECT_NE(markdown.find("| a.csv | ok | 3 |"), std::string::npos);

    const std::string csvPath = (dir_ / "numbers.csv").string();
    SnapshotExporter::writeNumberCsv(result.stats, csvPath);
    std::ifstream in(csvPath);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    ASSERT_EQ(lines.size(), 61u);
    EXPECT_EQ(lines[0], "Number,Frequency,CurrentDelay,AverageInterval,MaxDelay");
    EXPECT_EQ(lines[30], "30,3,0,1.50,2");
    EXPECT_EQ(lines[60], "60,1,0,0.00,0");

    if (!SnapshotExporter::parquetSupported()) {
        std::string error;
        EXPECT_FALSE(SnapshotExporter::writeHistoryParquet(result.history, profile_, (dir_ / "h.parquet").string(), error));
        EXPECT_FALSE(error.empty());
    }
}

TEST_F(AnalysisPipelineTest, IngestFileReadsSingleExport) {
    ExtractionStats stats;
    const auto draws = DrawIngestor::ingestFile(write("a.csv", kSemicolonExport), profile_, TableReadOptions{}, &stats);
    ASSERT_EQ(draws.size(), 3u);
    EXPECT_EQ(draws[0].contestId, "1");
    EXPECT_EQ(draws[0].numbers, (std::vector<int>{4, 5, 30, 33, 41, 52}));
    EXPECT_EQ(stats.rowsScanned, 3u);
}
