// Tests for DrawExtractor: row validation, deduplication and rejection accounting.

#include <gtest/gtest.h>

#include "DrawExtractor.h"

#include <string>
#include <vector>

namespace {

Cell text(const std::string& s) { return Cell{s}; }
Cell num(double v) { return Cell{v}; }

LotteryProfile smallGame() {
    LotteryProfile profile;
    profile.totalNumbers = 25;
    profile.drawSize = 5;
    profile.betSize = 5;
    profile.hotCount = 5;
    profile.coldCount = 5;
    return profile;
}

ColumnLayout strictLayout(size_t slots) {
    ColumnLayout layout;
    layout.headerRow = 0;
    layout.contestColumn = 0;
    layout.dateColumn = 1;
    for (size_t i = 0; i < slots; ++i) layout.numberColumns.push_back(2 + i);
    return layout;
}

ColumnLayout looseLayout() {
    ColumnLayout layout;
    layout.contestColumn = 0;
    layout.dateColumn = 1;
    return layout;
}

RawRow row(const Cell& contest, const std::string& date, const std::vector<Cell>& numbers) {
    RawRow out{contest, text(date)};
    out.insert(out.end(), numbers.begin(), numbers.end());
    return out;
}

}  // namespace

TEST(DrawExtractorTest, BuildsSortedDrawFromSlots) {
    RowRejection reason = RowRejection::INVALID_DATE;
    const auto draw = DrawExtractor::extractRow(
        row(num(101), "15/03/2024", {num(9), num(2), text("07"), num(25), num(1)}), strictLayout(5), smallGame(), &reason);
    ASSERT_TRUE(draw.has_value());
    EXPECT_EQ(reason, RowRejection::NONE);
    EXPECT_EQ(draw->contestId, "101");
    EXPECT_EQ(draw->numbers, (std::vector<int>{1, 2, 7, 9, 25}));
    EXPECT_EQ(draw->date, (DrawDate{2024, 3, 15}));
}

TEST(DrawExtractorTest, DuplicateBallCountsOnceAndShortRowIsDropped) {
    RowRejection reason = RowRejection::NONE;
    const auto draw = DrawExtractor::extractRow(
        row(num(101), "15/03/2024", {num(1), num(2), num(3), num(4), num(4)}), strictLayout(5), smallGame(), &reason);
    EXPECT_FALSE(draw.has_value());
    EXPECT_EQ(reason, RowRejection::WRONG_DRAW_SIZE);
}

TEST(DrawExtractorTest, RowWithTooManyNumbersIsDroppedNotTruncated) {
    RowRejection reason = RowRejection::NONE;
    const auto draw = DrawExtractor::extractRow(
        row(text("1001"), "15/03/2024", {num(1), num(2), num(3), num(4), num(5), num(6)}), looseLayout(), smallGame(), &reason);
    EXPECT_FALSE(draw.has_value());
    EXPECT_EQ(reason, RowRejection::WRONG_DRAW_SIZE);
}

TEST(DrawExtractorTest, ImpossibleDateDropsRow) {
    RowRejection reason = RowRejection::NONE;
    const auto draw = DrawExtractor::extractRow(
        row(num(101), "31/02/2024", {num(1), num(2), num(3), num(4), num(5)}), strictLayout(5), smallGame(), &reason);
    EXPECT_FALSE(draw.has_value());
    EXPECT_EQ(reason, RowRejection::INVALID_DATE);
}

TEST(DrawExtractorTest, BlankContestDropsRow) {
    RowRejection reason = RowRejection::NONE;
    const auto draw = DrawExtractor::extractRow(
        row(text("  "), "15/03/2024", {num(1), num(2), num(3), num(4), num(5)}), strictLayout(5), smallGame(), &reason);
    EXPECT_FALSE(draw.has_value());
    EXPECT_EQ(reason, RowRejection::MISSING_CONTEST);
}

TEST(DrawExtractorTest, OutOfRangeAndFractionalNumbersDoNotCount) {
    const auto draw = DrawExtractor::extractRow(
        row(num(101), "15/03/2024", {num(1), num(2), num(3), num(4), num(26)}), strictLayout(5), smallGame());
    EXPECT_FALSE(draw.has_value());

    const auto fractional = DrawExtractor::extractRow(
        row(num(101), "15/03/2024", {num(1), num(2), num(3), num(4), num(5.5)}), strictLayout(5), smallGame());
    EXPECT_FALSE(fractional.has_value());
}

TEST(DrawExtractorTest, LooseLayoutScansWholeRow) {
    const auto draw = DrawExtractor::extractRow(
        row(text("C-77"), "01/01/2020", {text("x"), num(3), num(11), num(19), text("prize 1.000,00"), num(21), num(24)}),
        looseLayout(), smallGame());
    ASSERT_TRUE(draw.has_value());
    EXPECT_EQ(draw->numbers, (std::vector<int>{3, 11, 19, 21, 24}));
}

TEST(DrawExtractorTest, ExtractCountsEveryRejection) {
    const RawGrid grid{
        {text("Concurso"), text("Data"), text("B1"), text("B2"), text("B3"), text("B4"), text("B5")},
        row(num(1), "01/01/2020", {num(1), num(2), num(3), num(4), num(5)}),
        row(Cell{}, "02/01/2020", {num(1), num(2), num(3), num(4), num(5)}),
        row(num(3), "31/02/2020", {num(1), num(2), num(3), num(4), num(5)}),
        row(num(4), "04/01/2020", {num(1), num(2), num(3), num(4)}),
        row(num(5), "05/01/2020", {num(6), num(7), num(8), num(9), num(10)}),
    };
    ExtractionStats stats;
    const auto draws = DrawExtractor::extract(grid, strictLayout(5), smallGame(), &stats);

    ASSERT_EQ(draws.size(), 2u);
    EXPECT_EQ(draws[0].contestId, "1");
    EXPECT_EQ(draws[1].contestId, "5");
    EXPECT_EQ(stats.rowsScanned, 5u);
    EXPECT_EQ(stats.accepted, 2u);
    EXPECT_EQ(stats.missingContest, 1u);
    EXPECT_EQ(stats.invalidDate, 1u);
    EXPECT_EQ(stats.wrongDrawSize, 1u);
}
