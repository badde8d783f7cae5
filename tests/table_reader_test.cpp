// Tests for CSVUtils tokenization and TableReader cell typing.

#include <gtest/gtest.h>

#include "CSVUtils.h"
#include "LottoLensExceptions.h"
#include "TableReader.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <stdlib.h>

namespace {

RawGrid parse(const std::string& text, char delimiter = 0, bool nativeNumbers = false) {
    std::istringstream in(text);
    return TableReader::parseDelimited(in, "inline.csv", delimiter, nativeNumbers);
}

bool isText(const Cell& cell, const std::string& expected) {
    return std::holds_alternative<std::string>(cell) && std::get<std::string>(cell) == expected;
}

bool isNumber(const Cell& cell, double expected) {
    return std::holds_alternative<double>(cell) && std::get<double>(cell) == expected;
}

bool gzipOnPath() {
    return std::system("command -v gzip > /dev/null 2>&1") == 0;
}

// Private TMPDIR per test so converter temp files can be counted without races.
class ScopedTempDir {
public:
    ScopedTempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const char* previous = std::getenv("TMPDIR");
        hadPrevious_ = previous != nullptr;
        if (hadPrevious_) previous_ = previous;
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("lottolens_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        ::setenv("TMPDIR", dir_.c_str(), 1);
    }

    ~ScopedTempDir() {
        if (hadPrevious_) {
            ::setenv("TMPDIR", previous_.c_str(), 1);
        } else {
            ::unsetenv("TMPDIR");
        }
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path file(const std::string& name) const { return dir_ / name; }

    size_t conversionFiles() const {
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
            if (entry.path().filename().string().rfind("lottolens_input_", 0) == 0) ++count;
        }
        return count;
    }

private:
    std::filesystem::path dir_;
    std::string previous_;
    bool hadPrevious_ = false;
};

}  // namespace

// ===========================================================================
// CSVUtils
// ===========================================================================

TEST(CSVUtilsTest, DetectsDelimiterOutsideQuotes) {
    EXPECT_EQ(CSVUtils::detectDelimiter("Concurso;Data;Bola1;Bola2"), ';');
    EXPECT_EQ(CSVUtils::detectDelimiter("Concurso\tData\tBola1"), '\t');
    EXPECT_EQ(CSVUtils::detectDelimiter("Concurso,Data,Bola1"), ',');
    EXPECT_EQ(CSVUtils::detectDelimiter("\"a;b;c;d\",x,y"), ',');
    EXPECT_EQ(CSVUtils::detectDelimiter("single"), ',');
}

TEST(CSVUtilsTest, ParsesQuotedFieldsWithDelimitersAndEscapedQuotes) {
    std::istringstream in("\"a,b\",\"say \"\"hi\"\"\",  c  \n");
    bool malformed = true;
    const auto fields = CSVUtils::parseCSVLine(in, ',', &malformed);
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], "a,b");
    EXPECT_EQ(fields[1], "say \"hi\"");
    EXPECT_EQ(fields[2], "c");
    EXPECT_FALSE(malformed);
}

TEST(CSVUtilsTest, QuotedFieldMaySpanLines) {
    std::istringstream in("\"line one\nline two\",x\r\nnext,row\n");
    const auto first = CSVUtils::parseCSVLine(in, ',');
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0], "line one\nline two");
    const auto second = CSVUtils::parseCSVLine(in, ',');
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0], "next");
}

TEST(CSVUtilsTest, FlagsUnterminatedQuote) {
    std::istringstream in("1,\"open field\n");
    bool malformed = false;
    CSVUtils::parseCSVLine(in, ',', &malformed);
    EXPECT_TRUE(malformed);
}

TEST(CSVUtilsTest, FlagsOversizedField) {
    CSVUtils::ParseLimits limits;
    limits.maxFieldBytes = 8;
    std::istringstream in("0123456789abcdef,x\n");
    bool exceeded = false;
    const auto fields = CSVUtils::parseCSVLine(in, ',', nullptr, &exceeded, limits);
    EXPECT_TRUE(exceeded);
    EXPECT_TRUE(fields.empty());
}

// ===========================================================================
// TableReader
// ===========================================================================

TEST(TableReaderTest, SniffsSemicolonPastTitleRows) {
    const RawGrid grid = parse("Resultados Mega-Sena\n\nConcurso;Data;Bola1\n1;15/03/2024;10\n");
    ASSERT_EQ(grid.size(), 3u);
    ASSERT_EQ(grid[1].size(), 3u);
    EXPECT_TRUE(isText(grid[1][0], "Concurso"));
    EXPECT_TRUE(isNumber(grid[2][0], 1.0));
    EXPECT_TRUE(isText(grid[2][1], "15/03/2024"));
    EXPECT_TRUE(isNumber(grid[2][2], 10.0));
}

TEST(TableReaderTest, KeepsDateLikeTextAndBlankCells) {
    const RawGrid grid = parse("1,15-03-2024,,07\n", ',');
    ASSERT_EQ(grid.size(), 1u);
    ASSERT_EQ(grid[0].size(), 4u);
    EXPECT_TRUE(isText(grid[0][1], "15-03-2024"));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(grid[0][2]));
    EXPECT_TRUE(isNumber(grid[0][3], 7.0));
}

TEST(TableReaderTest, NativeNumbersTypeEveryNumericCell) {
    const RawGrid grid = parse("1.5,2,abc\n", ',', true);
    ASSERT_EQ(grid.size(), 1u);
    EXPECT_TRUE(isNumber(grid[0][0], 1.5));
    EXPECT_TRUE(isNumber(grid[0][1], 2.0));
    EXPECT_TRUE(isText(grid[0][2], "abc"));
}

TEST(TableReaderTest, HonorsExplicitDelimiter) {
    const RawGrid grid = parse("a,b\tc\n", '\t');
    ASSERT_EQ(grid.size(), 1u);
    ASSERT_EQ(grid[0].size(), 2u);
    EXPECT_TRUE(isText(grid[0][0], "a,b"));
}

TEST(TableReaderTest, SkipsByteOrderMark) {
    const RawGrid grid = parse("\xEF\xBB\xBF" "Concurso,Data\n");
    ASSERT_EQ(grid.size(), 1u);
    EXPECT_TRUE(isText(grid[0][0], "Concurso"));
}

TEST(TableReaderTest, UnterminatedQuoteIsMalformed) {
    EXPECT_THROW(parse("Concurso,Data\n1,\"15/03/2024\n"), LottoLens::MalformedFileError);
}

TEST(TableReaderTest, EmbeddedNulIsMalformed) {
    const std::string binary("Concurso,Data\n1,\0\n", 17);
    try {
        parse(binary);
        FAIL() << "expected MalformedFileError";
    } catch (const LottoLens::MalformedFileError& e) {
        EXPECT_EQ(e.fileName(), "inline.csv");
    }
}

TEST(TableReaderTest, MissingFileIsMalformed) {
    EXPECT_THROW(TableReader::readFile("/nonexistent/lottolens/draws.csv"), LottoLens::MalformedFileError);
}

TEST(TableReaderTest, ReadsDelimitedFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "lottolens_table_reader_test.csv";
    {
        std::ofstream out(path);
        out << "Concurso\tData\n42\t01/02/2020\n";
    }
    const RawGrid grid = TableReader::readFile(path.string());
    std::filesystem::remove(path);

    ASSERT_EQ(grid.size(), 2u);
    EXPECT_TRUE(isNumber(grid[1][0], 42.0));
    EXPECT_TRUE(isText(grid[1][1], "01/02/2020"));
}

TEST(TableReaderTest, ReadsGzipCompressedFileThroughConverter) {
    if (!gzipOnPath()) GTEST_SKIP() << "gzip not found on PATH";
    const ScopedTempDir tmp;

    const auto csvPath = tmp.file("draws.csv");
    const auto gzPath = tmp.file("draws.csv.gz");
    {
        std::ofstream out(csvPath);
        out << "Concurso;Data;Bola1\n77;05/06/2021;13\n";
    }
    const std::string command = "gzip -c '" + csvPath.string() + "' > '" + gzPath.string() + "'";
    ASSERT_EQ(std::system(command.c_str()), 0);

    const RawGrid grid = TableReader::readFile(gzPath.string());

    ASSERT_EQ(grid.size(), 2u);
    EXPECT_TRUE(isText(grid[0][0], "Concurso"));
    EXPECT_TRUE(isNumber(grid[1][0], 77.0));
    EXPECT_TRUE(isText(grid[1][1], "05/06/2021"));
    EXPECT_TRUE(isNumber(grid[1][2], 13.0));
    EXPECT_EQ(tmp.conversionFiles(), 0u);
}

TEST(TableReaderTest, CorruptGzipIsMalformedAndLeavesNoTempFile) {
    if (!gzipOnPath()) GTEST_SKIP() << "gzip not found on PATH";
    const ScopedTempDir tmp;

    const auto gzPath = tmp.file("broken.gz");
    {
        std::ofstream out(gzPath, std::ios::binary);
        out << "this is not gzip data";
    }

    try {
        TableReader::readFile(gzPath.string());
        FAIL() << "expected MalformedFileError";
    } catch (const LottoLens::MalformedFileError& e) {
        EXPECT_EQ(e.fileName(), "broken.gz");
        EXPECT_NE(std::string(e.what()).find("gzip failed"), std::string::npos) << e.what();
    }
    EXPECT_EQ(tmp.conversionFiles(), 0u);
}

TEST(TableReaderTest, InfersContainerKindFromExtension) {
    EXPECT_EQ(TableReader::inferKind("draws.XLSX"), ContainerKind::SPREADSHEET);
    EXPECT_EQ(TableReader::inferKind("draws.xls"), ContainerKind::SPREADSHEET);
    EXPECT_EQ(TableReader::inferKind("draws.csv"), ContainerKind::DELIMITED_TEXT);
    EXPECT_EQ(TableReader::inferKind("draws.txt"), ContainerKind::DELIMITED_TEXT);
}

// ===========================================================================
// Cell views
// ===========================================================================

TEST(CellTest, IntegralNumbersPrintWithoutDecimals) {
    EXPECT_EQ(cellToString(Cell{500.0}), "500");
    EXPECT_EQ(cellToString(Cell{2.5}), "2.5");
    EXPECT_EQ(cellToString(Cell{std::string("abc")}), "abc");
    EXPECT_EQ(cellToString(Cell{}), "");
}

TEST(CellTest, NumericViewRequiresCompleteLiteral) {
    EXPECT_EQ(cellToNumber(Cell{std::string(" 12 ")}), 12.0);
    EXPECT_EQ(cellToNumber(Cell{std::string("+7")}), 7.0);
    EXPECT_FALSE(cellToNumber(Cell{std::string("12abc")}).has_value());
    EXPECT_FALSE(cellToNumber(Cell{}).has_value());
}

TEST(CellTest, IntegerViewChecksRangeAndIntegrality) {
    EXPECT_EQ(cellToIntegerIn(Cell{60.0}, 1, 60), 60);
    EXPECT_FALSE(cellToIntegerIn(Cell{61.0}, 1, 60).has_value());
    EXPECT_FALSE(cellToIntegerIn(Cell{0.0}, 1, 60).has_value());
    EXPECT_FALSE(cellToIntegerIn(Cell{2.5}, 1, 60).has_value());
    EXPECT_FALSE(cellToIntegerIn(Cell{1e300}, 1, 60).has_value());
}
