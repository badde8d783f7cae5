#include "SnapshotExporter.h"
#include "CommonUtils.h"
#include "LottoLensExceptions.h"

#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

#ifdef LOTTOLENS_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

void SnapshotExporter::writeNumberCsv(const StatisticsBundle& stats, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw LottoLens::IOException("Unable to write statistics export: " + path);
    }

    std::vector<size_t> countByNumber(stats.intervals.size(), 0);
    for (const auto& f : stats.frequencies) {
        if (f.number >= 1 && static_cast<size_t>(f.number) <= countByNumber.size()) {
            countByNumber[static_cast<size_t>(f.number - 1)] = f.count;
        }
    }

    out << "Number,Frequency,CurrentDelay,AverageInterval,MaxDelay\n";
    for (const auto& s : stats.intervals) {
        out << s.number << ','
            << countByNumber[static_cast<size_t>(s.number - 1)] << ','
            << s.currentDelay << ','
            << CommonUtils::toFixed(s.averageInterval, 2) << ','
            << s.maxDelay << '\n';
    }
    if (!out) {
        throw LottoLens::IOException("Failed writing statistics export: " + path);
    }
}

bool SnapshotExporter::parquetSupported() noexcept {
#ifdef LOTTOLENS_USE_NATIVE_PARQUET
    return true;
#else
    return false;
#endif
}

#ifdef LOTTOLENS_USE_NATIVE_PARQUET
bool SnapshotExporter::writeHistoryParquet(const DrawHistory& history,
                                           const LotteryProfile& profile,
                                           const std::string& path,
                                           std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    const size_t numberColumns = static_cast<size_t>(profile.drawSize);

    {
        arrow::StringBuilder builder;
        for (const auto& d : history) {
            if (!builder.Append(d.contestId).ok()) {
                errorOut = "Failed to append contest id '" + d.contestId + "'";
                return false;
            }
        }
        std::shared_ptr<arrow::Array> arr;
        auto status = builder.Finish(&arr);
        if (!status.ok()) {
            errorOut = "Failed to finalize contest column: " + status.ToString();
            return false;
        }
        fields.push_back(arrow::field("contest", arrow::utf8(), false));
        arrays.push_back(arr);
    }

    {
        arrow::Date32Builder builder;
        for (const auto& d : history) {
            if (!builder.Append(static_cast<int32_t>(d.date.toDays())).ok()) {
                errorOut = "Failed to append date for contest '" + d.contestId + "'";
                return false;
            }
        }
        std::shared_ptr<arrow::Array> arr;
        auto status = builder.Finish(&arr);
        if (!status.ok()) {
            errorOut = "Failed to finalize date column: " + status.ToString();
            return false;
        }
        fields.push_back(arrow::field("date", arrow::date32(), false));
        arrays.push_back(arr);
    }

    for (size_t k = 0; k < numberColumns; ++k) {
        const std::string name = "n" + std::to_string(k + 1);
        arrow::Int32Builder builder;
        for (const auto& d : history) {
            const auto status = k < d.numbers.size() ? builder.Append(d.numbers[k]) : builder.AppendNull();
            if (!status.ok()) {
                errorOut = "Failed to append value for column '" + name + "'";
                return false;
            }
        }
        std::shared_ptr<arrow::Array> arr;
        auto status = builder.Finish(&arr);
        if (!status.ok()) {
            errorOut = "Failed to finalize column '" + name + "': " + status.ToString();
            return false;
        }
        fields.push_back(arrow::field(name, arrow::int32(), true));
        arrays.push_back(arr);
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(history.size()));

    auto outRes = arrow::io::FileOutputStream::Open(path);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, static_cast<int64_t>(history.size()));
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#else
bool SnapshotExporter::writeHistoryParquet(const DrawHistory&,
                                           const LotteryProfile&,
                                           const std::string&,
                                           std::string& errorOut) {
    errorOut = "this build was compiled without native parquet support; rebuild with LOTTOLENS_USE_NATIVE_PARQUET=ON";
    return false;
}
#endif
