#pragma once

#include "DrawTypes.h"
#include "LotteryProfile.h"
#include "StatisticsAggregator.h"

#include <string>

class SnapshotExporter {
public:
    /**
     * @brief Number,Frequency,CurrentDelay,AverageInterval,MaxDelay; one row per number ascending.
     * @throws LottoLens::IOException when the file cannot be written.
     */
    static void writeNumberCsv(const StatisticsBundle& stats, const std::string& path);

    /**
     * @brief Writes the history as Parquet: contest (utf8), date (date32), n1..nK (int32).
     * @return false with errorOut set when the write fails or the build has no Parquet support.
     */
    static bool writeHistoryParquet(const DrawHistory& history,
                                    const LotteryProfile& profile,
                                    const std::string& path,
                                    std::string& errorOut);

    static bool parquetSupported() noexcept;
};
