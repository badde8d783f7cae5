#pragma once

#include "DrawExtractor.h"
#include "DrawTypes.h"
#include "LotteryProfile.h"
#include "TableReader.h"

#include <string>
#include <vector>

struct IngestOptions {
    TableReadOptions read;
    // Rethrow the first failed file (input order) as FileProcessingError once all files ran.
    bool failFast = true;
    bool verbose = false;
};

struct FileOutcome {
    std::string path;
    std::string fileName;
    bool ok = false;
    std::string error;
    ExtractionStats extraction;
};

struct IngestionResult {
    std::vector<std::string> fileNames;
    std::vector<FileOutcome> outcomes;
    DrawHistory history;
};

class DrawIngestor {
public:
    /**
     * @brief TableReader -> HeaderLocator -> DrawExtractor for one file.
     * @throws LottoLens::MalformedFileError / LottoLens::HeaderNotFoundError.
     */
    static std::vector<Draw> ingestFile(const std::string& path,
                                        const LotteryProfile& profile,
                                        const TableReadOptions& readOptions = TableReadOptions{},
                                        ExtractionStats* stats = nullptr);

    /**
     * @brief Reads every file (in parallel when built with OpenMP), then merges them in input order.
     * @throws LottoLens::FileProcessingError when failFast is set and a file failed.
     * @throws LottoLens::NoValidDrawsError when no draw survives the merge.
     */
    static IngestionResult ingest(const std::vector<std::string>& paths,
                                  const LotteryProfile& profile,
                                  const IngestOptions& options = IngestOptions{});
};
