#include "DrawIngestor.h"
#include "DrawConsolidator.h"
#include "HeaderLocator.h"
#include "LottoLensExceptions.h"

#include <exception>
#include <filesystem>
#include <iostream>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct FileSlot {
    std::vector<Draw> draws;
    ExtractionStats stats;
    std::exception_ptr error;
};

std::string messageOf(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "unknown error";
    }
}
} // namespace

std::vector<Draw> DrawIngestor::ingestFile(const std::string& path,
                                           const LotteryProfile& profile,
                                           const TableReadOptions& readOptions,
                                           ExtractionStats* stats) {
    const RawGrid grid = TableReader::readFile(path, readOptions);
    const ColumnLayout layout = HeaderLocator::require(grid, profile);
    return DrawExtractor::extract(grid, layout, profile, stats);
}

IngestionResult DrawIngestor::ingest(const std::vector<std::string>& paths,
                                     const LotteryProfile& profile,
                                     const IngestOptions& options) {
    profile.validate();

    std::vector<FileSlot> slots(paths.size());
    const long fileCount = static_cast<long>(paths.size());

    // Each worker writes only its own slot; exceptions never leave the parallel region.
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long i = 0; i < fileCount; ++i) {
        FileSlot& slot = slots[static_cast<size_t>(i)];
        try {
            slot.draws = ingestFile(paths[static_cast<size_t>(i)], profile, options.read, &slot.stats);
        } catch (...) {
            slot.error = std::current_exception();
        }
    }

    IngestionResult result;
    DrawConsolidator consolidator;
    std::exception_ptr firstFailure;
    std::string firstFailureName;

    for (size_t i = 0; i < paths.size(); ++i) {
        FileOutcome outcome;
        outcome.path = paths[i];
        outcome.fileName = std::filesystem::path(paths[i]).filename().string();
        outcome.extraction = slots[i].stats;
        result.fileNames.push_back(outcome.fileName);

        if (slots[i].error) {
            outcome.error = messageOf(slots[i].error);
            if (!firstFailure) {
                firstFailure = slots[i].error;
                firstFailureName = outcome.fileName;
            }
            if (!options.failFast) {
                std::cerr << "[LottoLens][Warning] Skipping " << outcome.fileName << ": " << outcome.error << "\n";
            }
        } else {
            outcome.ok = true;
            consolidator.add(slots[i].draws);
            if (options.verbose) {
                const auto& st = outcome.extraction;
                std::cout << "[LottoLens][Ingest] " << outcome.fileName << ": " << st.accepted << " draws from "
                          << st.rowsScanned << " rows (dropped: " << st.missingContest << " no contest, "
                          << st.invalidDate << " bad date, " << st.wrongDrawSize << " wrong size)\n";
            }
        }
        result.outcomes.push_back(std::move(outcome));
    }

    if (firstFailure && options.failFast) {
        throw LottoLens::FileProcessingError(firstFailureName, messageOf(firstFailure));
    }

    result.history = consolidator.finish(profile);
    return result;
}
