#pragma once

#include "DrawTypes.h"
#include "LotteryProfile.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct AnalysisConfig {
    std::vector<std::string> inputPaths;

    std::string profileKey = "mega-sena";
    std::optional<int> totalNumbers;
    std::optional<int> drawSize;
    std::optional<int> betSize;
    std::optional<int> hotCount;
    std::optional<int> coldCount;

    char delimiter = 0;  // 0 => sniff per file
    std::optional<DrawDate> from;
    std::optional<DrawDate> to;
    std::optional<uint32_t> seed;
    int regenerateRounds = 0;
    bool strict = false;
    bool verbose = false;
    bool showHelp = false;

    std::string reportFile;
    std::string exportCsvPath;
    std::string exportParquetPath;

    std::vector<int> customHot;
    std::vector<int> customCold;

    /**
     * @brief Preset named by profileKey with the explicit field overrides applied.
     * @throws LottoLens::ConfigurationException for an unknown preset.
     */
    LotteryProfile profile() const;

    /**
     * @brief Builds config from CLI args. A --config file is applied first, flags override it.
     * @throws LottoLens::ConfigurationException on invalid arguments or values.
     */
    static AnalysisConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads `key: value` lines (loose YAML/JSON, '#' comments) on top of `base`.
     * @throws LottoLens::ConfigurationException on unreadable files, unknown keys or bad values.
     */
    static AnalysisConfig fromFile(const std::string& configPath, const AnalysisConfig& base);

    /**
     * @throws LottoLens::ConfigurationException when the merged configuration is inconsistent.
     */
    void validate() const;

    static std::string usage(const std::string& prog);
};
