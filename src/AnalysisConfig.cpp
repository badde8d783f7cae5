#include "AnalysisConfig.h"
#include "CommonUtils.h"
#include "DateParser.h"
#include "LottoLensExceptions.h"

#include <algorithm>
#include <fstream>
#include <limits>

namespace {
int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = 0;
    try {
        size_t pos = 0;
        parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw LottoLens::ConfigurationException("Invalid integer for " + key + ": " + value);
        }
    } catch (const LottoLens::LottoLensException&) {
        throw;
    } catch (const std::exception& ex) {
        throw LottoLens::ConfigurationException("Invalid integer for " + key + ": " + value + " (" + ex.what() + ")");
    }
    if (parsed < minValue) {
        throw LottoLens::ConfigurationException(key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    unsigned long long parsed = 0;
    try {
        size_t pos = 0;
        if (!value.empty() && value[0] == '-') {
            throw LottoLens::ConfigurationException(key + " must be non-negative");
        }
        parsed = std::stoull(value, &pos);
        if (pos != value.size()) {
            throw LottoLens::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
        }
    } catch (const LottoLens::LottoLensException&) {
        throw;
    } catch (const std::exception& ex) {
        throw LottoLens::ConfigurationException("Invalid unsigned integer for " + key + ": " + value + " (" + ex.what() + ")");
    }
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw LottoLens::ConfigurationException(key + " exceeds 32-bit range");
    }
    return static_cast<uint32_t>(parsed);
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw LottoLens::ConfigurationException("Invalid boolean for " + key + ": " + value + " (expected true/false)");
}

DrawDate parseDateStrict(const std::string& value, const std::string& key) {
    const auto date = DateParser::parseIso(value);
    if (!date) {
        throw LottoLens::ConfigurationException("Invalid date for " + key + ": " + value + " (expected yyyy-mm-dd)");
    }
    return *date;
}

char parseDelimiter(const std::string& value, const std::string& key) {
    const std::string lowered = CommonUtils::toLower(value);
    if (lowered == "auto") return 0;
    if (lowered == "tab" || value == "\\t") return '\t';
    if (value.size() != 1) throw LottoLens::ConfigurationException(key + " expects a single character, 'tab' or 'auto'");
    const char c = value[0];
    if (c == '"' || c == '\n' || c == '\r') {
        throw LottoLens::ConfigurationException("Invalid delimiter character for " + key);
    }
    return c;
}

std::vector<int> parseIntList(const std::string& value, const std::string& key) {
    std::vector<int> out;
    for (const auto& token : CommonUtils::splitList(value)) {
        out.push_back(parseIntStrict(token, key, 1));
    }
    return out;
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

// Shared by the config file (snake_case keys) and the CLI (flags mapped to the same keys).
bool assignKeyValue(AnalysisConfig& config, const std::string& key, const std::string& value) {
    if (key == "profile") {
        config.profileKey = CommonUtils::toLower(value);
    } else if (key == "total_numbers") {
        config.totalNumbers = parseIntStrict(value, key, 1);
    } else if (key == "draw_size") {
        config.drawSize = parseIntStrict(value, key, 1);
    } else if (key == "bet_size") {
        config.betSize = parseIntStrict(value, key, 1);
    } else if (key == "hot_count") {
        config.hotCount = parseIntStrict(value, key, 1);
    } else if (key == "cold_count") {
        config.coldCount = parseIntStrict(value, key, 1);
    } else if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
    } else if (key == "from") {
        config.from = parseDateStrict(value, key);
    } else if (key == "to") {
        config.to = parseDateStrict(value, key);
    } else if (key == "seed") {
        config.seed = parseUIntStrict(value, key);
    } else if (key == "regenerate") {
        config.regenerateRounds = parseIntStrict(value, key, 0);
    } else if (key == "strict") {
        config.strict = parseBoolStrict(value, key);
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else if (key == "report") {
        config.reportFile = value;
    } else if (key == "export_csv") {
        config.exportCsvPath = value;
    } else if (key == "export_parquet") {
        config.exportParquetPath = value;
    } else if (key == "custom") {
        const std::vector<int> picks = parseIntList(value, key);
        if (picks.size() != 4) {
            throw LottoLens::ConfigurationException(key + " expects four numbers: hot1,hot2,cold1,cold2");
        }
        config.customHot.assign(picks.begin(), picks.begin() + 2);
        config.customCold.assign(picks.begin() + 2, picks.end());
    } else if (key == "inputs") {
        for (const auto& path : CommonUtils::splitList(value)) config.inputPaths.push_back(path);
    } else {
        return false;
    }
    return true;
}
} // namespace

LotteryProfile AnalysisConfig::profile() const {
    LotteryProfile p = LotteryProfile::preset(profileKey);
    if (totalNumbers) p.totalNumbers = *totalNumbers;
    if (drawSize) p.drawSize = *drawSize;
    if (betSize) p.betSize = *betSize;
    if (hotCount) p.hotCount = *hotCount;
    if (coldCount) p.coldCount = *coldCount;
    if (totalNumbers || drawSize || betSize || hotCount || coldCount) {
        p.key = "custom";
        p.name += " (custom)";
    }
    return p;
}

void AnalysisConfig::validate() const {
    if (showHelp) return;
    if (inputPaths.empty()) {
        throw LottoLens::ConfigurationException("At least one input file is required");
    }
    const LotteryProfile resolved = profile();
    resolved.validate();
    if (from && to && *to < *from) {
        throw LottoLens::ConfigurationException("--to must not be earlier than --from");
    }
    if (regenerateRounds < 0) {
        throw LottoLens::ConfigurationException("regenerate must be >= 0");
    }
    for (int pick : customHot) {
        if (!resolved.inRange(pick)) throw LottoLens::ConfigurationException("custom pick out of range: " + std::to_string(pick));
    }
    for (int pick : customCold) {
        if (!resolved.inRange(pick)) throw LottoLens::ConfigurationException("custom pick out of range: " + std::to_string(pick));
    }
}

AnalysisConfig AnalysisConfig::fromFile(const std::string& configPath, const AnalysisConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw LottoLens::ConfigurationException("Could not open config file: " + configPath);

    AnalysisConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            if (!assignKeyValue(config, key, value)) {
                throw LottoLens::ConfigurationException("unknown key '" + key + "'");
            }
        } catch (const LottoLens::LottoLensException& ex) {
            throw LottoLens::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

AnalysisConfig AnalysisConfig::fromArgs(int argc, char* argv[]) {
    AnalysisConfig config;

    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config = fromFile(argv[i + 1], config);
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--strict") {
            config.strict = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg.rfind("--", 0) == 0 && i + 1 < argc) {
            const std::string key = normalizeConfigKey(arg.substr(2));
            if (!assignKeyValue(config, key, argv[++i])) {
                throw LottoLens::ConfigurationException("Unknown argument: " + arg);
            }
        } else if (arg.rfind("--", 0) == 0) {
            throw LottoLens::ConfigurationException("Missing value for " + arg);
        } else {
            config.inputPaths.push_back(arg);
        }
    }

    config.validate();
    return config;
}

std::string AnalysisConfig::usage(const std::string& prog) {
    return "Usage: " + prog + " <draws.csv|draws.xlsx>... [options]\n"
           "Options:\n"
           "  --profile <mega-sena|quina|lotofacil|lotomania>  Lottery game (default: mega-sena)\n"
           "  --total-numbers N --draw-size N --bet-size N      Override the game constants\n"
           "  --hot-count N --cold-count N                      Hot/cold list sizes (default: 10)\n"
           "  --config <file>                                   key: value file, flags override it\n"
           "  --delimiter <c|tab|auto>                          Field delimiter for text files (default: auto)\n"
           "  --from yyyy-mm-dd --to yyyy-mm-dd                 Restrict statistics to a date range\n"
           "  --seed N                                          Seed for suggestion picks\n"
           "  --regenerate N                                    Print N extra suggestion rounds\n"
           "  --custom h1,h2,c1,c2                              Build a custom game around two hot and two cold picks\n"
           "  --report <file.md>                                Write a markdown report\n"
           "  --export-csv <file>                               Per-number statistics snapshot\n"
           "  --export-parquet <file>                           Consolidated draw history (Parquet)\n"
           "  --strict                                          Abort when any file fails\n"
           "  --verbose                                         Per-file ingestion detail\n"
           "  --help                                            Show this help message\n";
}
