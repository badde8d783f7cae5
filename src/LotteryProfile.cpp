#include "LotteryProfile.h"
#include "CommonUtils.h"
#include "LottoLensExceptions.h"


namespace {
struct PresetRow {
    const char* key;
    const char* name;
    int totalNumbers;
    int drawSize;
    int betSize;
};

constexpr int kDefaultHotColdCount = 10;

const PresetRow kPresets[] = {
    {"mega-sena", "Mega-Sena", 60, 6, 6},
    {"quina", "Quina", 80, 5, 5},
    {"lotofacil", "Lotofacil", 25, 15, 15},
    {"lotomania", "Lotomania", 100, 20, 50},
};
} // namespace

void LotteryProfile::validate() const {
    if (totalNumbers < 1) {
        throw LottoLens::ConfigurationException("total_numbers must be >= 1");
    }
    if (drawSize < 1 || drawSize > totalNumbers) {
        throw LottoLens::ConfigurationException("draw_size must be within [1, total_numbers]");
    }
    if (betSize < 1 || betSize > totalNumbers) {
        throw LottoLens::ConfigurationException("bet_size must be within [1, total_numbers]");
    }
    if (hotCount < 1 || hotCount > totalNumbers) {
        throw LottoLens::ConfigurationException("hot_count must be within [1, total_numbers]");
    }
    if (coldCount < 1 || coldCount > totalNumbers) {
        throw LottoLens::ConfigurationException("cold_count must be within [1, total_numbers]");
    }
}

LotteryProfile LotteryProfile::preset(const std::string& key) {
    const std::string wanted = CommonUtils::toLower(CommonUtils::trim(key));
    for (const auto& row : kPresets) {
        if (wanted != row.key) continue;
        LotteryProfile profile;
        profile.key = row.key;
        profile.name = row.name;
        profile.totalNumbers = row.totalNumbers;
        profile.drawSize = row.drawSize;
        profile.betSize = row.betSize;
        profile.hotCount = kDefaultHotColdCount;
        profile.coldCount = kDefaultHotColdCount;
        return profile;
    }

    std::string allowed;
    for (const auto& k : presetKeys()) {
        if (!allowed.empty()) allowed += "|";
        allowed += k;
    }
    throw LottoLens::ConfigurationException("Unknown lottery profile: " + key + " (expected " + allowed + ")");
}

std::vector<std::string> LotteryProfile::presetKeys() {
    std::vector<std::string> keys;
    for (const auto& row : kPresets) keys.emplace_back(row.key);
    return keys;
}
