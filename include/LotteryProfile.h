#pragma once

#include <string>
#include <vector>

struct LotteryProfile {
    std::string key = "custom";
    std::string name = "Custom";
    int totalNumbers = 60;
    int drawSize = 6;
    int betSize = 6;
    int hotCount = 10;
    int coldCount = 10;

    bool inRange(int number) const noexcept { return number >= 1 && number <= totalNumbers; }

    /**
     * @throws LottoLens::ConfigurationException when sizes fall outside [1, totalNumbers].
     */
    void validate() const;

    /**
     * @brief Built-in games: mega-sena, quina, lotofacil, lotomania.
     * @throws LottoLens::ConfigurationException for an unknown key.
     */
    static LotteryProfile preset(const std::string& key);
    static std::vector<std::string> presetKeys();
};
