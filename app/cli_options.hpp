#pragma once

#include <string>
#include <vector>

#include "currency.hpp"

struct CliOptions {
    bool asJson = false;
    bool help   = false;

    std::string configPath = "";

    /**
     * @brief Requested currencies in command-line order; empty when none were given.
     */
    std::vector<Currency> currencies;
};

/**
 * @brief Parse `exrates_cli` arguments.
 * @param defaultConfigPath Used unless --config is given
 * @throws InvalidArgument on an unknown flag, a missing --config value or an empty code
 */
[[nodiscard]] CliOptions parseCliOptions(int argc, const char* const argv[], const std::string& defaultConfigPath);
