#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "feed_fetcher.hpp"

/**
 * @brief Feed locations and transport options, usually read from exrates.json.
 */
struct ProviderConfig {
    /**
     * @brief Primary feed, expected to cover most currencies.
     */
    std::string commonCurrenciesUrl = "";

    /**
     * @brief Fallback feed for the remaining currencies.
     */
    std::string otherCurrenciesUrl = "";

    FetchOptions fetch;

    /**
     * @brief Load configuration from a JSON file.
     * @param path Path to the JSON file
     * @throws ConfigError if the file is unreadable, malformed or lacks a URL
     */
    [[nodiscard]] static ProviderConfig load(const std::string& path);

    /**
     * @brief Build configuration from an already parsed JSON object.
     * @param source Name used in error messages (usually the file path)
     * @throws ConfigError on missing or mistyped keys
     */
    [[nodiscard]] static ProviderConfig fromJson(const nlohmann::json& config, const std::string& source = "<json>");
};
