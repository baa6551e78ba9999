#include <fstream>

#include "errors.hpp"
#include "provider_config.hpp"

namespace {

std::string requireUrl(const nlohmann::json& config, const char* key, const std::string& source) {
    if (!config.contains(key) || !config[key].is_string()) {
        throw ConfigError(source, std::string("missing string key \"") + key + "\"");
    }
    auto url = config[key].get<std::string>();
    if (url.empty()) {
        throw ConfigError(source, std::string("\"") + key + "\" cannot be empty");
    }
    return url;
}

long optionalSeconds(const nlohmann::json& config, const char* key, const std::string& source) {
    if (!config.contains(key)) {
        return 0;
    }
    if (!config[key].is_number_integer() || config[key].get<long>() < 0) {
        throw ConfigError(source, std::string("\"") + key + "\" must be a non-negative integer");
    }
    return config[key].get<long>();
}

}  // namespace

ProviderConfig ProviderConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError(path, "cannot open file");
    }

    nlohmann::json config;
    try {
        f >> config;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(path, e.what());
    }
    return fromJson(config, path);
}

ProviderConfig ProviderConfig::fromJson(const nlohmann::json& config, const std::string& source) {
    if (!config.is_object()) {
        throw ConfigError(source, "top-level value must be an object");
    }

    ProviderConfig result;
    result.commonCurrenciesUrl = requireUrl(config, "commonCurrenciesUrl", source);
    result.otherCurrenciesUrl  = requireUrl(config, "otherCurrenciesUrl", source);

    result.fetch.timeoutSeconds        = optionalSeconds(config, "timeoutSeconds", source);
    result.fetch.connectTimeoutSeconds = optionalSeconds(config, "connectTimeoutSeconds", source);

    if (config.contains("userAgent")) {
        if (!config["userAgent"].is_string()) {
            throw ConfigError(source, "\"userAgent\" must be a string");
        }
        result.fetch.userAgent = config["userAgent"].get<std::string>();
    }
    if (config.contains("followRedirects")) {
        if (!config["followRedirects"].is_boolean()) {
            throw ConfigError(source, "\"followRedirects\" must be a boolean");
        }
        result.fetch.followRedirects = config["followRedirects"].get<bool>();
    }

    return result;
}
