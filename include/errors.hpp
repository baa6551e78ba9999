#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief A required argument is empty or otherwise unusable.
 *        Raised before any network activity.
 */
class InvalidArgument : public std::invalid_argument {
   public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief A feed could not be retrieved (transport failure or non-2xx status).
 */
class FetchError : public std::runtime_error {
   public:
    FetchError(const std::string& url, const std::string& reason, long status = 0)
        : std::runtime_error("Failed to retrieve data from " + url + ": " + reason)
        , url_(url)
        , status_(status) {}

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    /**
     * @brief HTTP status code, or 0 when no response was received.
     */
    [[nodiscard]] long status() const noexcept { return status_; }

   private:
    std::string url_;
    long        status_;
};

/**
 * @brief The configuration file is missing, unreadable or malformed.
 */
class ConfigError : public std::runtime_error {
   public:
    ConfigError(const std::string& path, const std::string& reason)
        : std::runtime_error("Config error in " + path + ": " + reason)
        , path_(path) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

   private:
    std::string path_;
};
