#pragma once

#include <cstddef>
#include <string>

/**
 * @brief Retrieves the raw text of a feed.
 *
 * Implementations perform exactly one request per call and never retry.
 * They must tolerate overlapping calls from different threads.
 */
struct IFeedFetcher {
    virtual ~IFeedFetcher() = default;

    /**
     * @brief Fetch the body of `url`.
     * @param url Feed location, must not be empty
     * @return Response body
     * @throws InvalidArgument if url is empty
     * @throws FetchError on transport failure or a non-2xx status
     */
    [[nodiscard]] virtual std::string fetch(const std::string& url) = 0;
};

struct FetchOptions {
    /**
     * @brief User-Agent header sent with every request; empty sends none.
     * @example "libexrates/1.0"
     */
    std::string userAgent = "libexrates/1.0";

    /**
     * @brief Whole-transfer timeout in seconds, 0 for none.
     */
    long timeoutSeconds = 0;

    /**
     * @brief Connection phase timeout in seconds, 0 for libcurl's default.
     */
    long connectTimeoutSeconds = 0;

    bool followRedirects = true;
};

/**
 * @brief libcurl-backed fetcher. Each call uses its own easy handle.
 */
class CurlFeedFetcher : public IFeedFetcher {
   public:
    /**
     * @brief Process-wide libcurl setup; call once before any fetch.
     */
    static void init();
    static void close();

    explicit CurlFeedFetcher(FetchOptions options = {});

    [[nodiscard]] std::string fetch(const std::string& url) override;

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

   private:
    FetchOptions options_;

    static std::size_t write(void* contents, std::size_t size, std::size_t nmemb, void* userp);
};
