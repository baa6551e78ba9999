#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>

#include "errors.hpp"
#include "feed_fetcher.hpp"

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

}  // namespace

void CurlFeedFetcher::init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlFeedFetcher::close() {
    curl_global_cleanup();
}

CurlFeedFetcher::CurlFeedFetcher(FetchOptions options)
    : options_(std::move(options)) {}

std::string CurlFeedFetcher::fetch(const std::string& url) {
    if (url.empty()) {
        throw InvalidArgument("URL cannot be null or empty.");
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw FetchError(url, "curl_easy_init() failed");
    }

    std::string buffer("");
    char        errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, options_.followRedirects ? 1L : 0L);
    if (!options_.userAgent.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());
    }
    if (options_.timeoutSeconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeoutSeconds);
    }
    if (options_.connectTimeoutSeconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw FetchError(url, errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    /* file:// and similar schemes report 0 */
    if (status != 0 && (status < 200 || status >= 300)) {
        throw FetchError(url, "HTTP status " + std::to_string(status), status);
    }

    return buffer;
}

std::size_t CurlFeedFetcher::write(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}
