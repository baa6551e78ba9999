#pragma once

#include <memory>
#include <string>
#include <vector>

#include "currency.hpp"
#include "exchange_rate.hpp"
#include "feed_fetcher.hpp"
#include "provider_config.hpp"

/**
 * @brief Returns the exchange rates declared by the source for the requested currencies.
 *
 * Only rates present in the feeds are returned. If the source has "CZK/USD"
 * but not "USD/CZK", no "USD/CZK" is computed as 1 / "CZK/USD". Currencies
 * the source does not provide are ignored.
 */
class ExchangeRateProvider {
   public:
    /**
     * @param commonCurrenciesUrl Primary feed, must not be empty
     * @param otherCurrenciesUrl Fallback feed, must not be empty
     * @param fetcher Transport shared by every call, must not be null
     * @throws InvalidArgument on an empty URL or null fetcher
     */
    ExchangeRateProvider(std::string commonCurrenciesUrl, std::string otherCurrenciesUrl,
                         std::shared_ptr<IFeedFetcher> fetcher);

    /**
     * @brief Provider over a CurlFeedFetcher built from the config's fetch options.
     */
    explicit ExchangeRateProvider(const ProviderConfig& config);

    /**
     * @brief Fetch the rates of `currencies`, common feed first.
     *
     * The other feed is queried only when the common feed yields fewer rates
     * than currencies were requested. This is a count heuristic: it does not
     * check which currencies are missing. Results are concatenated without
     * deduplication.
     *
     * @return Rates in feed order; empty without any fetch if `currencies` is empty
     * @throws FetchError if either feed query fails; nothing is returned then
     */
    [[nodiscard]] std::vector<ExchangeRate> getRates(const std::vector<Currency>& currencies) const;

    [[nodiscard]] const std::string& commonCurrenciesUrl() const noexcept { return common_url_; }
    [[nodiscard]] const std::string& otherCurrenciesUrl() const noexcept { return other_url_; }

   private:
    std::string                   common_url_;
    std::string                   other_url_;
    std::shared_ptr<IFeedFetcher> fetcher_;

    [[nodiscard]] std::vector<ExchangeRate> fetchAndExtract(const std::string&           url,
                                                            const std::vector<Currency>& currencies) const;
};
