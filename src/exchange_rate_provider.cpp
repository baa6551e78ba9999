#include <iostream>
#include <iterator>
#include <utility>

#include "errors.hpp"
#include "exchange_rate_provider.hpp"
#include "rate_extractor.hpp"

ExchangeRateProvider::ExchangeRateProvider(std::string commonCurrenciesUrl, std::string otherCurrenciesUrl,
                                           std::shared_ptr<IFeedFetcher> fetcher)
    : common_url_(std::move(commonCurrenciesUrl))
    , other_url_(std::move(otherCurrenciesUrl))
    , fetcher_(std::move(fetcher)) {
    if (common_url_.empty()) {
        throw InvalidArgument("Common currencies URL cannot be null or empty.");
    }
    if (other_url_.empty()) {
        throw InvalidArgument("Other currencies URL cannot be null or empty.");
    }
    if (!fetcher_) {
        throw InvalidArgument("Feed fetcher cannot be null.");
    }
}

ExchangeRateProvider::ExchangeRateProvider(const ProviderConfig& config)
    : ExchangeRateProvider(config.commonCurrenciesUrl, config.otherCurrenciesUrl,
                           std::make_shared<CurlFeedFetcher>(config.fetch)) {}

std::vector<ExchangeRate> ExchangeRateProvider::getRates(const std::vector<Currency>& currencies) const {
    if (currencies.empty()) {
        return {};
    }

    std::cerr << "Fetching common currencies..." << std::endl;
    auto rates = fetchAndExtract(common_url_, currencies);
    std::cerr << "  [OK] " << rates.size() << " of " << currencies.size() << " rates" << std::endl;

    /* count heuristic, not a per-currency check */
    if (currencies.size() > rates.size()) {
        std::cerr << "Fetching other currencies..." << std::endl;
        auto additional = fetchAndExtract(other_url_, currencies);
        std::cerr << "  [OK] " << additional.size() << " additional rates" << std::endl;

        rates.insert(rates.end(), std::make_move_iterator(additional.begin()),
                     std::make_move_iterator(additional.end()));
    }

    return rates;
}

std::vector<ExchangeRate> ExchangeRateProvider::fetchAndExtract(const std::string&           url,
                                                                const std::vector<Currency>& currencies) const {
    const auto content = fetcher_->fetch(url);
    return RateExtractor::extract(content, currencies);
}
