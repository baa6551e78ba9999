#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cli_options.hpp"
#include "errors.hpp"
#include "exchange_rate_provider.hpp"

struct Defer {
    std::function<void()> f;
    explicit Defer(std::function<void()> f)
        : f(std::move(f)) {}
    ~Defer() {
        if (f) {
            f();
        }
    }
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--json] [--config <path>] [CODE...]\n"
              << "  --json           print rates as JSON on stdout\n"
              << "  --config <path>  config file (default: $EXRATES_CONFIG or config/exrates.json)\n"
              << "  CODE             currency code, e.g. USD EUR JPY" << std::endl;
}

void printTable(const std::vector<ExchangeRate>& rates) {
    // clang-format off
    std::clog
        << std::left  << std::setw(10) << "Currency"
        << std::right << std::setw(10) << "Amount"
        << std::right << std::setw(16) << "Rate"
        << std::endl;
    std::clog << std::string(36, '-') << std::endl;

    for (const auto& rate : rates) {
        std::clog
            << std::left  << std::setw(10) << rate.currency().code()
            << std::right << std::setw(10) << rate.amount()
            << std::right << std::setw(16) << formatDecimal(rate.rate())
            << std::endl;
    }
    // clang-format on
}

int main(int argc, char* argv[]) {
    /* parse arguments */
    const char* envConfig = std::getenv("EXRATES_CONFIG");

    CliOptions options;
    try {
        options = parseCliOptions(argc, argv, (envConfig && *envConfig) ? envConfig : "config/exrates.json");
    } catch (const InvalidArgument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    if (options.help) {
        printUsage(argv[0]);
        return 0;
    }

    auto& currencies = options.currencies;
    if (currencies.empty()) {
        for (const auto* code : {"USD", "EUR", "CZK", "JPY", "KES", "RUB", "THB", "TRY", "XYZ"}) {
            currencies.emplace_back(code);
        }
    }

    CurlFeedFetcher::init();

    Defer _cleanup([] { CurlFeedFetcher::close(); });

    try {
        const ExchangeRateProvider provider(ProviderConfig::load(options.configPath));

        const auto rates = provider.getRates(currencies);
        std::cerr << "Successfully retrieved " << rates.size() << " exchange rates." << std::endl;

        if (options.asJson) {
            auto out = nlohmann::json::array();
            for (const auto& rate : rates) {
                out.push_back(rate.toJson());
            }
            std::cout << out.dump(2) << std::endl;
        } else {
            printTable(rates);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const FetchError& e) {
        std::cerr << "Could not retrieve exchange rates: " << e.what() << std::endl;
        return 1;
    } catch (const InvalidArgument& e) {
        std::cerr << "Could not retrieve exchange rates: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
