#include <limits>
#include <utility>

#include "exchange_rate.hpp"

ExchangeRate::ExchangeRate(Currency currency, int amount, Decimal rate)
    : currency_(std::move(currency))
    , amount_(amount)
    , rate_(std::move(rate)) {
    if (amount_ <= 0) {
        throw InvalidArgument("Exchange rate amount must be positive: " + std::to_string(amount_));
    }
    if (rate_ < 0) {
        throw InvalidArgument("Exchange rate cannot be negative: " + formatDecimal(rate_));
    }
}

std::string ExchangeRate::toString() const {
    return currency_.code() + " " + std::to_string(amount_) + " = " + formatDecimal(rate_);
}

nlohmann::json ExchangeRate::toJson() const {
    return {
        {"currency", currency_.code()},
        {"amount", amount_},
        {"rate", formatDecimal(rate_)},
    };
}

std::string formatDecimal(const Decimal& value) {
    /* fixed never switches to exponent form; pad to full precision, then trim */
    auto text = value.str(std::numeric_limits<Decimal>::digits10, std::ios_base::fixed);

    if (text.find('.') != std::string::npos) {
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.') {
            text.pop_back();
        }
    }
    return text;
}
