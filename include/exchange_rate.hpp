#pragma once

#include <string>

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <nlohmann/json.hpp>

#include "currency.hpp"

/**
 * @brief Base-10 decimal with 50 significant digits; "21.345" is stored exactly.
 */
using Decimal = boost::multiprecision::cpp_dec_float_50;

/**
 * @brief A rate as declared by the feed: `amount` units of `currency`
 *        are worth `rate` units of the feed's reference currency.
 *
 * The reference currency is implicit and not stored.
 */
class ExchangeRate {
   public:
    /**
     * @throws InvalidArgument if amount <= 0 or rate < 0
     */
    ExchangeRate(Currency currency, int amount, Decimal rate);

    [[nodiscard]] const Currency& currency() const noexcept { return currency_; }

    /**
     * @brief Unit size the rate applies to.
     * @example 1, 100, 1000
     */
    [[nodiscard]] int amount() const noexcept { return amount_; }

    /**
     * @example 21.345
     */
    [[nodiscard]] const Decimal& rate() const noexcept { return rate_; }

    /**
     * @example "USD 100 = 21.345"
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief JSON form; the rate is a string so no digits are lost.
     * @example {"currency": "USD", "amount": 100, "rate": "21.345"}
     */
    [[nodiscard]] nlohmann::json toJson() const;

   private:
    Currency currency_;
    int      amount_;
    Decimal  rate_;
};

/**
 * @brief Shortest decimal text of a rate, without exponent.
 */
std::string formatDecimal(const Decimal& value);
