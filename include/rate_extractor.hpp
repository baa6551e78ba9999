#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "currency.hpp"
#include "exchange_rate.hpp"

/**
 * @brief Parses the pipe-delimited rate feed.
 *
 * Record layout: `name|reference|amount|code|rate`, one per line.
 * The first two fields are opaque and ignored.
 */
class RateExtractor {
   public:
    static constexpr char        line_delimiter_  = '\n';
    static constexpr char        field_delimiter_ = '|';
    static constexpr std::size_t field_count_     = 5;
    static constexpr std::size_t code_length_     = 3;

    RateExtractor() = delete;

    /**
     * @brief Extract the rates of the requested currencies, in line order.
     *
     * Malformed lines and lines for unrequested currencies are skipped.
     *
     * @param content Feed text, must not be empty
     * @param currencies Requested currencies; an empty list yields no rates
     * @return Rates present in the feed for the requested currencies
     * @throws InvalidArgument if content is empty
     */
    [[nodiscard]] static std::vector<ExchangeRate> extract(const std::string&           content,
                                                           const std::vector<Currency>& currencies);

    /**
     * @brief Parse a whole number, ignoring surrounding whitespace.
     * @example "100" -> 100, " 1\r" -> 1, "1.5" -> nullopt
     */
    [[nodiscard]] static std::optional<int> parseAmount(std::string_view field);

    /**
     * @brief Parse a plain decimal; '.' or ',' separator, no exponent or grouping.
     * @example "21.345" -> 21.345, "21,345" -> 21.345, "n/a" -> nullopt
     */
    [[nodiscard]] static std::optional<Decimal> parseRate(std::string_view field);

   private:
    static std::vector<std::string_view> split(std::string_view text, char delimiter);
    static std::string_view              trim(std::string_view text);
};
