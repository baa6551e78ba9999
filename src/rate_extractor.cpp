#include <cctype>
#include <charconv>
#include <unordered_set>

#include "errors.hpp"
#include "rate_extractor.hpp"

std::vector<ExchangeRate> RateExtractor::extract(const std::string&           content,
                                                 const std::vector<Currency>& currencies) {
    if (content.empty()) {
        throw InvalidArgument("Content cannot be null or empty.");
    }

    std::vector<ExchangeRate> rates;
    if (currencies.empty()) {
        return rates;
    }

    std::unordered_set<std::string_view> codes;
    for (const auto& currency : currencies) {
        codes.insert(currency.code());
    }

    for (const auto& line : split(content, line_delimiter_)) {
        const auto fields = split(line, field_delimiter_);

        /* candidate record: 5 fields, 3-character code (length checked untrimmed) */
        if (fields.size() != field_count_ || fields[3].size() != code_length_) {
            continue;
        }
        if (codes.find(fields[3]) == codes.end()) {
            continue;
        }

        const auto amount = parseAmount(fields[2]);
        const auto rate   = parseRate(fields[4]);
        if (!amount || !rate || *amount <= 0 || *rate < 0) {
            continue;
        }

        rates.emplace_back(Currency(std::string(fields[3])), *amount, *rate);
    }

    return rates;
}

std::optional<int> RateExtractor::parseAmount(std::string_view field) {
    field = trim(field);
    if (!field.empty() && field.front() == '+') {
        field.remove_prefix(1);
    }
    if (field.empty()) {
        return std::nullopt;
    }

    int        value = 0;
    const auto end   = field.data() + field.size();
    const auto [ptr, ec] = std::from_chars(field.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<Decimal> RateExtractor::parseRate(std::string_view field) {
    field = trim(field);

    std::string normalized;
    normalized.reserve(field.size());

    std::size_t i = 0;
    if (i < field.size() && (field[i] == '+' || field[i] == '-')) {
        if (field[i] == '-') {
            normalized.push_back('-');
        }
        ++i;
    }

    bool separator = false;
    bool digits    = false;
    for (; i < field.size(); ++i) {
        const char c = field[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            normalized.push_back(c);
            digits = true;
        } else if ((c == '.' || c == ',') && !separator) {
            normalized.push_back('.');
            separator = true;
        } else {
            return std::nullopt;
        }
    }
    if (!digits) {
        return std::nullopt;
    }

    return Decimal(normalized);
}

std::vector<std::string_view> RateExtractor::split(std::string_view text, char delimiter) {
    std::vector<std::string_view> parts;

    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string_view RateExtractor::trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}
