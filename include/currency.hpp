#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

#include "errors.hpp"

/**
 * @brief ISO-4217 style currency code, compared case-sensitively.
 * @example "USD", "EUR", "JPY"
 */
class Currency {
   public:
    explicit Currency(std::string code)
        : code_(std::move(code)) {
        if (code_.empty()) {
            throw InvalidArgument("Currency code cannot be empty.");
        }
    }

    [[nodiscard]] const std::string& code() const noexcept { return code_; }

    bool operator==(const Currency& other) const { return code_ == other.code_; }
    bool operator!=(const Currency& other) const { return code_ != other.code_; }
    bool operator<(const Currency& other) const { return code_ < other.code_; }

   private:
    std::string code_;
};

inline std::ostream& operator<<(std::ostream& os, const Currency& currency) {
    return os << currency.code();
}

namespace std {
template <>
struct hash<Currency> {
    std::size_t operator()(const Currency& currency) const noexcept {
        return std::hash<std::string>{}(currency.code());
    }
};
}  // namespace std
