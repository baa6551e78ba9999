#include <unordered_set>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "exchange_rate.hpp"

TEST(CurrencyTest, EqualityIsCaseSensitive) {
    EXPECT_EQ(Currency("USD"), Currency("USD"));
    EXPECT_NE(Currency("USD"), Currency("usd"));
    EXPECT_NE(Currency("USD"), Currency("EUR"));
}

TEST(CurrencyTest, EmptyCodeThrows) {
    EXPECT_THROW(Currency(""), InvalidArgument);
}

TEST(CurrencyTest, Hashable) {
    std::unordered_set<Currency> set{Currency("USD"), Currency("EUR"), Currency("USD")};
    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(set.count(Currency("EUR")), 1u);
}

TEST(ExchangeRateTest, KeepsDecimalDigits) {
    const ExchangeRate rate(Currency("USD"), 100, Decimal("21.345"));
    EXPECT_EQ(rate.currency(), Currency("USD"));
    EXPECT_EQ(rate.amount(), 100);
    EXPECT_EQ(rate.rate(), Decimal("21.345"));
    EXPECT_EQ(formatDecimal(rate.rate()), "21.345");
}

TEST(ExchangeRateTest, NonPositiveAmountThrows) {
    EXPECT_THROW(ExchangeRate(Currency("USD"), 0, Decimal("1")), InvalidArgument);
    EXPECT_THROW(ExchangeRate(Currency("USD"), -5, Decimal("1")), InvalidArgument);
}

TEST(ExchangeRateTest, NegativeRateThrows) {
    EXPECT_THROW(ExchangeRate(Currency("USD"), 1, Decimal("-0.5")), InvalidArgument);
    EXPECT_NO_THROW(ExchangeRate(Currency("USD"), 1, Decimal("0")));
}

TEST(ExchangeRateTest, TextAndJson) {
    const ExchangeRate rate(Currency("JPY"), 100, Decimal("15.802"));
    EXPECT_EQ(rate.toString(), "JPY 100 = 15.802");

    const auto json = rate.toJson();
    EXPECT_EQ(json["currency"], "JPY");
    EXPECT_EQ(json["amount"], 100);
    EXPECT_EQ(json["rate"], "15.802");
}

TEST(ExchangeRateTest, SmallRatesPrintWithoutExponent) {
    EXPECT_EQ(formatDecimal(Decimal("0.00001")), "0.00001");
    EXPECT_EQ(formatDecimal(Decimal("0.0000001")), "0.0000001");
    EXPECT_EQ(formatDecimal(Decimal("0.000123")), "0.000123");

    const ExchangeRate rate(Currency("VND"), 1, Decimal("0.00001"));
    EXPECT_EQ(rate.toString(), "VND 1 = 0.00001");
    EXPECT_EQ(rate.toJson()["rate"], "0.00001");
}

TEST(ExchangeRateTest, WholeAndZeroRatesHaveNoTrailingPoint) {
    EXPECT_EQ(formatDecimal(Decimal("7")), "7");
    EXPECT_EQ(formatDecimal(Decimal("17.380")), "17.38");
    EXPECT_EQ(formatDecimal(Decimal("1000")), "1000");
    EXPECT_EQ(formatDecimal(Decimal("0")), "0");
}
