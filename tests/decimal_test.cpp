#include "decimal.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

TEST(DecimalTest, ConvertsMeterScaling) {
    Decimal value = convert_reading(12345, 1, 1000);
    EXPECT_EQ(value.to_string(), "12.345");
    EXPECT_DOUBLE_EQ(value.to_double(), 12.345);
}

TEST(DecimalTest, ReducesToLowestTerms) {
    Decimal value = convert_reading(2000, 1, 1000);
    EXPECT_EQ(value, Decimal(2, 1));
    EXPECT_EQ(value.to_string(), "2");
}

TEST(DecimalTest, RepeatedConversionIsIdentical) {
    Decimal first = convert_reading(1884243, 1, 1000);
    Decimal second = convert_reading(1884243, 1, 1000);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.to_string(), second.to_string());
    EXPECT_EQ(first.to_string(), "1884.243");
}

TEST(DecimalTest, SmallValuesDoNotDrift) {
    // 0.1 accumulated in binary floating point is the classic failure.
    Decimal tenth = convert_reading(1, 1, 10);
    EXPECT_EQ(tenth.to_string(), "0.1");
    EXPECT_EQ(tenth.to_double(), 0.1);
    EXPECT_EQ(convert_reading(3, 1, 10).to_string(), "0.3");
}

TEST(DecimalTest, AppliesMultiplier) {
    EXPECT_EQ(convert_reading(25, 40, 1000).to_string(), "1");
    EXPECT_EQ(convert_reading(7, 3, 8).to_string(), "2.625");
}

TEST(DecimalTest, HandlesNegativeValues) {
    Decimal value = convert_reading(-1234, 1, 1000);
    EXPECT_EQ(value.to_string(), "-1.234");
    EXPECT_DOUBLE_EQ(value.to_double(), -1.234);
    EXPECT_EQ(Decimal(5, -10).to_string(), "-0.5");
}

TEST(DecimalTest, RoundsNonTerminatingQuotients) {
    EXPECT_EQ(convert_reading(1, 1, 3).to_string(), "0.3333333333333333333333333333");
    EXPECT_EQ(convert_reading(2, 1, 3).to_string(), "0.6666666666666666666666666667");
    EXPECT_FALSE(convert_reading(1, 1, 3).terminates());
    EXPECT_TRUE(convert_reading(1, 1, 80).terminates());
}

TEST(DecimalTest, ZeroDivisorIsAPreconditionFailure) {
    EXPECT_THROW(convert_reading(1, 1, 0), std::logic_error);
}

TEST(DecimalTest, WideSummationTimesMultiplierStaysExact) {
    // 48-bit summation register scaled by 0x10000 exceeds 64 bits.
    Decimal value = convert_reading(0xffffffffffffLL, 0x10000, 1000);
    EXPECT_EQ(value.to_string(), "18446744073709486.08");
    EXPECT_DOUBLE_EQ(value.to_double(), 18446744073709486.08);
}

TEST(DecimalTest, ExtremeInputsDoNotThrow) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(convert_reading(max, max, 1).to_string(), "85070591730234615847396907784232501249");
    EXPECT_EQ(convert_reading(std::numeric_limits<int64_t>::min(), -1, 1).to_string(), "9223372036854775808");
}
