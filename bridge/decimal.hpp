// bridge/decimal.hpp
#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

// Exact rational quantity kept as a reduced fraction of arbitrary-precision
// integers. Meter readings are integer value * multiplier / divisor, so
// nothing is lost until the value is rendered or handed to the JSON layer
// as a double.
class Decimal {
private:
    boost::multiprecision::cpp_int num{0};
    boost::multiprecision::cpp_int den{1};

public:
    static constexpr int kSignificantDigits = 28;

    Decimal() = default;
    Decimal(boost::multiprecision::cpp_int numerator, boost::multiprecision::cpp_int denominator);

    bool terminates() const;

    std::string to_string() const;
    double to_double() const;

    bool operator==(const Decimal& other) const { return num == other.num && den == other.den; }
    bool operator!=(const Decimal& other) const { return !(*this == other); }
};

// raw * multiplier / divisor. A zero divisor is a broken device driver,
// not a retryable condition, and throws std::logic_error.
Decimal convert_reading(int64_t raw, int64_t multiplier, int64_t divisor);
