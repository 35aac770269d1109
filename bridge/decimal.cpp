#include "decimal.hpp"
#include <cstdlib>
#include <stdexcept>
#include <utility>

using boost::multiprecision::cpp_int;

namespace {

// Adds one unit in the last place to a string of decimal digits.
void increment_digits(std::string& digits) {
    for (size_t i = digits.size(); i-- > 0;) {
        if (digits[i] == '9') {
            digits[i] = '0';
        } else {
            digits[i]++;
            return;
        }
    }
    digits.insert(digits.begin(), '1');
}

// Next digit of rem / den by long division; rem keeps the remainder.
char next_digit(cpp_int& rem, const cpp_int& den) {
    rem *= 10;
    cpp_int digit = rem / den;
    rem %= den;
    return static_cast<char>('0' + digit.convert_to<int>());
}

}

Decimal::Decimal(cpp_int numerator, cpp_int denominator)
    : num(std::move(numerator)),
      den(std::move(denominator)) {
    if (den == 0) {
        throw std::logic_error("Decimal with zero denominator");
    }
    if (den < 0) {
        num = -num;
        den = -den;
    }
    cpp_int magnitude = boost::multiprecision::abs(num);
    cpp_int g = boost::multiprecision::gcd(magnitude, den);
    if (g > 1) {
        num /= g;
        den /= g;
    }
}

bool Decimal::terminates() const {
    cpp_int d = den;
    while (d % 2 == 0) d /= 2;
    while (d % 5 == 0) d /= 5;
    return d == 1;
}

std::string Decimal::to_string() const {
    const cpp_int abs_num = boost::multiprecision::abs(num);
    const cpp_int whole = abs_num / den;
    cpp_int rem = abs_num % den;

    std::string out = num < 0 ? "-" : "";
    std::string int_digits = whole.str();
    if (rem == 0) {
        return out + int_digits;
    }

    std::string frac_digits;
    if (terminates()) {
        while (rem != 0) {
            frac_digits += next_digit(rem, den);
        }
        return out + int_digits + "." + frac_digits;
    }

    // Non-terminating: keep kSignificantDigits digits, then round on the next
    // one. The exact value never sits on a half, so comparing that digit to 5
    // is a correct round-to-nearest.
    int significant = whole != 0 ? static_cast<int>(int_digits.size()) : 0;
    while (significant < kSignificantDigits) {
        char digit = next_digit(rem, den);
        frac_digits += digit;
        if (significant > 0 || digit != '0') {
            significant++;
        }
    }
    bool round_up = next_digit(rem, den) >= '5';

    if (round_up) {
        std::string all = int_digits + frac_digits;
        increment_digits(all);
        size_t split = all.size() - frac_digits.size();
        int_digits = all.substr(0, split);
        frac_digits = all.substr(split);
    }
    while (!frac_digits.empty() && frac_digits.back() == '0') {
        frac_digits.pop_back();
    }
    if (frac_digits.empty()) {
        return out + int_digits;
    }
    return out + int_digits + "." + frac_digits;
}

double Decimal::to_double() const {
    return std::strtod(to_string().c_str(), nullptr);
}

Decimal convert_reading(int64_t raw, int64_t multiplier, int64_t divisor) {
    if (divisor == 0) {
        throw std::logic_error("Reading divisor is zero");
    }
    return Decimal(cpp_int(raw) * multiplier, cpp_int(divisor));
}
