#include "rational_interval.hpp"

// ============================================================================
//  Interval
// ============================================================================

Interval::Interval() : low(0), high(1) {
}

Interval::Interval(const Rational& lo, const Rational& hi) : low(lo), high(hi) {
}

Rational Interval::width() const {
    return high - low;
}

bool Interval::empty() const {
    return low >= high;
}

Interval Interval::upper_half() const {
    Rational middle = low + (high - low) / 2;
    return Interval(middle, high);
}

Interval Interval::narrow(const Interval& cumulative) const {
    Rational w = width();
    Rational lo = low + w * cumulative.low;
    Rational hi = low + w * cumulative.high;
    return Interval(lo, hi);
}

bool Interval::contains(const Interval& other) const {
    return low <= other.low && other.high <= high;
}

bool Interval::contains(const Rational& point) const {
    return low <= point && point < high;
}

bool operator==(const Interval& lhs, const Interval& rhs) {
    return lhs.low == rhs.low && lhs.high == rhs.high;
}

bool operator!=(const Interval& lhs, const Interval& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Interval& interval) {
    return os << "[" << interval.low << ", " << interval.high << ")";
}

// ============================================================================
//  DyadicInterval
// ============================================================================

DyadicInterval::DyadicInterval() : numerator(0), denominator(1), length(0) {
}

mpz_class DyadicInterval::upper_numerator() const {
    return numerator + 1;
}

DyadicInterval DyadicInterval::append(bool bit) const {
    DyadicInterval extended;
    extended.numerator = numerator * 2 + (bit ? 1 : 0);
    extended.denominator = denominator * 2;
    extended.length = length + 1;
    return extended;
}

Rational DyadicInterval::lower_bound() const {
    Rational r(numerator, denominator);
    r.canonicalize();
    return r;
}

Rational DyadicInterval::upper_bound() const {
    Rational r(upper_numerator(), denominator);
    r.canonicalize();
    return r;
}

DyadicInterval binary_interval(const BitCode& code) {
    DyadicInterval result;
    result.numerator = 0;
    for (bool bit : code) {
        result.numerator = result.numerator * 2 + (bit ? 1 : 0);
    }
    result.length = code.size();
    result.denominator = mpz_class(1) << static_cast<mp_bitcnt_t>(code.size());
    return result;
}
