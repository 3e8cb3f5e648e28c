#ifndef RATIONAL_INTERVAL_HPP
#define RATIONAL_INTERVAL_HPP

/**
 * @file rational_interval.hpp
 * @brief Exact interval arithmetic for the arithmetic coder
 *
 * Message intervals [u, v) and the dyadic intervals [n/d, (n+1)/d) induced
 * by binary codes are both represented with GMP integers and rationals, so
 * every containment test is exact. The numerators and denominators grow
 * with the message; the only bound is available memory.
 */

#include "bit_stream.hpp"
#include <gmpxx.h>
#include <cstddef>
#include <ostream>

/// Exact rational number, always kept in canonical form.
using Rational = mpq_class;

/**
 * @brief Half-open real interval [low, high).
 */
struct Interval {
    Rational low;
    Rational high;

    /// The unit interval [0, 1).
    Interval();
    Interval(const Rational& lo, const Rational& hi);

    Rational width() const;

    /**
     * @brief Returns true if the interval holds no points (low >= high).
     */
    bool empty() const;

    /**
     * @brief Upper half [low + width/2, high).
     */
    Interval upper_half() const;

    /**
     * @brief Sub-interval selected by a cumulative range [F_lo, F_hi) of [0, 1).
     *
     * Returns [low + width*F_lo, low + width*F_hi).
     */
    Interval narrow(const Interval& cumulative) const;

    /**
     * @brief True if other is a subset of this interval.
     */
    bool contains(const Interval& other) const;

    /**
     * @brief True if low <= point < high.
     */
    bool contains(const Rational& point) const;
};

bool operator==(const Interval& lhs, const Interval& rhs);
bool operator!=(const Interval& lhs, const Interval& rhs);
std::ostream& operator<<(std::ostream& os, const Interval& interval);

/**
 * @brief Dyadic interval [n/d, m/d) of a binary code, with m = n + 1 and d = 2^length.
 */
struct DyadicInterval {
    mpz_class numerator;    ///< n, the code read as a base-2 integer
    mpz_class denominator;  ///< d = 2^length
    size_t length;          ///< number of bits in the code

    /// Dyadic interval of the empty code: n = 0, d = 1.
    DyadicInterval();

    /// m = n + 1
    mpz_class upper_numerator() const;

    /**
     * @brief Interval of the code extended by one bit: n' = 2n + bit, d' = 2d.
     */
    DyadicInterval append(bool bit) const;

    /// n/d as a rational.
    Rational lower_bound() const;

    /// m/d as a rational.
    Rational upper_bound() const;
};

/**
 * @brief Compute (n, m, d) for a code: n = value(code), m = n + 1, d = 2^|code|.
 *
 * The empty code maps to n = 0, m = 1, d = 1, i.e. the whole unit interval.
 */
DyadicInterval binary_interval(const BitCode& code);

#endif // RATIONAL_INTERVAL_HPP
