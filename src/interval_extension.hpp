#ifndef INTERVAL_EXTENSION_HPP
#define INTERVAL_EXTENSION_HPP

/**
 * @file interval_extension.hpp
 * @brief Containment predicates and code extension against a target interval
 *
 * A binary code b1..bL names the dyadic interval [n/d, (n+1)/d) with
 * d = 2^L. During encoding the code must surround the message interval;
 * at termination it must lie inside the chosen final interval. Both
 * extension routines only ever append bits to the code they are given.
 */

#include "bit_stream.hpp"
#include "rational_interval.hpp"
#include <cstddef>

/**
 * @brief True iff n/d <= u and v <= m/d (the code's interval surrounds [u, v)).
 */
bool around(const BitCode& code, const Rational& u, const Rational& v);
bool around(const DyadicInterval& dyadic, const Rational& u, const Rational& v);

/**
 * @brief True iff u <= n/d and m/d <= v (the code's interval sits inside [u, v)).
 */
bool inside(const BitCode& code, const Rational& u, const Rational& v);
bool inside(const DyadicInterval& dyadic, const Rational& u, const Rational& v);

/**
 * @brief Longest extension of code whose interval still surrounds [u, v).
 *
 * Bits are appended greedily, '0' tried before '1', until neither keeps
 * the containment. If code does not surround [u, v) to begin with it is
 * returned unchanged.
 *
 * @param max_bits Upper bound on the returned code length, 0 for none.
 * @throw std::invalid_argument If u >= v.
 * @throw PrecisionOverflowError If the extension would exceed max_bits.
 */
BitCode extend_around(const BitCode& code, const Rational& u, const Rational& v,
                      size_t max_bits = 0);

/**
 * @brief Shortest extension of code whose interval sits inside [u, v).
 *
 * While not inside, compares the shortfall at the bottom (u*d - n) with the
 * one at the top (m - v*d) and appends '1' if the bottom one is strictly
 * larger, '0' otherwise. The chosen half still overlaps [u, v) and each bit
 * halves the dyadic width, so the loop ends.
 *
 * @param max_bits Upper bound on the returned code length, 0 for none.
 * @throw std::invalid_argument If u >= v, or if the code's interval does not
 *        overlap [u, v).
 * @throw PrecisionOverflowError If the extension would exceed max_bits.
 */
BitCode extend_inside(const BitCode& code, const Rational& u, const Rational& v,
                      size_t max_bits = 0);

#endif // INTERVAL_EXTENSION_HPP
