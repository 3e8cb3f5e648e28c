#include "interval_extension.hpp"
#include "ratcode_debug.hpp"
#include "ratcode_errors.hpp"
#include <stdexcept>
#include <string>

namespace {

void require_non_empty(const Rational& u, const Rational& v, const char* caller) {
    if (u >= v) {
        throw std::invalid_argument(std::string(caller) + ": target interval is empty");
    }
}

void check_length(size_t new_length, size_t max_bits, const char* caller) {
    if (max_bits != 0 && new_length > max_bits) {
        throw PrecisionOverflowError(std::string(caller) + ": code length bound exceeded",
                                     max_bits);
    }
}

// Without overlap extend_inside would chase [u, v) forever
void require_overlap(const DyadicInterval& dyadic, const Rational& u, const Rational& v,
                     const char* caller) {
    Rational scaled_u = u * dyadic.denominator;
    Rational scaled_v = v * dyadic.denominator;
    if (dyadic.numerator >= scaled_v || dyadic.upper_numerator() <= scaled_u) {
        throw std::invalid_argument(std::string(caller) + ": code does not overlap target interval");
    }
}

} // namespace

// ============================================================================
//  Predicates
// ============================================================================

bool around(const DyadicInterval& dyadic, const Rational& u, const Rational& v) {
    Rational scaled_u = u * dyadic.denominator;
    Rational scaled_v = v * dyadic.denominator;
    return dyadic.numerator <= scaled_u && scaled_v <= dyadic.upper_numerator();
}

bool around(const BitCode& code, const Rational& u, const Rational& v) {
    return around(binary_interval(code), u, v);
}

bool inside(const DyadicInterval& dyadic, const Rational& u, const Rational& v) {
    Rational scaled_u = u * dyadic.denominator;
    Rational scaled_v = v * dyadic.denominator;
    return scaled_u <= dyadic.numerator && dyadic.upper_numerator() <= scaled_v;
}

bool inside(const BitCode& code, const Rational& u, const Rational& v) {
    return inside(binary_interval(code), u, v);
}

// ============================================================================
//  Extensions
// ============================================================================

BitCode extend_around(const BitCode& code, const Rational& u, const Rational& v,
                      size_t max_bits) {
    require_non_empty(u, v, "extend_around");

    BitCode extended = code;
    DyadicInterval current = binary_interval(code);

    for (;;) {
        DyadicInterval next = current.append(false);
        bool bit = false;
        if (!around(next, u, v)) {
            next = current.append(true);
            bit = true;
            if (!around(next, u, v)) {
                break;
            }
        }
        check_length(extended.size() + 1, max_bits, "extend_around");
        extended.push_back(bit);
        current = next;
    }

    RATCODE_DEBUG_LOG("extend_around: " << code.size() << " -> " << extended.size() << " bits");
    return extended;
}

BitCode extend_inside(const BitCode& code, const Rational& u, const Rational& v,
                      size_t max_bits) {
    require_non_empty(u, v, "extend_inside");

    BitCode extended = code;
    DyadicInterval current = binary_interval(code);
    require_overlap(current, u, v, "extend_inside");

    while (!inside(current, u, v)) {
        // Gap between the dyadic interval and [u, v) at each end, in units of 1/d
        Rational lower_gap = u * current.denominator - current.numerator;
        Rational upper_gap = current.upper_numerator() - v * current.denominator;
        bool bit = lower_gap > upper_gap;

        check_length(extended.size() + 1, max_bits, "extend_inside");
        extended.push_back(bit);
        current = current.append(bit);
    }

    RATCODE_DEBUG_LOG("extend_inside: " << code.size() << " -> " << extended.size() << " bits");
    return extended;
}
