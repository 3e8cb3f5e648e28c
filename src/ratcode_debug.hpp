#ifndef RATCODE_DEBUG_HPP
#define RATCODE_DEBUG_HPP

/**
 * @file ratcode_debug.hpp
 * @brief Tracing of interval narrowing and code extension.
 *
 * Built with -DRATCODE_DEBUG=ON, the coder prints one line per symbol and per
 * extension step to stderr, each tagged [RATCODE_DEBUG]. Messages may stream
 * Rational, Interval and BitCode sizes directly:
 *   RATCODE_DEBUG_LOG("narrowed to " << interval);
 * Otherwise every call is removed at compile time.
 */

#ifdef RATCODE_DEBUG
#include <iostream>
#include <sstream>

#define RATCODE_DEBUG_LOG(msg) do { \
    std::ostringstream _oss; \
    _oss << "[RATCODE_DEBUG] " << msg; \
    std::cerr << _oss.str() << std::endl; \
} while(0)

#else
#define RATCODE_DEBUG_LOG(msg) ((void)0)
#endif

#endif // RATCODE_DEBUG_HPP
