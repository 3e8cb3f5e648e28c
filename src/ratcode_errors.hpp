#ifndef RATCODE_ERRORS_HPP
#define RATCODE_ERRORS_HPP

/**
 * @file ratcode_errors.hpp
 * @brief Exception types reported by the coder
 *
 * Each failure that aborts an encode call has its own type so callers can
 * tell them apart. None of them is retryable: the input itself is at fault.
 */

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief A symbol is not part of the model's alphabet.
 */
class UnknownSymbolError : public std::invalid_argument {
public:
    explicit UnknownSymbolError(char symbol);

    char symbol() const { return symbol_; }

private:
    char symbol_;
};

/**
 * @brief A prior count map is empty or holds a non-positive count.
 */
class InvalidPriorError : public std::invalid_argument {
public:
    explicit InvalidPriorError(const std::string& what_arg);
    InvalidPriorError(char symbol, const std::string& what_arg);

    bool has_symbol() const { return has_symbol_; }
    char symbol() const { return symbol_; }

private:
    char symbol_;
    bool has_symbol_;
};

/**
 * @brief A configured code length or message length bound was exceeded.
 */
class PrecisionOverflowError : public std::overflow_error {
public:
    PrecisionOverflowError(const std::string& what_arg, size_t limit);

    size_t limit() const { return limit_; }

private:
    size_t limit_;
};

/**
 * @brief Printable form of a symbol for error messages ('a', or 0x07).
 */
std::string describe_symbol(char symbol);

#endif // RATCODE_ERRORS_HPP
