#include "ratcode_errors.hpp"
#include <cctype>
#include <cstdio>

std::string describe_symbol(char symbol) {
    unsigned char byte = static_cast<unsigned char>(symbol);
    if (std::isprint(byte)) {
        return std::string("'") + symbol + "'";
    }
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02X", static_cast<unsigned int>(byte));
    return hex;
}

UnknownSymbolError::UnknownSymbolError(char symbol)
    : std::invalid_argument("Symbol " + describe_symbol(symbol) + " is not in the model alphabet"),
      symbol_(symbol) {
}

InvalidPriorError::InvalidPriorError(const std::string& what_arg)
    : std::invalid_argument(what_arg), symbol_('\0'), has_symbol_(false) {
}

InvalidPriorError::InvalidPriorError(char symbol, const std::string& what_arg)
    : std::invalid_argument(what_arg + " (symbol " + describe_symbol(symbol) + ")"),
      symbol_(symbol), has_symbol_(true) {
}

PrecisionOverflowError::PrecisionOverflowError(const std::string& what_arg, size_t limit)
    : std::overflow_error(what_arg + " (limit " + std::to_string(limit) + ")"),
      limit_(limit) {
}
