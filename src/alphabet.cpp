#include "alphabet.hpp"
#include "ratcode_errors.hpp"
#include <algorithm>
#include <stdexcept>

Alphabet::Alphabet(const std::vector<Symbol>& symbols)
    : symbols_(symbols) {
    if (symbols_.empty()) {
        throw std::invalid_argument("Alphabet must contain at least one symbol");
    }

    std::sort(symbols_.begin(), symbols_.end(), &Alphabet::precedes);

    index_table_.fill(NOT_PRESENT);
    for (size_t i = 0; i < symbols_.size(); i++) {
        unsigned char byte = static_cast<unsigned char>(symbols_[i]);
        if (index_table_[byte] != NOT_PRESENT) {
            throw std::invalid_argument("Duplicate symbol " + describe_symbol(symbols_[i]) +
                                        " in alphabet");
        }
        index_table_[byte] = static_cast<int>(i);
    }
}

bool Alphabet::precedes(Symbol a, Symbol b) {
    return static_cast<unsigned char>(a) < static_cast<unsigned char>(b);
}

bool Alphabet::contains(Symbol symbol) const {
    return index_table_[static_cast<unsigned char>(symbol)] != NOT_PRESENT;
}

size_t Alphabet::index_of(Symbol symbol) const {
    int index = index_table_[static_cast<unsigned char>(symbol)];
    if (index == NOT_PRESENT) {
        throw UnknownSymbolError(symbol);
    }
    return static_cast<size_t>(index);
}

Symbol Alphabet::symbol_at(size_t index) const {
    if (index >= symbols_.size()) {
        throw std::out_of_range("Alphabet index out of range");
    }
    return symbols_[index];
}
