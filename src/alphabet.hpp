#ifndef ALPHABET_HPP
#define ALPHABET_HPP

/**
 * @file alphabet.hpp
 * @brief Ordered symbol alphabet
 *
 * The order of the alphabet decides where each symbol's sub-interval falls
 * inside [0, 1), so encoder and decoder must agree on it exactly. Symbols
 * are single bytes ordered as unsigned values, which is the lexicographic
 * order of one-character strings. The order is fixed when the alphabet is
 * built and never re-derived.
 */

#include <array>
#include <cstddef>
#include <string>
#include <vector>

/// One symbol of the message alphabet.
using Symbol = char;

/// A message, or the history of symbols seen so far.
using SymbolSequence = std::string;

class Alphabet {
public:
    /**
     * @brief Build the alphabet from a set of symbols given in any order.
     * @throw std::invalid_argument If symbols is empty or holds a duplicate.
     */
    explicit Alphabet(const std::vector<Symbol>& symbols);

    /**
     * @brief Strict total order used by every alphabet.
     */
    static bool precedes(Symbol a, Symbol b);

    size_t size() const { return symbols_.size(); }

    bool contains(Symbol symbol) const;

    /**
     * @brief Position of a symbol in the order (0-based).
     * @throw UnknownSymbolError If the symbol is not in the alphabet.
     */
    size_t index_of(Symbol symbol) const;

    /**
     * @brief Symbol at a position.
     * @throw std::out_of_range If index >= size().
     */
    Symbol symbol_at(size_t index) const;

    const std::vector<Symbol>& symbols() const { return symbols_; }

private:
    static constexpr int NOT_PRESENT = -1;

    std::vector<Symbol> symbols_;       // Symbols in declared order
    std::array<int, 256> index_table_;  // Byte value -> position, or NOT_PRESENT
};

#endif // ALPHABET_HPP
