#ifndef PROBABILITY_MODEL_HPP
#define PROBABILITY_MODEL_HPP

/**
 * @file probability_model.hpp
 * @brief Probability distributions and the model capability used by the coder
 *
 * A model answers one question: given the symbols already coded, what is
 * the distribution of the next one? The coder only relies on that, so
 * adaptive, static or context-based models can be swapped freely.
 *
 * Models are immutable after construction. The counts (or any other
 * evolving statistics) of one coding session live in a ModelState created
 * by start(), owned by that session and discarded with it.
 */

#include "alphabet.hpp"
#include "rational_interval.hpp"
#include <memory>
#include <vector>

/**
 * @brief Exact probabilities over an alphabet, indexed in alphabet order.
 */
class Distribution {
public:
    /**
     * @param alphabet Alphabet the probabilities refer to.
     * @param probabilities One non-negative probability per symbol, in alphabet order.
     * @throw std::invalid_argument On a size mismatch or a negative probability.
     */
    Distribution(std::shared_ptr<const Alphabet> alphabet, std::vector<Rational> probabilities);

    const Alphabet& alphabet() const { return *alphabet_; }

    /**
     * @throw UnknownSymbolError If the symbol is not in the alphabet.
     */
    const Rational& probability(Symbol symbol) const;

    const std::vector<Rational>& probabilities() const { return probabilities_; }

    /// Sum of all probabilities (exactly 1 for a well-formed model).
    Rational total() const;

    /**
     * @brief Symbol whose cumulative interval [F_lo, F_hi) contains point.
     * @throw std::out_of_range If point lies outside [0, total()).
     */
    Symbol locate(const Rational& point) const;

private:
    std::shared_ptr<const Alphabet> alphabet_;
    std::vector<Rational> probabilities_;
};

/**
 * @brief Cumulative interval [F_lo, F_hi) of a symbol.
 *
 * F_lo is the total probability of the symbols preceding it in alphabet
 * order and F_hi = F_lo + P(symbol).
 *
 * @throw UnknownSymbolError If the symbol is not in the distribution's alphabet.
 */
Interval cdf_interval(const Distribution& distribution, Symbol symbol);

/**
 * @brief Evolving statistics of one coding session.
 */
class ModelState {
public:
    virtual ~ModelState() = default;

    /**
     * @brief Account for one more coded symbol.
     * @throw UnknownSymbolError If the symbol is not in the alphabet.
     */
    virtual void update(Symbol symbol) = 0;

    /// Distribution of the next symbol.
    virtual Distribution distribution() const = 0;
};

/**
 * @brief Maps a symbol history to a distribution over the alphabet.
 */
class ProbabilityModel {
public:
    virtual ~ProbabilityModel() = default;

    virtual const Alphabet& alphabet() const = 0;

    /// Fresh state for a new session, as if no symbol had been seen.
    virtual std::unique_ptr<ModelState> start() const = 0;

    /**
     * @brief P(. | history): replays history through a fresh state.
     * @throw UnknownSymbolError If history holds a symbol outside the alphabet.
     */
    Distribution predict(const SymbolSequence& history) const;
};

#endif // PROBABILITY_MODEL_HPP
