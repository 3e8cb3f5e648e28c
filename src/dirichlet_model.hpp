#ifndef DIRICHLET_MODEL_HPP
#define DIRICHLET_MODEL_HPP

/**
 * @file dirichlet_model.hpp
 * @brief Adaptive frequency-count model with a Dirichlet prior
 *
 * Each symbol starts with a positive prior count. Every coded symbol adds
 * one to its own count, and the probability of a symbol is its count over
 * the total. Counts are arbitrary-precision integers and probabilities are
 * exact rationals, so they are always strictly positive and sum to exactly 1.
 *
 * Unlike frequency tables in fixed-precision coders there is no rescaling:
 * the probabilities after any history are exactly those of replaying the
 * whole history on top of the priors.
 */

#include "probability_model.hpp"
#include <gmpxx.h>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

/**
 * @brief Running counts of one coding session under a DirichletModel.
 */
class DirichletState : public ModelState {
public:
    DirichletState(std::shared_ptr<const Alphabet> alphabet, std::vector<mpz_class> prior_counts);

    /**
     * Increment the count of a symbol.
     *
     * @param symbol Symbol just coded
     * @throw UnknownSymbolError If the symbol is not in the alphabet.
     */
    void update(Symbol symbol) override;

    /**
     * count(symbol) / total for every symbol, in alphabet order.
     */
    Distribution distribution() const override;

    /**
     * Get the current count of a symbol (prior plus occurrences).
     *
     * @throw UnknownSymbolError If the symbol is not in the alphabet.
     */
    const mpz_class& get_count(Symbol symbol) const;

    /**
     * Get the sum of all counts.
     */
    const mpz_class& get_total() const { return total_; }

    /**
     * Return to the prior counts.
     */
    void reset();

private:
    std::shared_ptr<const Alphabet> alphabet_;
    std::vector<mpz_class> priors_;
    std::vector<mpz_class> counts_;  // Indexed in alphabet order
    mpz_class total_;
};

/**
 * @brief Dirichlet model: the adaptive count model built from prior counts.
 */
class DirichletModel : public ProbabilityModel {
public:
    /**
     * Constructor.
     *
     * @param prior_counts Positive prior count for every symbol of the alphabet.
     *        The alphabet is exactly the set of keys.
     * @throw InvalidPriorError If the map is empty or a count is not positive.
     */
    explicit DirichletModel(const std::map<Symbol, int64_t>& prior_counts);

    const Alphabet& alphabet() const override { return *alphabet_; }

    std::unique_ptr<ModelState> start() const override;

    /**
     * Get the prior count of a symbol.
     *
     * @throw UnknownSymbolError If the symbol is not in the alphabet.
     */
    int64_t get_prior(Symbol symbol) const;

    /**
     * Counts after replaying a history, in alphabet order.
     *
     * @throw UnknownSymbolError If history holds a symbol outside the alphabet.
     */
    std::vector<mpz_class> counts(const SymbolSequence& history) const;

private:
    std::shared_ptr<const Alphabet> alphabet_;
    std::vector<int64_t> priors_;  // Indexed in alphabet order

    std::vector<mpz_class> prior_counts() const;
};

#endif // DIRICHLET_MODEL_HPP
