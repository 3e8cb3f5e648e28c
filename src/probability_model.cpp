#include "probability_model.hpp"
#include "ratcode_errors.hpp"
#include <stdexcept>
#include <utility>

// ============================================================================
//  Distribution
// ============================================================================

Distribution::Distribution(std::shared_ptr<const Alphabet> alphabet,
                           std::vector<Rational> probabilities)
    : alphabet_(std::move(alphabet)), probabilities_(std::move(probabilities)) {
    if (!alphabet_) {
        throw std::invalid_argument("Distribution requires an alphabet");
    }
    if (probabilities_.size() != alphabet_->size()) {
        throw std::invalid_argument("Distribution needs exactly one probability per symbol");
    }
    for (const Rational& p : probabilities_) {
        if (sgn(p) < 0) {
            throw std::invalid_argument("Probabilities must be non-negative");
        }
    }
}

const Rational& Distribution::probability(Symbol symbol) const {
    return probabilities_[alphabet_->index_of(symbol)];
}

Rational Distribution::total() const {
    Rational sum = 0;
    for (const Rational& p : probabilities_) {
        sum += p;
    }
    return sum;
}

Symbol Distribution::locate(const Rational& point) const {
    if (sgn(point) < 0) {
        throw std::out_of_range("Point lies below the distribution");
    }

    Rational cumulative = 0;
    for (size_t i = 0; i < probabilities_.size(); i++) {
        cumulative += probabilities_[i];
        if (point < cumulative) {
            return alphabet_->symbol_at(i);
        }
    }
    throw std::out_of_range("Point lies above the distribution");
}

// ============================================================================
//  Cumulative Distribution
// ============================================================================

Interval cdf_interval(const Distribution& distribution, Symbol symbol) {
    size_t target = distribution.alphabet().index_of(symbol);
    const std::vector<Rational>& probabilities = distribution.probabilities();

    Rational f_lo = 0;
    for (size_t i = 0; i < target; i++) {
        f_lo += probabilities[i];
    }
    Rational f_hi = f_lo + probabilities[target];
    return Interval(f_lo, f_hi);
}

// ============================================================================
//  ProbabilityModel
// ============================================================================

Distribution ProbabilityModel::predict(const SymbolSequence& history) const {
    std::unique_ptr<ModelState> state = start();
    for (Symbol symbol : history) {
        state->update(symbol);
    }
    return state->distribution();
}
