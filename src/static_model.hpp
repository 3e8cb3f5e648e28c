#ifndef STATIC_MODEL_HPP
#define STATIC_MODEL_HPP

/**
 * @file static_model.hpp
 * @brief Non-adaptive model with a fixed distribution
 *
 * Symbol probabilities are weight / total weight and never change with the
 * history. Useful when the source statistics are known up front.
 */

#include "probability_model.hpp"
#include <cstdint>
#include <map>
#include <memory>

class StaticModel : public ProbabilityModel {
public:
    /**
     * @param weights Positive weight for every symbol of the alphabet.
     * @throw InvalidPriorError If the map is empty or a weight is not positive.
     */
    explicit StaticModel(const std::map<Symbol, int64_t>& weights);

    const Alphabet& alphabet() const override { return distribution_.alphabet(); }

    std::unique_ptr<ModelState> start() const override;

    const Distribution& distribution() const { return distribution_; }

private:
    Distribution distribution_;
};

#endif // STATIC_MODEL_HPP
