#include "static_model.hpp"
#include "ratcode_errors.hpp"
#include <gmpxx.h>
#include <string>
#include <utility>
#include <vector>

namespace {

class StaticState : public ModelState {
public:
    explicit StaticState(const Distribution& distribution) : distribution_(distribution) {}

    void update(Symbol symbol) override {
        // History has no effect, but the symbol must still belong to the alphabet
        if (!distribution_.alphabet().contains(symbol)) {
            throw UnknownSymbolError(symbol);
        }
    }

    Distribution distribution() const override { return distribution_; }

private:
    Distribution distribution_;
};

Distribution build_distribution(const std::map<Symbol, int64_t>& weights) {
    if (weights.empty()) {
        throw InvalidPriorError("Static weights must cover at least one symbol");
    }

    std::vector<Symbol> symbols;
    mpz_class total = 0;
    for (const auto& [symbol, weight] : weights) {
        if (weight <= 0) {
            throw InvalidPriorError(symbol, "Static weights must be positive");
        }
        symbols.push_back(symbol);
        total += mpz_class(std::to_string(weight));
    }

    auto alphabet = std::make_shared<const Alphabet>(symbols);
    std::vector<Rational> probabilities(alphabet->size());
    for (const auto& [symbol, weight] : weights) {
        mpz_class count(std::to_string(weight));
        Rational p(count, total);
        p.canonicalize();
        probabilities[alphabet->index_of(symbol)] = p;
    }
    return Distribution(alphabet, std::move(probabilities));
}

} // namespace

StaticModel::StaticModel(const std::map<Symbol, int64_t>& weights)
    : distribution_(build_distribution(weights)) {
}

std::unique_ptr<ModelState> StaticModel::start() const {
    return std::make_unique<StaticState>(distribution_);
}
