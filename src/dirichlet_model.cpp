#include "dirichlet_model.hpp"
#include "ratcode_errors.hpp"
#include <string>
#include <utility>

namespace {

std::vector<Symbol> keys_of(const std::map<Symbol, int64_t>& prior_counts) {
    std::vector<Symbol> symbols;
    symbols.reserve(prior_counts.size());
    for (const auto& [symbol, count] : prior_counts) {
        symbols.push_back(symbol);
    }
    return symbols;
}

} // namespace

// ============================================================================
//  DirichletState
// ============================================================================

DirichletState::DirichletState(std::shared_ptr<const Alphabet> alphabet,
                               std::vector<mpz_class> prior_counts)
    : alphabet_(std::move(alphabet)), priors_(std::move(prior_counts)) {
    reset();
}

void DirichletState::update(Symbol symbol) {
    size_t index = alphabet_->index_of(symbol);
    counts_[index] += 1;
    total_ += 1;
}

Distribution DirichletState::distribution() const {
    std::vector<Rational> probabilities;
    probabilities.reserve(counts_.size());
    for (const mpz_class& count : counts_) {
        Rational p(count, total_);
        p.canonicalize();
        probabilities.push_back(p);
    }
    return Distribution(alphabet_, std::move(probabilities));
}

const mpz_class& DirichletState::get_count(Symbol symbol) const {
    return counts_[alphabet_->index_of(symbol)];
}

void DirichletState::reset() {
    counts_ = priors_;
    total_ = 0;
    for (const mpz_class& count : counts_) {
        total_ += count;
    }
}

// ============================================================================
//  DirichletModel
// ============================================================================

DirichletModel::DirichletModel(const std::map<Symbol, int64_t>& prior_counts) {
    if (prior_counts.empty()) {
        throw InvalidPriorError("Prior counts must cover at least one symbol");
    }
    for (const auto& [symbol, count] : prior_counts) {
        if (count <= 0) {
            throw InvalidPriorError(symbol, "Prior counts must be positive");
        }
    }

    alphabet_ = std::make_shared<const Alphabet>(keys_of(prior_counts));

    priors_.resize(alphabet_->size());
    for (const auto& [symbol, count] : prior_counts) {
        priors_[alphabet_->index_of(symbol)] = count;
    }
}

std::unique_ptr<ModelState> DirichletModel::start() const {
    return std::make_unique<DirichletState>(alphabet_, prior_counts());
}

int64_t DirichletModel::get_prior(Symbol symbol) const {
    return priors_[alphabet_->index_of(symbol)];
}

std::vector<mpz_class> DirichletModel::counts(const SymbolSequence& history) const {
    std::vector<mpz_class> result = prior_counts();
    for (Symbol symbol : history) {
        result[alphabet_->index_of(symbol)] += 1;
    }
    return result;
}

std::vector<mpz_class> DirichletModel::prior_counts() const {
    std::vector<mpz_class> result;
    result.reserve(priors_.size());
    for (int64_t count : priors_) {
        // mpz_class has no int64_t constructor on every platform
        result.emplace_back(std::to_string(count));
    }
    return result;
}
