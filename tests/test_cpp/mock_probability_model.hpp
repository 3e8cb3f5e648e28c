#ifndef MOCK_PROBABILITY_MODEL_HPP
#define MOCK_PROBABILITY_MODEL_HPP

#include "probability_model.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * Mock ProbabilityModel for testing.
 * 
 * Behaves like a uniform model over its alphabet and records every
 * session start, update and distribution request for verification.
 */
class MockProbabilityModel : public ProbabilityModel {
public:
    struct RecordedCall {
        enum CallType {
            START,
            UPDATE,
            DISTRIBUTION
        };
        CallType type;
        char symbol;  // Only meaningful for UPDATE
    };

    explicit MockProbabilityModel(const std::string& symbols)
        : alphabet_(std::make_shared<const Alphabet>(std::vector<Symbol>(symbols.begin(), symbols.end()))),
          calls_(std::make_shared<std::vector<RecordedCall>>()) {}

    const Alphabet& alphabet() const override { return *alphabet_; }

    std::unique_ptr<ModelState> start() const override {
        calls_->push_back(RecordedCall{RecordedCall::START, '\0'});
        return std::make_unique<State>(alphabet_, calls_);
    }

    size_t count_calls(RecordedCall::CallType type) const {
        size_t n = 0;
        for (const RecordedCall& call : *calls_) {
            if (call.type == type) {
                n++;
            }
        }
        return n;
    }

    // Symbols passed to update(), in order
    std::string updated_symbols() const {
        std::string result;
        for (const RecordedCall& call : *calls_) {
            if (call.type == RecordedCall::UPDATE) {
                result.push_back(call.symbol);
            }
        }
        return result;
    }

private:
    class State : public ModelState {
    public:
        State(std::shared_ptr<const Alphabet> alphabet,
              std::shared_ptr<std::vector<RecordedCall>> calls)
            : alphabet_(std::move(alphabet)), calls_(std::move(calls)) {}

        void update(Symbol symbol) override {
            alphabet_->index_of(symbol);  // throws UnknownSymbolError
            calls_->push_back(RecordedCall{RecordedCall::UPDATE, symbol});
        }

        Distribution distribution() const override {
            calls_->push_back(RecordedCall{RecordedCall::DISTRIBUTION, '\0'});
            Rational p(1, static_cast<unsigned long>(alphabet_->size()));
            return Distribution(alphabet_, std::vector<Rational>(alphabet_->size(), p));
        }

    private:
        std::shared_ptr<const Alphabet> alphabet_;
        std::shared_ptr<std::vector<RecordedCall>> calls_;
    };

    std::shared_ptr<const Alphabet> alphabet_;
    std::shared_ptr<std::vector<RecordedCall>> calls_;
};

#endif // MOCK_PROBABILITY_MODEL_HPP
