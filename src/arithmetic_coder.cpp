#include "arithmetic_coder.hpp"
#include "interval_extension.hpp"
#include "ratcode_debug.hpp"
#include "ratcode_errors.hpp"
#include <stdexcept>
#include <string>
#include <utility>

// ============================================================================
//  ArithmeticEncoder
// ============================================================================

ArithmeticEncoder::ArithmeticEncoder(const EncoderOptions& options)
    : options_(options), state_(State::IDLE), symbols_encoded_(0) {
}

void ArithmeticEncoder::start_encoding(const ProbabilityModel& model) {
    model_state_ = model.start();
    distribution_ = model_state_->distribution();

    interval_ = Interval();
    code_.clear();
    symbols_encoded_ = 0;
    state_ = State::INITIAL;
}

void ArithmeticEncoder::encode_symbol(Symbol symbol) {
    require_encoding("encode_symbol");

    if (options_.max_symbols != 0 && symbols_encoded_ >= options_.max_symbols) {
        throw PrecisionOverflowError("ArithmeticEncoder: message length bound exceeded",
                                     options_.max_symbols);
    }

    // Everything that can fail runs before the encoder state is touched
    Interval cumulative = cdf_interval(*distribution_, symbol);
    Interval narrowed = interval_.narrow(cumulative);
    BitCode extended = extend_around(code_, narrowed.low, narrowed.high, options_.max_code_bits);

    model_state_->update(symbol);
    distribution_ = model_state_->distribution();

    interval_ = std::move(narrowed);
    code_ = std::move(extended);
    symbols_encoded_++;
    state_ = State::NARROWING;

    RATCODE_DEBUG_LOG("encode " << describe_symbol(symbol) << " -> " << interval_
                      << " code " << bit_code_to_string(code_));
}

BitCode ArithmeticEncoder::done_encoding() {
    require_encoding("done_encoding");

    Interval target = interval_.upper_half();
    code_ = extend_inside(code_, target.low, target.high, options_.max_code_bits);

    model_state_.reset();
    distribution_.reset();
    state_ = State::FINALIZED;

    RATCODE_DEBUG_LOG("done: " << symbols_encoded_ << " symbols, " << code_.size() << " bits");
    return code_;
}

void ArithmeticEncoder::require_encoding(const char* caller) const {
    if (!is_encoding()) {
        throw std::logic_error(std::string("ArithmeticEncoder::") + caller +
                               ": not in encoding mode");
    }
}

// ============================================================================
//  ArithmeticDecoder
// ============================================================================

ArithmeticDecoder::ArithmeticDecoder() : decoding_(false) {
}

void ArithmeticDecoder::start_decoding(const ProbabilityModel& model, const BitCode& code) {
    model_state_ = model.start();
    distribution_ = model_state_->distribution();

    interval_ = Interval();
    point_ = binary_interval(code).lower_bound();
    decoding_ = true;
}

Symbol ArithmeticDecoder::decode_symbol() {
    if (!decoding_) {
        throw std::logic_error("ArithmeticDecoder::decode_symbol: not in decoding mode");
    }

    // The point lies in the final message interval, which is nested in the
    // sub-interval of every symbol of the message
    Rational relative = (point_ - interval_.low) / interval_.width();
    Symbol symbol = distribution_->locate(relative);

    interval_ = interval_.narrow(cdf_interval(*distribution_, symbol));
    model_state_->update(symbol);
    distribution_ = model_state_->distribution();

    RATCODE_DEBUG_LOG("decode " << describe_symbol(symbol) << " -> " << interval_);
    return symbol;
}

void ArithmeticDecoder::done_decoding() {
    model_state_.reset();
    distribution_.reset();
    decoding_ = false;
}

// ============================================================================
//  Whole-message helpers
// ============================================================================

BitCode encode(const ProbabilityModel& model, const SymbolSequence& stream,
               const EncoderOptions& options) {
    ArithmeticEncoder encoder(options);
    encoder.start_encoding(model);
    for (Symbol symbol : stream) {
        encoder.encode_symbol(symbol);
    }
    return encoder.done_encoding();
}

SymbolSequence decode(const ProbabilityModel& model, const BitCode& code, size_t num_symbols) {
    ArithmeticDecoder decoder;
    decoder.start_decoding(model, code);

    // num_symbols comes from the caller or a container header, unchecked
    SymbolSequence message;
    for (size_t i = 0; i < num_symbols; i++) {
        message.push_back(decoder.decode_symbol());
    }
    decoder.done_decoding();
    return message;
}
