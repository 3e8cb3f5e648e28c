#ifndef ARITHMETIC_CODER_HPP
#define ARITHMETIC_CODER_HPP

/**
 * @file arithmetic_coder.hpp
 * @brief Arithmetic coder with exact rational intervals
 *
 * The encoder keeps the message interval [u, v) as a pair of exact
 * rationals. For every symbol the interval is narrowed to the symbol's
 * cumulative sub-interval, and the code is extended to the longest binary
 * prefix whose dyadic interval still surrounds [u, v). Once the message
 * ends, the code is extended to the shortest one whose dyadic interval lies
 * inside the upper half of [u, v).
 *
 * Because no precision is ever dropped, there is no underflow handling and
 * no renormalization: the code length stays within a few bits of
 * -log2 P(message) under the model.
 *
 * The finalization into the upper half is part of the code format; a
 * decoder relies on the code's point 0.b1b2... lying in the final interval.
 */

#include "alphabet.hpp"
#include "bit_stream.hpp"
#include "probability_model.hpp"
#include "rational_interval.hpp"
#include <cstddef>
#include <memory>
#include <optional>

/**
 * @brief Limits applied while encoding. Zero disables a limit.
 */
struct EncoderOptions {
    size_t max_code_bits = 0;  // Longest code the encoder may produce
    size_t max_symbols = 0;    // Longest message the encoder accepts
};

/**
 * @brief Step-wise arithmetic encoder
 *
 * Usage: start_encoding(model), encode_symbol() per symbol, done_encoding().
 * A symbol that cannot be encoded is rejected with an exception and leaves
 * the interval, the code and the model state untouched.
 */
class ArithmeticEncoder {
public:
    enum class State {
        IDLE,       // No message started
        INITIAL,    // Started, no symbol yet
        NARROWING,  // At least one symbol encoded
        FINALIZED   // Code complete
    };

    explicit ArithmeticEncoder(const EncoderOptions& options = EncoderOptions());

    /**
     * Start encoding a new message.
     *
     * @param model Model giving the symbol probabilities. Must outlive the message.
     */
    void start_encoding(const ProbabilityModel& model);

    /**
     * Encode a symbol.
     *
     * @param symbol Next symbol of the message
     * @throw std::logic_error If no message is being encoded.
     * @throw UnknownSymbolError If the symbol is not in the model alphabet.
     * @throw PrecisionOverflowError If a configured limit would be exceeded.
     */
    void encode_symbol(Symbol symbol);

    /**
     * Finish the message: extend the code so it sits inside the upper half
     * of the message interval.
     *
     * @return The final code
     * @throw std::logic_error If no message is being encoded.
     * @throw PrecisionOverflowError If max_code_bits would be exceeded.
     */
    BitCode done_encoding();

    State get_state() const { return state_; }

    bool is_encoding() const { return state_ == State::INITIAL || state_ == State::NARROWING; }

    /// Current message interval [u, v).
    const Interval& get_interval() const { return interval_; }

    /// Bits determined so far (the complete code once finalized).
    const BitCode& get_code() const { return code_; }

    size_t get_symbols_encoded() const { return symbols_encoded_; }

private:
    EncoderOptions options_;
    State state_;
    Interval interval_;
    BitCode code_;
    size_t symbols_encoded_;
    std::unique_ptr<ModelState> model_state_;
    std::optional<Distribution> distribution_;  // Distribution of the next symbol

    void require_encoding(const char* caller) const;
};

/**
 * @brief Step-wise decoder for codes produced by ArithmeticEncoder
 *
 * The code carries no length or terminator, so the caller decides how many
 * symbols to decode.
 */
class ArithmeticDecoder {
public:
    ArithmeticDecoder();

    /**
     * Start decoding a code.
     *
     * @param model Same model the message was encoded with. Must outlive decoding.
     * @param code Complete code returned by the encoder
     */
    void start_decoding(const ProbabilityModel& model, const BitCode& code);

    /**
     * Decode the next symbol.
     *
     * @throw std::logic_error If no code is being decoded.
     */
    Symbol decode_symbol();

    /**
     * Stop decoding and release the model state.
     */
    void done_decoding();

    bool is_decoding() const { return decoding_; }

    const Interval& get_interval() const { return interval_; }

private:
    bool decoding_;
    Interval interval_;
    Rational point_;  // 0.b1b2... of the code being decoded
    std::unique_ptr<ModelState> model_state_;
    std::optional<Distribution> distribution_;
};

/**
 * @brief Encode a complete message.
 *
 * @throw UnknownSymbolError If the stream holds a symbol outside the model alphabet.
 * @throw PrecisionOverflowError If a configured limit would be exceeded.
 */
BitCode encode(const ProbabilityModel& model, const SymbolSequence& stream,
               const EncoderOptions& options = EncoderOptions());

/**
 * @brief Decode num_symbols symbols from a complete code.
 */
SymbolSequence decode(const ProbabilityModel& model, const BitCode& code, size_t num_symbols);

#endif // ARITHMETIC_CODER_HPP
