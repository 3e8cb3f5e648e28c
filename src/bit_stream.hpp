#ifndef BIT_STREAM_HPP
#define BIT_STREAM_HPP

/**
 * @file bit_stream.hpp
 * @brief Binary codes and memory-based bit streams.
 * * A BitCode is the coder's output: an ordered bit sequence read as the
 * binary fraction 0.b1b2b3... The stream classes pack such codes (and
 * fixed-width header fields) into byte vectors for the container format.
 * * Key Features:
 * - Zero-Copy Architecture: streams operate on references to existing vectors.
 * - MSB First: Bits are packed from Most Significant Bit to Least Significant Bit.
 * - Exceptions: Throws std::runtime_error on buffer underflows.
 */

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/// Bit sequence produced by the encoder, first element is the first bit after the point.
using BitCode = std::vector<bool>;

/**
 * @brief Render a code as text, one '0' or '1' per bit.
 */
std::string bit_code_to_string(const BitCode& code);

/**
 * @brief Parse the text form of a code.
 * @throw std::invalid_argument If the text holds anything other than '0' and '1'.
 */
BitCode bit_code_from_string(const std::string& text);

/**
 * @brief Writes bits to a dynamically growing memory buffer.
 * * Single bits, whole codes or multi-bit integers are appended to a
 * std::vector<uint8_t>. Partial bytes are buffered internally.
 */
class BitOutputStream {
public:
    /**
     * @brief Construct a new Bit Output Stream object.
     * * @param target_buffer Reference to the output vector. The vector is NOT cleared
     * on construction; bits are appended to existing content.
     * The caller retains ownership of this vector.
     */
    explicit BitOutputStream(std::vector<uint8_t>& target_buffer);

    /**
     * @brief Destroy the Bit Output Stream object.
     * * Automatically calls flush() to ensure any remaining partial bits
     * are written to the buffer.
     */
    ~BitOutputStream();

    /**
     * @brief Write a single bit to the stream.
     * @param bit The bit to write (true = 1, false = 0).
     */
    void write_bit(bool bit);

    /**
     * @brief Write multiple bits of an integer to the stream, MSB first.
     * @param value The integer value containing the bits to write.
     * @param num_bits The number of bits to write (1 to 64).
     * @throw std::invalid_argument If num_bits is not between 1 and 64.
     */
    void write_bits(uint64_t value, int num_bits);

    /**
     * @brief Write every bit of a code, first bit first.
     */
    void write_code(const BitCode& code);

    /**
     * @brief Flushes any pending bits to the output vector.
     * * A partial byte is padded with zeros at the LSB end.
     */
    void flush();

    /// Number of bits written since construction, padding excluded.
    uint64_t bits_written() const { return bits_written_; }

private:
    std::vector<uint8_t>& buffer_; ///< Reference to the user-owned output vector.
    uint8_t pending_byte_;         ///< Accumulator for bits currently being built.
    int bits_in_pending_;          ///< Count of bits currently in the accumulator (0-7).
    uint64_t bits_written_;
};

/**
 * @brief Reads bits from a read-only memory buffer.
 * * Reading past the end throws, so a truncated container is reported
 * instead of being silently zero-filled.
 */
class BitInputStream {
public:
    /**
     * @brief Construct a new Bit Input Stream object.
     * * @param source_buffer Reference to the input vector containing packed data.
     */
    explicit BitInputStream(const std::vector<uint8_t>& source_buffer);

    /**
     * @brief Read a single bit from the stream.
     * @throw std::runtime_error If attempting to read past the end of the buffer.
     */
    bool read_bit();

    /**
     * @brief Read multiple bits to form an integer, MSB first.
     * @param num_bits The number of bits to read (1 to 64).
     * @throw std::invalid_argument If num_bits is not between 1 and 64.
     */
    uint64_t read_bits(int num_bits);

    /**
     * @brief Read a code of the given length.
     * @throw std::runtime_error If fewer than num_bits bits remain.
     */
    BitCode read_code(uint64_t num_bits);

    /**
     * @brief Number of unread bits, padding included.
     */
    uint64_t bits_remaining() const;

    /**
     * @brief Check if the end of the stream has been reached.
     */
    bool eof() const;

private:
    const std::vector<uint8_t>& buffer_; ///< Reference to the input data.
    size_t byte_pos_;                    ///< Current index in the byte vector.
    int bits_consumed_in_byte_;          ///< Current bit index (0-7) within the current byte.
};

#endif // BIT_STREAM_HPP
