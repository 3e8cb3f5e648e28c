/**
 * @file bit_stream.cpp
 * @brief Implementation of binary codes and memory-based bit streams.
 */

#include "bit_stream.hpp"

// ============================================================================
//  BitCode Text Form
// ============================================================================

std::string bit_code_to_string(const BitCode& code) {
    std::string text;
    text.reserve(code.size());
    for (bool bit : code) {
        text.push_back(bit ? '1' : '0');
    }
    return text;
}

BitCode bit_code_from_string(const std::string& text) {
    BitCode code;
    code.reserve(text.size());
    for (char c : text) {
        if (c != '0' && c != '1') {
            throw std::invalid_argument("Binary code may only contain '0' and '1'");
        }
        code.push_back(c == '1');
    }
    return code;
}

// ============================================================================
//  BitOutputStream Implementation
// ============================================================================

BitOutputStream::BitOutputStream(std::vector<uint8_t>& target_buffer)
    : buffer_(target_buffer), pending_byte_(0), bits_in_pending_(0), bits_written_(0) {
}

BitOutputStream::~BitOutputStream() {
    flush();
}

void BitOutputStream::write_bit(bool bit) {
    // MSB first: the n-th bit of a byte lands at position 7 - n
    if (bit) {
        pending_byte_ |= static_cast<uint8_t>(1u << (7 - bits_in_pending_));
    }

    bits_in_pending_++;
    bits_written_++;

    if (bits_in_pending_ == 8) {
        buffer_.push_back(pending_byte_);
        pending_byte_ = 0;
        bits_in_pending_ = 0;
    }
}

void BitOutputStream::write_bits(uint64_t value, int num_bits) {
    if (num_bits < 1 || num_bits > 64) {
        throw std::invalid_argument("num_bits must be between 1 and 64");
    }

    for (int i = num_bits - 1; i >= 0; i--) {
        write_bit((value >> i) & 1u);
    }
}

void BitOutputStream::write_code(const BitCode& code) {
    for (bool bit : code) {
        write_bit(bit);
    }
}

void BitOutputStream::flush() {
    // pending_byte_ is already zero-padded at the LSB end
    if (bits_in_pending_ > 0) {
        buffer_.push_back(pending_byte_);
        pending_byte_ = 0;
        bits_in_pending_ = 0;
    }
}

// ============================================================================
//  BitInputStream Implementation
// ============================================================================

BitInputStream::BitInputStream(const std::vector<uint8_t>& source_buffer)
    : buffer_(source_buffer), byte_pos_(0), bits_consumed_in_byte_(0) {
}

bool BitInputStream::read_bit() {
    if (byte_pos_ >= buffer_.size()) {
        throw std::runtime_error("BitInputStream: Buffer underflow (read past end)");
    }

    uint8_t current_byte = buffer_[byte_pos_];
    bool bit = (current_byte >> (7 - bits_consumed_in_byte_)) & 1;

    bits_consumed_in_byte_++;

    if (bits_consumed_in_byte_ == 8) {
        byte_pos_++;
        bits_consumed_in_byte_ = 0;
    }

    return bit;
}

uint64_t BitInputStream::read_bits(int num_bits) {
    if (num_bits < 1 || num_bits > 64) {
        throw std::invalid_argument("num_bits must be between 1 and 64");
    }

    uint64_t value = 0;
    for (int i = num_bits - 1; i >= 0; i--) {
        value |= (read_bit() ? uint64_t{1} : uint64_t{0}) << i;
    }
    return value;
}

BitCode BitInputStream::read_code(uint64_t num_bits) {
    if (num_bits > bits_remaining()) {
        throw std::runtime_error("BitInputStream: code length exceeds remaining data");
    }

    BitCode code;
    code.reserve(static_cast<size_t>(num_bits));
    for (uint64_t i = 0; i < num_bits; i++) {
        code.push_back(read_bit());
    }
    return code;
}

uint64_t BitInputStream::bits_remaining() const {
    if (byte_pos_ >= buffer_.size()) {
        return 0;
    }
    return static_cast<uint64_t>(buffer_.size() - byte_pos_) * 8 - bits_consumed_in_byte_;
}

bool BitInputStream::eof() const {
    return byte_pos_ >= buffer_.size();
}
