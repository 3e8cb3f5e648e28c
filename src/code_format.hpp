#ifndef CODE_FORMAT_HPP
#define CODE_FORMAT_HPP

/**
 * @file code_format.hpp
 * @brief Container format for arithmetic codes
 *
 * A raw code has no framing: the decoder must be told how many symbols it
 * holds, and packing it into bytes adds padding that must not be read as
 * code. The container stores both lengths in front of the packed code.
 *
 * Layout (all fields big-endian, written MSB first through BitOutputStream):
 * - magic        32 bits  "RATC"
 * - version      32 bits
 * - num_symbols  64 bits  length of the encoded message
 * - num_bits     64 bits  length of the code
 * - code         num_bits bits, zero padded to a whole byte
 */

#include "bit_stream.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace RatcodeFormat {
    // Magic number: "RATC"
    static constexpr uint32_t MAGIC = 0x52415443;

    // File format version
    static constexpr uint32_t VERSION = 1;

    // Header size in bytes
    static constexpr size_t HEADER_SIZE = 24;

    // Conventional file extension
    static constexpr const char* FILE_EXTENSION = ".rac";

    /**
     * @brief A code together with the framing needed to decode it.
     */
    struct CodeContainer {
        uint64_t num_symbols = 0;  // symbols in the encoded message
        BitCode code;              // the code itself
    };

    /**
     * @brief Serialize a container into bytes.
     */
    std::vector<uint8_t> write_container(const CodeContainer& container);

    /**
     * @brief Parse a container.
     * @throw std::runtime_error On a bad magic number, unsupported version or truncated data.
     */
    CodeContainer read_container(const std::vector<uint8_t>& data);

    /**
     * @brief Write a container to a file.
     * @throw std::runtime_error If the file cannot be written.
     */
    void save_container(const std::string& path, const CodeContainer& container);

    /**
     * @brief Read a container from a file.
     * @throw std::runtime_error If the file cannot be read or is malformed.
     */
    CodeContainer load_container(const std::string& path);
}

#endif // CODE_FORMAT_HPP
