#include "code_format.hpp"
#include "ratcode_debug.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace RatcodeFormat {

std::vector<uint8_t> write_container(const CodeContainer& container) {
    std::vector<uint8_t> data;
    data.reserve(HEADER_SIZE + (container.code.size() + 7) / 8);

    {
        BitOutputStream out(data);
        out.write_bits(MAGIC, 32);
        out.write_bits(VERSION, 32);
        out.write_bits(container.num_symbols, 64);
        out.write_bits(container.code.size(), 64);
        out.write_code(container.code);
        out.flush();
    }

    return data;
}

CodeContainer read_container(const std::vector<uint8_t>& data) {
    if (data.size() < HEADER_SIZE) {
        throw std::runtime_error("Container too short for header");
    }

    BitInputStream in(data);
    uint64_t magic = in.read_bits(32);
    if (magic != MAGIC) {
        throw std::runtime_error("Invalid container: bad magic number");
    }
    uint64_t version = in.read_bits(32);
    if (version != VERSION) {
        throw std::runtime_error("Unsupported container version " + std::to_string(version));
    }

    CodeContainer container;
    container.num_symbols = in.read_bits(64);
    uint64_t num_bits = in.read_bits(64);

    // Padding never exceeds 7 bits
    if (num_bits > in.bits_remaining() || in.bits_remaining() - num_bits >= 8) {
        throw std::runtime_error("Container payload does not match its code length");
    }
    container.code = in.read_code(num_bits);

    RATCODE_DEBUG_LOG("read container: " << container.num_symbols << " symbols, "
                      << num_bits << " bits");
    return container;
}

void save_container(const std::string& path, const CodeContainer& container) {
    std::vector<uint8_t> data = write_container(container);

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed writing " + path);
    }
}

CodeContainer load_container(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open " + path + " for reading");
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    return read_container(data);
}

} // namespace RatcodeFormat
