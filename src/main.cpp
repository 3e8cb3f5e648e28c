/**
 * @file main.cpp
 * @brief Command line front end for the arithmetic coder.
 *
 *   ratcode -p a:1,b:1,c:1 encode aabbaacc      prints 00011110011110010
 *   ratcode -p a:1,b:1,c:1 decode 00011110011110010 8
 *   ratcode -a abc -i message.txt -o message.rac encode
 *   ratcode -a abc -d message.rac decode
 */

#include "arithmetic_coder.hpp"
#include "code_format.hpp"
#include "dirichlet_model.hpp"
#include "ratcode_errors.hpp"
#include "static_model.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct CommandLine {
    std::map<Symbol, int64_t> counts;
    bool static_model = false;
    bool verbose = false;
    EncoderOptions options;
    std::string input_path;      // -i: message file
    std::string output_path;     // -o: container to write
    std::string container_path;  // -d: container to decode
};

void usage() {
    std::cerr <<
        "usage: ratcode (-p PRIORS | -a ALPHABET) [options] encode [TEXT]\n"
        "       ratcode (-p PRIORS | -a ALPHABET) [options] decode (BITS COUNT | -d FILE)\n"
        "\n"
        "  -p PRIORS    prior counts, e.g. a:1,b:1,c:2\n"
        "  -a ALPHABET  every character of ALPHABET with prior count 1\n"
        "  -s           static model (counts are fixed weights)\n"
        "  -m BITS      fail if the code would exceed BITS bits\n"
        "  -i FILE      read the message from FILE\n"
        "  -o FILE      write a container to FILE instead of printing bits\n"
        "  -d FILE      decode the container in FILE\n"
        "  -v           report sizes on stderr\n";
}

uint64_t parse_unsigned(const std::string& text, const char* what) {
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno != 0 || text[0] == '-') {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
    }
    return value;
}

// "a:1,b:1,c:2"; the symbol is the single character before each ':'
std::map<Symbol, int64_t> parse_priors(const std::string& text) {
    std::map<Symbol, int64_t> counts;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find(',', pos + 2);
        std::string entry = text.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        if (entry.size() < 3 || entry[1] != ':') {
            throw std::invalid_argument("Invalid prior entry: " + entry);
        }

        errno = 0;
        char* tail = nullptr;
        long long count = std::strtoll(entry.c_str() + 2, &tail, 10);
        if (*tail != '\0' || errno != 0) {
            throw std::invalid_argument("Invalid prior count: " + entry);
        }
        if (!counts.emplace(entry[0], count).second) {
            throw InvalidPriorError(entry[0], "Symbol listed twice");
        }

        if (end == std::string::npos) {
            break;
        }
        pos = end + 1;
    }
    return counts;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open " + path + " for reading");
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::unique_ptr<ProbabilityModel> make_model(const CommandLine& cmd) {
    if (cmd.static_model) {
        return std::make_unique<StaticModel>(cmd.counts);
    }
    return std::make_unique<DirichletModel>(cmd.counts);
}

int run_encode(const CommandLine& cmd, char** args, int num_args) {
    SymbolSequence message;
    if (!cmd.input_path.empty()) {
        if (num_args != 0) {
            usage();
            return 1;
        }
        message = read_file(cmd.input_path);
    } else if (num_args == 1) {
        message = args[0];
    } else if (num_args != 0) {
        usage();
        return 1;
    }

    std::unique_ptr<ProbabilityModel> model = make_model(cmd);
    BitCode code = encode(*model, message, cmd.options);

    if (cmd.verbose) {
        std::cerr << "ratcode: " << message.size() << " symbols -> " << code.size() << " bits\n";
    }

    if (!cmd.output_path.empty()) {
        RatcodeFormat::CodeContainer container;
        container.num_symbols = message.size();
        container.code = code;
        RatcodeFormat::save_container(cmd.output_path, container);
    } else {
        std::cout << bit_code_to_string(code) << "\n";
    }
    return 0;
}

int run_decode(const CommandLine& cmd, char** args, int num_args) {
    RatcodeFormat::CodeContainer container;
    if (!cmd.container_path.empty()) {
        if (num_args != 0) {
            usage();
            return 1;
        }
        container = RatcodeFormat::load_container(cmd.container_path);
    } else if (num_args == 2) {
        container.code = bit_code_from_string(args[0]);
        container.num_symbols = parse_unsigned(args[1], "symbol count");
    } else {
        usage();
        return 1;
    }

    std::unique_ptr<ProbabilityModel> model = make_model(cmd);
    SymbolSequence message = decode(*model, container.code, container.num_symbols);

    if (cmd.verbose) {
        std::cerr << "ratcode: " << container.code.size() << " bits -> "
                  << message.size() << " symbols\n";
    }

    if (!cmd.output_path.empty()) {
        std::ofstream file(cmd.output_path, std::ios::binary);
        if (!file || !file.write(message.data(), static_cast<std::streamsize>(message.size()))) {
            throw std::runtime_error("Cannot write " + cmd.output_path);
        }
    } else {
        std::cout << message << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    bool have_model = false;

    try {
        int opt;
        while ((opt = getopt(argc, argv, "p:a:sm:i:o:d:vh")) != -1) {
            switch (opt) {
            case 'p':
                cmd.counts = parse_priors(optarg);
                have_model = true;
                break;
            case 'a':
                cmd.counts.clear();
                for (const char* c = optarg; *c != '\0'; ++c) {
                    cmd.counts[*c] = 1;
                }
                have_model = true;
                break;
            case 's':
                cmd.static_model = true;
                break;
            case 'm':
                cmd.options.max_code_bits = parse_unsigned(optarg, "bit limit");
                break;
            case 'i':
                cmd.input_path = optarg;
                break;
            case 'o':
                cmd.output_path = optarg;
                break;
            case 'd':
                cmd.container_path = optarg;
                break;
            case 'v':
                cmd.verbose = true;
                break;
            case 'h':
                usage();
                return 0;
            default:
                usage();
                return 1;
            }
        }

        if (!have_model || optind >= argc) {
            usage();
            return 1;
        }

        std::string command = argv[optind];
        char** args = argv + optind + 1;
        int num_args = argc - optind - 1;

        if (command == "encode") {
            return run_encode(cmd, args, num_args);
        }
        if (command == "decode") {
            return run_decode(cmd, args, num_args);
        }
        usage();
        return 1;
    } catch (const UnknownSymbolError& e) {
        std::cerr << "ratcode: unknown symbol: " << e.what() << "\n";
    } catch (const InvalidPriorError& e) {
        std::cerr << "ratcode: invalid prior: " << e.what() << "\n";
    } catch (const PrecisionOverflowError& e) {
        std::cerr << "ratcode: precision overflow: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ratcode: " << e.what() << "\n";
    }
    return 1;
}
