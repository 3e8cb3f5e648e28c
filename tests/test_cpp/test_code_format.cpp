#include <gtest/gtest.h>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include "arithmetic_coder.hpp"
#include "code_format.hpp"
#include "dirichlet_model.hpp"

namespace {

RatcodeFormat::CodeContainer golden_container() {
    RatcodeFormat::CodeContainer container;
    container.num_symbols = 8;
    container.code = bit_code_from_string("00011110011110010");
    return container;
}

} // namespace

// Test: WriteContainer_Layout
TEST(CodeFormatTest, WriteContainer_Layout) {
    std::vector<uint8_t> data = RatcodeFormat::write_container(golden_container());

    std::vector<uint8_t> expected = {
        0x52, 0x41, 0x54, 0x43,                          // "RATC"
        0x00, 0x00, 0x00, 0x01,                          // version 1
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x08,  // 8 symbols
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x11,  // 17 bits
        0x1E, 0x79, 0x00                                 // 00011110 01111001 0(0000000)
    };
    EXPECT_EQ(data, expected);
    EXPECT_EQ(data.size(), RatcodeFormat::HEADER_SIZE + 3);
}

// Test: ReadContainer_RoundTrip
TEST(CodeFormatTest, ReadContainer_RoundTrip) {
    RatcodeFormat::CodeContainer original = golden_container();

    RatcodeFormat::CodeContainer parsed =
        RatcodeFormat::read_container(RatcodeFormat::write_container(original));

    EXPECT_EQ(parsed.num_symbols, original.num_symbols);
    EXPECT_EQ(parsed.code, original.code);
}

// Test: ReadContainer_EmptyCode
TEST(CodeFormatTest, ReadContainer_EmptyCode) {
    RatcodeFormat::CodeContainer empty;
    std::vector<uint8_t> data = RatcodeFormat::write_container(empty);
    EXPECT_EQ(data.size(), RatcodeFormat::HEADER_SIZE);

    RatcodeFormat::CodeContainer parsed = RatcodeFormat::read_container(data);
    EXPECT_EQ(parsed.num_symbols, 0u);
    EXPECT_TRUE(parsed.code.empty());
}

// Test: ReadContainer_InvalidMagic
TEST(CodeFormatTest, ReadContainer_InvalidMagic) {
    std::vector<uint8_t> data = RatcodeFormat::write_container(golden_container());
    data[0] = 0xDE;
    EXPECT_THROW(RatcodeFormat::read_container(data), std::runtime_error);
}

// Test: ReadContainer_InvalidVersion
TEST(CodeFormatTest, ReadContainer_InvalidVersion) {
    std::vector<uint8_t> data = RatcodeFormat::write_container(golden_container());
    data[7] = 0x63;
    EXPECT_THROW(RatcodeFormat::read_container(data), std::runtime_error);
}

// Test: ReadContainer_Truncated
TEST(CodeFormatTest, ReadContainer_Truncated) {
    std::vector<uint8_t> data = RatcodeFormat::write_container(golden_container());

    std::vector<uint8_t> short_header(data.begin(), data.begin() + 10);
    EXPECT_THROW(RatcodeFormat::read_container(short_header), std::runtime_error);

    std::vector<uint8_t> short_payload(data.begin(), data.end() - 1);
    EXPECT_THROW(RatcodeFormat::read_container(short_payload), std::runtime_error);
}

// Test: ReadContainer_TrailingBytes
TEST(CodeFormatTest, ReadContainer_TrailingBytes) {
    std::vector<uint8_t> data = RatcodeFormat::write_container(golden_container());
    data.push_back(0x00);
    EXPECT_THROW(RatcodeFormat::read_container(data), std::runtime_error);
}

// Test: SaveLoad_RoundTrip
TEST(CodeFormatTest, SaveLoad_RoundTrip) {
    DirichletModel model(std::map<Symbol, int64_t>{{'a', 1}, {'b', 1}, {'c', 1}});
    std::string message = "abccbaabcabcccab";

    RatcodeFormat::CodeContainer container;
    container.num_symbols = message.size();
    container.code = encode(model, message);

    std::string test_file = std::string("/tmp/test_save_load") + RatcodeFormat::FILE_EXTENSION;
    RatcodeFormat::save_container(test_file, container);

    RatcodeFormat::CodeContainer loaded = RatcodeFormat::load_container(test_file);
    EXPECT_EQ(loaded.code, container.code);
    EXPECT_EQ(decode(model, loaded.code, loaded.num_symbols), message);

    std::remove(test_file.c_str());
}

// Test: LoadContainer_MissingFile
TEST(CodeFormatTest, LoadContainer_MissingFile) {
    EXPECT_THROW(RatcodeFormat::load_container("/tmp/ratcode_no_such_file.rac"),
                 std::runtime_error);
}

// Test: SaveContainer_FileSize
TEST(CodeFormatTest, SaveContainer_FileSize) {
    std::string test_file = "/tmp/test_container_size.rac";
    RatcodeFormat::save_container(test_file, golden_container());

    std::ifstream file(test_file, std::ios::binary | std::ios::ate);
    ASSERT_TRUE(file.is_open());
    std::streampos file_size = file.tellg();
    file.close();

    EXPECT_EQ(static_cast<size_t>(file_size), RatcodeFormat::HEADER_SIZE + 3);

    std::remove(test_file.c_str());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
