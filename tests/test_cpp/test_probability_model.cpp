#include <gtest/gtest.h>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>
#include "dirichlet_model.hpp"
#include "mock_probability_model.hpp"
#include "probability_model.hpp"
#include "ratcode_errors.hpp"
#include "static_model.hpp"

namespace {

using Counts = std::map<Symbol, int64_t>;

Rational frac(long num, long den) {
    Rational r(num, den);
    r.canonicalize();
    return r;
}

Distribution make_distribution(const std::vector<Symbol>& symbols,
                               const std::vector<Rational>& probabilities) {
    return Distribution(std::make_shared<const Alphabet>(symbols), probabilities);
}

} // namespace

// ============================================================================
//  Alphabet
// ============================================================================

// Test: Alphabet_SortedOnConstruction
TEST(AlphabetTest, SortedOnConstruction) {
    Alphabet alphabet({'c', 'a', 'b'});

    ASSERT_EQ(alphabet.size(), 3u);
    EXPECT_EQ(alphabet.symbol_at(0), 'a');
    EXPECT_EQ(alphabet.symbol_at(1), 'b');
    EXPECT_EQ(alphabet.symbol_at(2), 'c');
    EXPECT_EQ(alphabet.index_of('c'), 2u);
}

// Test: Alphabet_UnsignedByteOrder
TEST(AlphabetTest, UnsignedByteOrder) {
    // 0xE9 sorts after ASCII whatever the signedness of char
    const char high = static_cast<char>(0xE9);
    Alphabet alphabet({high, 'z', 'A'});

    EXPECT_EQ(alphabet.symbol_at(0), 'A');
    EXPECT_EQ(alphabet.symbol_at(1), 'z');
    EXPECT_EQ(alphabet.symbol_at(2), high);
    EXPECT_TRUE(Alphabet::precedes('z', high));
}

// Test: Alphabet_Membership
TEST(AlphabetTest, Membership) {
    Alphabet alphabet({'x', 'y'});

    EXPECT_TRUE(alphabet.contains('x'));
    EXPECT_FALSE(alphabet.contains('w'));
    EXPECT_THROW(alphabet.index_of('w'), UnknownSymbolError);
    EXPECT_THROW(alphabet.symbol_at(2), std::out_of_range);
}

// Test: Alphabet_Invalid
TEST(AlphabetTest, Invalid) {
    EXPECT_THROW(Alphabet(std::vector<Symbol>{}), std::invalid_argument);
    EXPECT_THROW(Alphabet({'a', 'b', 'a'}), std::invalid_argument);
}

// ============================================================================
//  Distribution / cdf_interval
// ============================================================================

// Test: CdfInterval_AlphabetOrder
TEST(CdfIntervalTest, AlphabetOrder) {
    Distribution p = make_distribution({'a', 'b', 'c'}, {frac(1, 2), frac(1, 3), frac(1, 6)});

    EXPECT_EQ(cdf_interval(p, 'a'), Interval(Rational(0), frac(1, 2)));
    EXPECT_EQ(cdf_interval(p, 'b'), Interval(frac(1, 2), frac(5, 6)));
    EXPECT_EQ(cdf_interval(p, 'c'), Interval(frac(5, 6), Rational(1)));
}

// Test: CdfInterval_FromDirichletModel
TEST(CdfIntervalTest, FromDirichletModel) {
    DirichletModel model(Counts{{'a', 1}, {'b', 1}, {'c', 1}});

    // After "ab": a:2, b:2, c:1
    EXPECT_EQ(cdf_interval(model.predict("ab"), 'c'), Interval(frac(4, 5), Rational(1)));
    EXPECT_EQ(cdf_interval(model.predict("ab"), 'b'), Interval(frac(2, 5), frac(4, 5)));
}

// Test: CdfInterval_UnknownSymbol
TEST(CdfIntervalTest, UnknownSymbol) {
    Distribution p = make_distribution({'a', 'b'}, {frac(1, 2), frac(1, 2)});

    try {
        cdf_interval(p, 'q');
        FAIL() << "expected UnknownSymbolError";
    } catch (const UnknownSymbolError& e) {
        EXPECT_EQ(e.symbol(), 'q');
    }
}

// Test: Distribution_Locate
TEST(DistributionTest, Locate) {
    Distribution p = make_distribution({'a', 'b', 'c'}, {frac(1, 2), frac(1, 3), frac(1, 6)});

    EXPECT_EQ(p.locate(Rational(0)), 'a');
    EXPECT_EQ(p.locate(frac(1, 2)), 'b');   // lower bounds are inclusive
    EXPECT_EQ(p.locate(frac(4, 5)), 'b');
    EXPECT_EQ(p.locate(frac(5, 6)), 'c');
    EXPECT_THROW(p.locate(Rational(1)), std::out_of_range);
    EXPECT_THROW(p.locate(frac(-1, 2)), std::out_of_range);
}

// Test: Distribution_LocateSkipsZeroProbability
TEST(DistributionTest, LocateSkipsZeroProbability) {
    Distribution p = make_distribution({'a', 'b', 'c'}, {frac(1, 2), Rational(0), frac(1, 2)});

    EXPECT_EQ(p.locate(frac(1, 2)), 'c');
    EXPECT_TRUE(cdf_interval(p, 'b').empty());
}

// Test: Distribution_Invalid
TEST(DistributionTest, Invalid) {
    auto alphabet = std::make_shared<const Alphabet>(std::vector<Symbol>{'a', 'b'});

    EXPECT_THROW(Distribution(alphabet, {frac(1, 2)}), std::invalid_argument);
    EXPECT_THROW(Distribution(alphabet, {frac(3, 2), frac(-1, 2)}), std::invalid_argument);
    EXPECT_THROW(Distribution(nullptr, {}), std::invalid_argument);
}

// ============================================================================
//  StaticModel
// ============================================================================

// Test: StaticModel_IgnoresHistory
TEST(StaticModelTest, IgnoresHistory) {
    StaticModel model(Counts{{'a', 3}, {'b', 1}});

    EXPECT_EQ(model.predict("").probability('a'), frac(3, 4));
    EXPECT_EQ(model.predict("bbbbbbb").probability('a'), frac(3, 4));
    EXPECT_EQ(model.predict("bbbbbbb").total(), 1);
}

// Test: StaticModel_ValidatesSymbolsAndWeights
TEST(StaticModelTest, ValidatesSymbolsAndWeights) {
    StaticModel model(Counts{{'a', 3}, {'b', 1}});

    EXPECT_THROW(model.predict("abc"), UnknownSymbolError);
    EXPECT_THROW(StaticModel(Counts{{'a', 0}}), InvalidPriorError);
    EXPECT_THROW(StaticModel(Counts{}), InvalidPriorError);
}

// ============================================================================
//  ProbabilityModel::predict
// ============================================================================

// Test: Predict_ReplaysThroughFreshState
TEST(ProbabilityModelTest, Predict_ReplaysThroughFreshState) {
    MockProbabilityModel model("xyz");

    Distribution p = model.predict("zxy");

    EXPECT_EQ(p.probability('y'), frac(1, 3));
    EXPECT_EQ(model.count_calls(MockProbabilityModel::RecordedCall::START), 1u);
    EXPECT_EQ(model.updated_symbols(), "zxy");
    EXPECT_EQ(model.count_calls(MockProbabilityModel::RecordedCall::DISTRIBUTION), 1u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
