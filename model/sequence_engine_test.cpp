#include "sequence_engine.h"

#include <vector>

#include "gtest/gtest.h"

namespace fiboblink {
namespace {

std::vector<uint16_t> firstTerms(SequenceVariant select, int count) {
    std::vector<uint16_t> terms;
    SequenceState state = seedSequence();
    for (int i = 0; i < count; ++i) {
        state = advanceSequence(select, state);
        terms.push_back(state.currentValue);
    }
    return terms;
}

TEST(SequenceEngineTest, SeedIsBeforeFirstTerm) {
    const SequenceState seed = seedSequence();
    EXPECT_EQ(seed.currentValue, 0);
    EXPECT_EQ(seed.previousValue, 1);
    EXPECT_EQ(seed.index, 1);
}

TEST(SequenceEngineTest, Fibonacci) {
    const std::vector<uint16_t> expected = {1, 1, 2, 3, 5, 8, 13, 21, 34, 55, 89, 144};
    EXPECT_EQ(firstTerms(SequenceVariant::Fibonacci, 12), expected);
}

TEST(SequenceEngineTest, Primes) {
    const std::vector<uint16_t> expected = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37};
    EXPECT_EQ(firstTerms(SequenceVariant::Prime, 12), expected);
}

TEST(SequenceEngineTest, PerfectSquares) {
    const std::vector<uint16_t> expected = {1, 4, 9, 16, 25, 36, 49, 64};
    EXPECT_EQ(firstTerms(SequenceVariant::PerfectSquare, 8), expected);
}

TEST(SequenceEngineTest, Triangular) {
    const std::vector<uint16_t> expected = {1, 3, 6, 10, 15, 21, 28, 36};
    EXPECT_EQ(firstTerms(SequenceVariant::Triangular, 8), expected);
}

TEST(SequenceEngineTest, IndexCountsAdvances) {
    SequenceState state = seedSequence();
    for (int i = 0; i < 10; ++i) state = advanceSequence(SequenceVariant::Prime, state);
    EXPECT_EQ(state.index, 11);
    EXPECT_EQ(state.currentValue, 29);
    EXPECT_EQ(state.previousValue, 23);
}

TEST(SequenceEngineTest, FibonacciTruncatesToValueField) {
    const std::vector<uint16_t> terms = firstTerms(SequenceVariant::Fibonacci, 30);
    uint32_t a = 1;
    uint32_t b = 1;
    EXPECT_EQ(terms[0], 1);
    EXPECT_EQ(terms[1], 1);
    for (size_t i = 2; i < terms.size(); ++i) {
        const uint32_t c = (a + b) % 4096;
        EXPECT_EQ(terms[i], c) << "term " << i + 1;
        a = b;
        b = c;
    }
    // F(19) = 4181
    EXPECT_EQ(terms[18], 4181 - 4096);
    for (uint16_t term : terms) EXPECT_LE(term, kValueMask);
}

TEST(SequenceEngineTest, SquaresAndTriangularTruncate) {
    SequenceState state;
    state.index = 4096;
    EXPECT_EQ(nextTerm(SequenceVariant::PerfectSquare, state), 0);
    state.index = 100;
    EXPECT_EQ(nextTerm(SequenceVariant::PerfectSquare, state), 10000 % 4096);
    state.index = 65535;
    EXPECT_EQ(nextTerm(SequenceVariant::Triangular, state), 0);
    state.index = 1000;
    EXPECT_EQ(nextTerm(SequenceVariant::Triangular, state), 500500 % 4096);
}

TEST(SequenceEngineTest, IndexWraps) {
    SequenceState state;
    state.index = 65535;
    state = advanceSequence(SequenceVariant::PerfectSquare, state);
    EXPECT_EQ(state.index, 0);
}

TEST(SequenceEngineTest, PrimeSearch) {
    EXPECT_FALSE(isPrime(0));
    EXPECT_FALSE(isPrime(1));
    EXPECT_TRUE(isPrime(2));
    EXPECT_FALSE(isPrime(4));
    EXPECT_TRUE(isPrime(4093));
    EXPECT_FALSE(isPrime(4095));
    EXPECT_EQ(nextPrime(0), 2);
    EXPECT_EQ(nextPrime(1327), 1361);
    EXPECT_EQ(nextPrime(4091), 4093);
    // 4099 does not fit in 12 bits
    EXPECT_EQ(nextPrime(4093), 3);
    // from a composite value the search still lands on the next prime
    EXPECT_EQ(nextPrime(90), 97);
}

TEST(SequenceEngineTest, PrimesWrapAfterLargestFieldPrime) {
    SequenceState state = seedSequence();
    for (int i = 0; i < 564; ++i) state = advanceSequence(SequenceVariant::Prime, state);
    EXPECT_EQ(state.currentValue, 4093);
    state = advanceSequence(SequenceVariant::Prime, state);
    EXPECT_EQ(state.currentValue, 3);
}

// Switching variants keeps the index and trailing pair
TEST(SequenceEngineTest, SwitchingVariantDoesNotReseed) {
    SequenceState state = seedSequence();
    for (int i = 0; i < 5; ++i) state = advanceSequence(SequenceVariant::Fibonacci, state);
    ASSERT_EQ(state.currentValue, 5);
    ASSERT_EQ(state.index, 6);

    state = advanceSequence(SequenceVariant::PerfectSquare, state);
    EXPECT_EQ(state.currentValue, 36);
    EXPECT_EQ(state.previousValue, 5);

    state = advanceSequence(SequenceVariant::Prime, state);
    EXPECT_EQ(state.currentValue, 37);

    state = advanceSequence(SequenceVariant::Fibonacci, state);
    EXPECT_EQ(state.currentValue, 73);
    EXPECT_EQ(state.index, 9);
}

}  // namespace
}  // namespace fiboblink
