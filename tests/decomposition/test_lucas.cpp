/// @file tests/decomposition/test_lucas.cpp
/// @brief Unit tests for the Lucas decomposer and its selection policy.
///
/// Test categories:
///   1. Literal decompositions around the L(1) < L(0) < L(2) ordering
///   2. Invariants over a range: exact sum, decreasing, non-adjacent,
///      never both L(0) and L(2), no repeated index
///   3. A single term exactly at Lucas numbers
///   4. Rejected inputs and invalid representations

#include <gtest/gtest.h>
#include "zeck/decomposition.hpp"
#include "zeck/sequences.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <vector>

using namespace zeck;
using namespace zeck::decomposition;

namespace {

std::vector<Index> lucas_indices(std::int64_t n) {
    auto rep = decompose_lucas(n);
    return rep ? rep->indices : std::vector<Index>{};
}

} // anonymous namespace

// ─── Literal cases ────────────────────────────────────────────────────────────

TEST(Lucas_Literal, Zero_IsEmpty) {
    auto rep = decompose_lucas(std::int64_t{0});
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->count(), 0u);
    EXPECT_EQ(to_string(*rep), "0 = 0");
}

TEST(Lucas_Literal, BaseValues) {
    EXPECT_EQ(lucas_indices(1), (std::vector<Index>{1}));
    EXPECT_EQ(lucas_indices(2), (std::vector<Index>{0}));
    EXPECT_EQ(lucas_indices(3), (std::vector<Index>{2}));
    EXPECT_EQ(lucas_indices(4), (std::vector<Index>{3}));
}

TEST(Lucas_Literal, ResidualOfOneTakesL1) {
    EXPECT_EQ(lucas_indices(5), (std::vector<Index>{3, 1}));
}

TEST(Lucas_Literal, ResidualOfTwoTakesL0) {
    EXPECT_EQ(lucas_indices(6), (std::vector<Index>{3, 0}));
    EXPECT_EQ(lucas_indices(9), (std::vector<Index>{4, 0}));
}

TEST(Lucas_Literal, ResidualOfThreeTakesL2) {
    EXPECT_EQ(lucas_indices(10), (std::vector<Index>{4, 2}));
}

TEST(Lucas_Literal, ToString) {
    auto rep = decompose_lucas(std::int64_t{10});
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(to_string(*rep), "10 = L(4) + L(2) = 7 + 3");
    EXPECT_EQ(rep->basis, SequenceKind::Lucas);
}

TEST(Lucas_Literal, CountMatchesSmallFixture) {
    const std::vector<std::size_t> ell = {0, 1, 1, 1, 1, 2, 2, 1, 2, 2, 2,
                                          1, 2, 2, 2, 2, 3, 3, 1, 2, 2};
    for (std::size_t n = 0; n < ell.size(); ++n) {
        auto rep = decompose_lucas(static_cast<std::int64_t>(n));
        ASSERT_TRUE(rep.has_value());
        EXPECT_EQ(rep->count(), ell[n]) << "n=" << n;
    }
}

// ─── Invariants ───────────────────────────────────────────────────────────────

TEST(Lucas_Invariants, CanonicalFormUpTo50000) {
    auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas, BigInt{50000});
    ASSERT_TRUE(luc.has_value());
    for (long n = 0; n <= 50000; ++n) {
        auto rep = decompose_lucas(BigInt{n}, *luc);
        ASSERT_TRUE(rep.has_value()) << "n=" << n;
        ASSERT_EQ(rep->sum(), n);

        const std::set<Index> unique(rep->indices.begin(), rep->indices.end());
        ASSERT_EQ(unique.size(), rep->indices.size()) << "repeat at n=" << n;
        for (std::size_t k = 1; k < rep->indices.size(); ++k) {
            ASSERT_GE(rep->indices[k - 1], rep->indices[k] + 2) << "n=" << n;
        }
        ASSERT_FALSE(unique.count(0) && unique.count(2)) << "n=" << n;
    }
}

TEST(Lucas_Invariants, CountFastPathMatchesRepresentation) {
    auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas, BigInt{5000});
    ASSERT_TRUE(luc.has_value());
    for (long n = 0; n <= 5000; ++n) {
        auto rep = decompose_lucas(BigInt{n}, *luc);
        auto cnt = lucas_count(BigInt{n}, *luc);
        ASSERT_TRUE(rep.has_value());
        ASSERT_TRUE(cnt.has_value());
        EXPECT_EQ(*cnt, rep->count()) << "n=" << n;
    }
}

TEST(Lucas_Invariants, BeyondInt64_RoundTrips) {
    const BigInt n = *sequences::lucas(180) + *sequences::lucas(120) + 1;
    auto rep = decompose_lucas(n);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->sum(), n);
    EXPECT_EQ(rep->indices.front(), Index{180});
    EXPECT_TRUE(is_valid(*rep));
}

// ─── Single term iff Lucas ────────────────────────────────────────────────────

TEST(Lucas_SingleTerm, ExactlyAtLucasNumbers) {
    for (std::int64_t n = 1; n <= 5000; ++n) {
        auto rep = decompose_lucas(n);
        ASSERT_TRUE(rep.has_value());
        const bool is_lucas = sequences::is_lucas_number(BigInt{static_cast<long>(n)});
        EXPECT_EQ(rep->count() == 1, is_lucas) << "n=" << n;
    }
}

// ─── Rejected inputs ──────────────────────────────────────────────────────────

TEST(Lucas_InvalidArgument, Negative_ReturnsNullopt) {
    EXPECT_FALSE(decompose_lucas(std::int64_t{-2}).has_value());
    EXPECT_FALSE(decompose_lucas(BigInt{-2}).has_value());
}

TEST(Lucas_InvalidArgument, WrongOrShortTable_ReturnsNullopt) {
    auto fib = sequences::SequenceTable::up_to_value(SequenceKind::Fibonacci, BigInt{100});
    auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas, BigInt{10});
    ASSERT_TRUE(fib.has_value());
    ASSERT_TRUE(luc.has_value());
    EXPECT_FALSE(decompose_lucas(BigInt{50}, *fib).has_value());
    EXPECT_FALSE(decompose_lucas(BigInt{50}, *luc).has_value());
    EXPECT_FALSE(lucas_count(BigInt{50}, *luc).has_value());
}

TEST(Lucas_Validity, L0WithL2_IsInvalid) {
    const Representation rep{BigInt{5}, SequenceKind::Lucas, {2, 0}, {BigInt{3}, BigInt{2}}};
    EXPECT_FALSE(is_valid(rep));
}

TEST(Lucas_Validity, AdjacentIndices_AreInvalid) {
    const Representation rep{BigInt{11}, SequenceKind::Lucas, {4, 3}, {BigInt{7}, BigInt{4}}};
    EXPECT_FALSE(is_valid(rep));
}

TEST(Lucas_Validity, L0WithL3_IsValid) {
    const Representation rep{BigInt{6}, SequenceKind::Lucas, {3, 0}, {BigInt{4}, BigInt{2}}};
    EXPECT_TRUE(is_valid(rep));
}
