// Tests for core/exponent_vector.h -- padding, arithmetic, trimming, folding.

#include "core/exponent_vector.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace justpitch {
namespace {

using test_helpers::ratioOf;

// ---------------------------------------------------------------------------
// padExponents / trimTrailingZeros
// ---------------------------------------------------------------------------

TEST(PadExponentsTest, PadsShorterVector) {
  ExponentVector lhs = {1};
  ExponentVector rhs = {0, 2, -1};
  auto [padded_lhs, padded_rhs] = padExponents(lhs, rhs);
  EXPECT_EQ(padded_lhs, (ExponentVector{1, 0, 0}));
  EXPECT_EQ(padded_rhs, (ExponentVector{0, 2, -1}));
  // Inputs untouched.
  EXPECT_EQ(lhs, (ExponentVector{1}));
}

TEST(TrimTrailingZerosTest, DropsOnlyTrailingZeros) {
  ExponentVector exponents = {0, 1, 0, 0};
  trimTrailingZeros(exponents);
  EXPECT_EQ(exponents, (ExponentVector{0, 1}));

  ExponentVector zeros = {0, 0};
  trimTrailingZeros(zeros);
  EXPECT_TRUE(zeros.empty());

  ExponentVector empty;
  trimTrailingZeros(empty);
  EXPECT_TRUE(empty.empty());
}

TEST(TrimTrailingZerosTest, IsCanonical) {
  EXPECT_TRUE(isCanonical({}));
  EXPECT_TRUE(isCanonical({0, 1}));
  EXPECT_FALSE(isCanonical({1, 0}));
}

// ---------------------------------------------------------------------------
// add / subtract / negate
// ---------------------------------------------------------------------------

TEST(ExponentArithmeticTest, Add) {
  EXPECT_EQ(addExponents({-1, 1}, {-2, 0, 1}), (ExponentVector{-3, 1, 1}));
  EXPECT_EQ(addExponents({}, {0, 1}), (ExponentVector{0, 1}));
}

TEST(ExponentArithmeticTest, AddCancelsToCanonical) {
  EXPECT_EQ(addExponents({0, 0, 1}, {1, 0, -1}), (ExponentVector{1}));
  EXPECT_TRUE(addExponents({-1, 1}, {1, -1}).empty());
}

TEST(ExponentArithmeticTest, Subtract) {
  EXPECT_EQ(subtractExponents({-1, 1}, {-2, 0, 1}), (ExponentVector{1, 1, -1}));
  EXPECT_TRUE(subtractExponents({2, 1}, {2, 1}).empty());
}

TEST(ExponentArithmeticTest, Negate) {
  EXPECT_EQ(negateExponents({-1, 1}), (ExponentVector{1, -1}));
  EXPECT_TRUE(negateExponents({}).empty());
}

// ---------------------------------------------------------------------------
// intersectExponents
// ---------------------------------------------------------------------------

TEST(IntersectExponentsTest, SameSignKeepsSmallerMagnitude) {
  EXPECT_EQ(intersectExponents({0, 3}, {0, 2}, false), (ExponentVector{0, 2}));
  EXPECT_EQ(intersectExponents({-3, 1, 1}, {-4, 1, 0, 1}, false), (ExponentVector{-3, 1}));
}

TEST(IntersectExponentsTest, MixedSignAndZeroGiveZero) {
  EXPECT_TRUE(intersectExponents({1, -1}, {-1, 1}, false).empty());
  EXPECT_TRUE(intersectExponents({0, 0, 1}, {0, 1}, false).empty());
}

TEST(IntersectExponentsTest, StrictKeepsOnlyEqualExponents) {
  EXPECT_TRUE(intersectExponents({0, 3}, {0, 2}, true).empty());
  EXPECT_EQ(intersectExponents({0, -1, 1}, {-1, -1, 0, 1}, true), (ExponentVector{0, -1}));
}

// ---------------------------------------------------------------------------
// ratioAdjust
// ---------------------------------------------------------------------------

TEST(RatioAdjustTest, FoldsIntoOctave) {
  EXPECT_EQ(ratioAdjust(ratioOf(3), 2), ratioOf(3, 2));
  EXPECT_EQ(ratioAdjust(ratioOf(5, 6), 2), ratioOf(5, 3));
  EXPECT_EQ(ratioAdjust(ratioOf(27, 7), 2), ratioOf(27, 14));
  EXPECT_EQ(ratioAdjust(ratioOf(2), 2), ratioOf(1));
}

TEST(RatioAdjustTest, OtherPeriods) {
  EXPECT_EQ(ratioAdjust(ratioOf(10), 3), ratioOf(10, 9));
  EXPECT_EQ(ratioAdjust(ratioOf(1, 2), 3), ratioOf(3, 2));
}

TEST(RatioAdjustTest, BorderOneIsNoOp) {
  EXPECT_EQ(ratioAdjust(ratioOf(7, 3), 1), ratioOf(7, 3));
  EXPECT_EQ(ratioAdjust(ratioOf(1, 9), 0), ratioOf(1, 9));
}

TEST(RatioAdjustTest, Idempotent) {
  for (auto ratio : {ratioOf(9, 7), ratioOf(1, 11), ratioOf(81, 2)}) {
    Ratio once = ratioAdjust(ratio, 2);
    EXPECT_EQ(ratioAdjust(once, 2), once);
  }
}

}  // namespace
}  // namespace justpitch
