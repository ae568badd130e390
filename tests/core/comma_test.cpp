// Tests for core/comma.h -- comma table and comma compounds.

#include "core/comma.h"

#include <gtest/gtest.h>

#include <numeric>

#include "core/ratio_codec.h"
#include "test_helpers.h"

namespace justpitch {
namespace {

using test_helpers::ratioOf;

// ---------------------------------------------------------------------------
// PrimeCommaTable
// ---------------------------------------------------------------------------

TEST(PrimeCommaTableTest, HelmholtzEllisEntries) {
  PrimeCommaTable table = PrimeCommaTable::helmholtzEllis();
  EXPECT_EQ(table.size(), 13u);
  ASSERT_NE(table.find(5), nullptr);
  EXPECT_EQ(table.find(5)->ratio, ratioOf(80, 81));
  EXPECT_EQ(table.find(7)->ratio, ratioOf(63, 64));
  EXPECT_EQ(table.find(11)->ratio, ratioOf(33, 32));
  EXPECT_EQ(table.find(47)->ratio, ratioOf(752, 729));
  EXPECT_EQ(table.find(3), nullptr);
  EXPECT_EQ(table.find(53), nullptr);
}

TEST(PrimeCommaTableTest, EachCommaCarriesItsPrimeOnce) {
  // Beyond 2 and 3 a comma consists of its own prime in the numerator.
  const PrimeCommaTable table = PrimeCommaTable::helmholtzEllis();
  ASSERT_EQ(table.size(), 13u);
  for (const auto& [prime, comma] : table.entries()) {
    auto exponents = ratioToExponentVector(comma.ratio);
    ASSERT_TRUE(exponents.ok());
    ASSERT_GT(exponents.exponents.size(), 2u);
    int higher_sum = std::accumulate(exponents.exponents.begin() + 2, exponents.exponents.end(), 0);
    EXPECT_EQ(higher_sum, 1) << "prime " << prime;
  }
}

TEST(PrimeCommaTableTest, SetReplacesEntry) {
  PrimeCommaTable table = PrimeCommaTable::helmholtzEllis();
  table.set(5, Comma{ratioOf(81, 80)});
  EXPECT_EQ(table.find(5)->ratio, ratioOf(81, 80));
  EXPECT_EQ(table.size(), 13u);
}

// ---------------------------------------------------------------------------
// CommaCompound
// ---------------------------------------------------------------------------

TEST(CommaCompoundTest, EmptyCompoundIsUnison) {
  CommaCompound compound;
  EXPECT_TRUE(compound.empty());
  EXPECT_EQ(compound.size(), 0);
  EXPECT_EQ(compound.ratio(), ratioOf(1));
  EXPECT_TRUE(compound.commaPowers().empty());
}

TEST(CommaCompoundTest, RatioIsProductOfPowers) {
  CommaCompound compound({{5, 1}, {7, -2}}, PrimeCommaTable::helmholtzEllis());
  EXPECT_EQ(compound.size(), 3);
  auto powers = compound.commaPowers();
  ASSERT_EQ(powers.size(), 2u);
  EXPECT_EQ(powers[0], ratioOf(80, 81));
  EXPECT_EQ(powers[1], ratioOf(4096, 3969));
  EXPECT_EQ(compound.ratio(), ratioOf(80, 81) * ratioOf(4096, 3969));
}

TEST(CommaCompoundTest, ZeroExponentsDropped) {
  CommaCompound compound({{5, 0}, {11, 1}}, PrimeCommaTable::helmholtzEllis());
  EXPECT_EQ(compound.primeExponents().size(), 1u);
  EXPECT_EQ(compound.ratio(), ratioOf(33, 32));
}

TEST(CommaCompoundTest, MissingPrimeSkipped) {
  CommaCompound compound({{5, 1}, {53, 1}}, PrimeCommaTable::helmholtzEllis());
  EXPECT_EQ(compound.size(), 1);
  EXPECT_EQ(compound.ratio(), ratioOf(80, 81));
}

// ---------------------------------------------------------------------------
// ratioPower
// ---------------------------------------------------------------------------

TEST(RatioPowerTest, SignedExponents) {
  EXPECT_EQ(ratioPower(ratioOf(3, 2), 2), ratioOf(9, 4));
  EXPECT_EQ(ratioPower(ratioOf(3, 2), -1), ratioOf(2, 3));
  EXPECT_EQ(ratioPower(ratioOf(3, 2), 0), ratioOf(1));
}

TEST(RatioPowerTest, NegativeBaseInverted) {
  EXPECT_EQ(ratioPower(ratioOf(-3, 2), -1), ratioOf(-2, 3));
  EXPECT_EQ(ratioPower(ratioOf(-3, 2), -2), ratioOf(4, 9));
}

}  // namespace
}  // namespace justpitch
