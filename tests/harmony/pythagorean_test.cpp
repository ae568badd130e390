// Tests for harmony/pythagorean.h -- comma decomposition, cent deviation,
// and diatonic spelling of just intervals.

#include "harmony/pythagorean.h"

#include <gtest/gtest.h>

#include <cmath>

#include "test_helpers.h"

namespace justpitch {
namespace {

using test_helpers::pitchOf;
using test_helpers::ratioOf;

// ---------------------------------------------------------------------------
// Comma decomposition
// ---------------------------------------------------------------------------

TEST(HelmholtzEllisCommasTest, CollectsPrimesAboveThree) {
  CommaCompound commas = helmholtzEllisCommas(pitchOf("35/32"));
  EXPECT_EQ(commas.primeExponents(), (std::map<uint64_t, int>{{5, 1}, {7, 1}}));
  EXPECT_EQ(commas.ratio(), ratioOf(80 * 63, 81 * 64));
}

TEST(HelmholtzEllisCommasTest, PythagoreanPitchHasNoCommas) {
  EXPECT_TRUE(helmholtzEllisCommas(pitchOf("3/2")).empty());
  EXPECT_TRUE(helmholtzEllisCommas(pitchOf("1/1")).empty());
}

TEST(ClosestPythagoreanIntervalTest, ReferenceValues) {
  EXPECT_EQ(closestPythagoreanInterval(pitchOf("5/4")).ratio(), ratioOf(81, 64));
  EXPECT_EQ(closestPythagoreanInterval(pitchOf("11/8")).ratio(), ratioOf(4, 3));
  EXPECT_EQ(closestPythagoreanInterval(pitchOf("8/7")).ratio(), ratioOf(9, 8));
}

TEST(ClosestPythagoreanIntervalTest, PythagoreanPitchIsOnlyFolded) {
  EXPECT_EQ(closestPythagoreanInterval(pitchOf("3/1")).ratio(), ratioOf(3, 2));
  EXPECT_EQ(closestPythagoreanInterval(pitchOf("1/1")).ratio(), ratioOf(1));
}

TEST(ClosestPythagoreanIntervalTest, EmptyTableLeavesPrimes) {
  PrimeCommaTable table;
  EXPECT_EQ(closestPythagoreanInterval(pitchOf("5/2"), table).ratio(), ratioOf(5, 4));
}

// ---------------------------------------------------------------------------
// Cent deviation
// ---------------------------------------------------------------------------

TEST(CentDeviationTest, RoundedReferenceValues) {
  EXPECT_EQ(std::round(centDeviationFromClosestWesternPitchClass(pitchOf("5/4"))), -14);
  EXPECT_EQ(std::round(centDeviationFromClosestWesternPitchClass(pitchOf("5/3"))), -16);
  EXPECT_EQ(std::round(centDeviationFromClosestWesternPitchClass(pitchOf("9/8"))), 4);
  EXPECT_EQ(std::round(centDeviationFromClosestWesternPitchClass(pitchOf("11/8"))), 51);
}

TEST(CentDeviationTest, UnisonHasNoDeviation) {
  EXPECT_NEAR(centDeviationFromClosestWesternPitchClass(pitchOf("1/1")), 0.0, 1e-9);
  EXPECT_NEAR(centDeviationFromClosestWesternPitchClass(pitchOf("2/1")), 0.0, 1e-9);
}

// ---------------------------------------------------------------------------
// Pitch names
// ---------------------------------------------------------------------------

TEST(PitchNameTest, AboveC) {
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("7/4"), "c"), "bf");
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("5/4"), "c"), "e");
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("4/5"), "c"), "af");
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("1/5"), "c"), "af");
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("128/25"), "c"), "ff");
}

TEST(PitchNameTest, OtherReferences) {
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("5/4")), "cs");
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("5/4"), "a"), "cs");
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("11/8"), "e"), "a");
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("3/2"), "bf"), "f");
  EXPECT_EQ(closestPythagoreanPitchName(pitchOf("1/1"), "fs"), "fs");
}

TEST(PitchNameTest, InvalidReference) {
  EXPECT_FALSE(closestPythagoreanPitchName(pitchOf("3/2"), "").has_value());
  EXPECT_FALSE(closestPythagoreanPitchName(pitchOf("3/2"), "h").has_value());
}

// ---------------------------------------------------------------------------
// Accidentals
// ---------------------------------------------------------------------------

TEST(AccidentalsTest, Count) {
  EXPECT_EQ(countAccidentals("f"), -1);
  EXPECT_EQ(countAccidentals("s"), 1);
  EXPECT_EQ(countAccidentals("sss"), 3);
  EXPECT_EQ(countAccidentals(""), 0);
  EXPECT_EQ(countAccidentals("ssf"), 1);
}

TEST(AccidentalsTest, UnknownSymbolsIgnored) {
  EXPECT_EQ(countAccidentals("sx"), 1);
}

TEST(AccidentalsTest, FromCount) {
  EXPECT_EQ(accidentalsFromCount(2), "ss");
  EXPECT_EQ(accidentalsFromCount(-2), "ff");
  EXPECT_EQ(accidentalsFromCount(0), "");
  EXPECT_EQ(accidentalsFromCount(-1), "f");
}

}  // namespace
}  // namespace justpitch
