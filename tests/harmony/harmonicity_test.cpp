// Tests for harmony/harmonicity.h -- Barlow, Euler, Tenney, Vogel and Wilson
// measures of just intervals.

#include "harmony/harmonicity.h"

#include <gtest/gtest.h>

#include <cmath>

#include "test_helpers.h"

namespace justpitch {
namespace {

using test_helpers::pitchOf;

JustIntonationPitch fifth() { return JustIntonationPitch(ExponentVector{-1, 1}); }
JustIntonationPitch unison() { return JustIntonationPitch(ExponentVector{}); }
JustIntonationPitch majorThird() { return JustIntonationPitch(ExponentVector{-2, 0, 1}); }
JustIntonationPitch fortieth() { return JustIntonationPitch(ExponentVector{-3, 0, -1}); }

// ---------------------------------------------------------------------------
// Indigestibility
// ---------------------------------------------------------------------------

TEST(IndigestibilityTest, SmallIntegers) {
  EXPECT_DOUBLE_EQ(indigestibility(1), 0.0);
  EXPECT_DOUBLE_EQ(indigestibility(2), 1.0);
  EXPECT_DOUBLE_EQ(indigestibility(3), 2.6666666666666665);
  EXPECT_DOUBLE_EQ(indigestibility(4), 2.0);
  EXPECT_DOUBLE_EQ(indigestibility(5), 6.4);
  EXPECT_DOUBLE_EQ(indigestibility(6), 3.6666666666666665);
  EXPECT_DOUBLE_EQ(indigestibility(8), 3.0);
}

TEST(IndigestibilityTest, FactorListMatchesInteger) {
  EXPECT_DOUBLE_EQ(indigestibilityOfFactors({2, 2, 5}), indigestibility(20));
  EXPECT_DOUBLE_EQ(indigestibilityOfFactors({}), 0.0);
}

// ---------------------------------------------------------------------------
// Barlow
// ---------------------------------------------------------------------------

TEST(HarmonicityBarlowTest, ReferenceValues) {
  EXPECT_DOUBLE_EQ(harmonicityBarlow(fifth()), 0.27272727272727276);
  EXPECT_DOUBLE_EQ(harmonicityBarlow(majorThird()), 0.11904761904761904);
  EXPECT_DOUBLE_EQ(harmonicityBarlow(fortieth()), -0.10638297872340426);
}

TEST(HarmonicityBarlowTest, UnisonIsInfinite) {
  double value = harmonicityBarlow(unison());
  EXPECT_TRUE(std::isinf(value));
  EXPECT_GT(value, 0.0);
}

TEST(HarmonicityBarlowTest, SignFollowsTonality) {
  EXPECT_GT(harmonicityBarlow(pitchOf("5/4")), 0.0);
  EXPECT_LT(harmonicityBarlow(pitchOf("4/5")), 0.0);
  EXPECT_DOUBLE_EQ(harmonicityBarlow(pitchOf("4/5")), -harmonicityBarlow(pitchOf("5/4")));
}

TEST(HarmonicitySimplifiedBarlowTest, AbsoluteAndBounded) {
  EXPECT_DOUBLE_EQ(harmonicitySimplifiedBarlow(unison()), 1.0);
  EXPECT_DOUBLE_EQ(harmonicitySimplifiedBarlow(fortieth()), 0.10638297872340426);
  EXPECT_DOUBLE_EQ(harmonicitySimplifiedBarlow(fifth()), 0.27272727272727276);
}

// ---------------------------------------------------------------------------
// Euler / Tenney / Vogel / Wilson
// ---------------------------------------------------------------------------

TEST(HarmonicityEulerTest, GradusSuavitatis) {
  EXPECT_EQ(harmonicityEuler(fifth()), 4);
  EXPECT_EQ(harmonicityEuler(unison()), 1);
  EXPECT_EQ(harmonicityEuler(majorThird()), 7);
  EXPECT_EQ(harmonicityEuler(fortieth()), 8);
}

TEST(HarmonicityTenneyTest, LogOfProduct) {
  EXPECT_DOUBLE_EQ(harmonicityTenney(fifth()), 2.584962500721156);
  EXPECT_DOUBLE_EQ(harmonicityTenney(unison()), 0.0);
  EXPECT_DOUBLE_EQ(harmonicityTenney(majorThird()), 4.321928094887363);
  EXPECT_DOUBLE_EQ(harmonicityTenney(fortieth()), 5.321928094887363);
}

TEST(HarmonicityVogelTest, ReferenceValues) {
  EXPECT_EQ(harmonicityVogel(fifth()), 4);
  EXPECT_EQ(harmonicityVogel(unison()), 1);
  EXPECT_EQ(harmonicityVogel(majorThird()), 7);
  EXPECT_EQ(harmonicityVogel(fortieth()), 8);
}

TEST(HarmonicityWilsonTest, IgnoresOctaves) {
  EXPECT_EQ(harmonicityWilson(fifth()), 3);
  EXPECT_EQ(harmonicityWilson(unison()), 1);
  EXPECT_EQ(harmonicityWilson(majorThird()), 5);
  EXPECT_EQ(harmonicityWilson(fortieth()), 5);
  EXPECT_EQ(harmonicityWilson(pitchOf("3/1")), harmonicityWilson(pitchOf("3/2")));
}

}  // namespace
}  // namespace justpitch
