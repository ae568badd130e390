#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "core/ratio_codec.h"
#include "pitch/just_intonation_pitch.h"

namespace test_helpers {

/// @brief Build a pitch from a literal the test expects to be valid.
/// @param literal Ratio literal such as "3/2".
/// @return The parsed pitch (1/1 after a recorded failure).
inline justpitch::JustIntonationPitch pitchOf(const std::string& literal) {
  auto result = justpitch::JustIntonationPitch::fromRatioString(literal);
  EXPECT_TRUE(result.ok()) << literal << ": " << result.error_message;
  return result.pitch;
}

/// @brief Shorthand for justpitch::makeRatio.
inline justpitch::Ratio ratioOf(int64_t numerator, int64_t denominator = 1) {
  return justpitch::makeRatio(numerator, denominator);
}

}  // namespace test_helpers
