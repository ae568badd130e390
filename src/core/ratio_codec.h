// Conversion between ratio literals ("3/2"), exact fractions, and
// exponent vectors over ascending primes.

#ifndef JUSTPITCH_CORE_RATIO_CODEC_H
#define JUSTPITCH_CORE_RATIO_CODEC_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "core/basic_types.h"

namespace justpitch {

/// @brief Result of parsing a ratio literal.
struct RatioResult {
  Ratio ratio{BigInt(1)};
  PitchError error = PitchError::None;
  std::string error_message;

  bool ok() const { return error == PitchError::None; }
};

/// @brief Result of converting a fraction to an exponent vector.
struct ExponentVectorResult {
  ExponentVector exponents;
  PitchError error = PitchError::None;
  std::string error_message;

  bool ok() const { return error == PitchError::None; }
};

/// @brief Build a fraction from two machine integers.
/// @param numerator Numerator.
/// @param denominator Non-zero denominator (sign moves to the numerator).
/// @return Reduced fraction.
inline Ratio makeRatio(int64_t numerator, int64_t denominator = 1) {
  if (denominator < 0) return Ratio(-BigInt(numerator), -BigInt(denominator));
  return Ratio(BigInt(numerator), BigInt(denominator));
}

/// @brief Parse a "num/den" literal into a reduced fraction.
/// @param text Literal such as "3/2", "81/64", " 7 / 4 ". An optional sign
///        is accepted on either side; surrounding whitespace is ignored.
/// @return RatioResult. ParseError for a missing or repeated '/', an empty
///         or non-integer side, or a zero denominator.
RatioResult parseRatioString(const std::string& text);

/// @brief Render a fraction as "num/den" (integers keep the "/1").
/// @param ratio Fraction to render.
/// @return String such as "3/2" or "5/1".
std::string ratioToString(const Ratio& ratio);

/// @brief Convert a fraction to the nearest double.
double ratioToDouble(const Ratio& ratio);

/// @brief Factorize a positive fraction into an exponent vector.
/// @param ratio Fraction > 0.
/// @return Canonical vector (no trailing zeros). UnsupportedType for a
///         non-positive fraction or a prime factor above kMaxSupportedPrime.
///
/// Example: 3/2 -> {-1, 1}, 11/9 -> {0, -2, 0, 0, 1}, 1/1 -> {}.
ExponentVectorResult ratioToExponentVector(const Ratio& ratio);

/// @brief Split an exponent vector into numerator and denominator.
/// @param exponents Exponent vector.
/// @return {product of p^e over e > 0, product of p^-e over e < 0}.
std::pair<BigInt, BigInt> exponentVectorToPair(const ExponentVector& exponents);

/// @brief Convert an exponent vector to a reduced fraction.
/// @param exponents Exponent vector.
/// @return Fraction (no octave folding).
Ratio exponentVectorToRatio(const ExponentVector& exponents);

/// @brief Exact fraction of a finite double.
/// @param value Finite value.
/// @return The binary value as a fraction (0 for non-finite input).
Ratio doubleToRatio(double value);

/// @brief Closest fraction with a bounded denominator.
/// @param ratio Fraction to approximate.
/// @param max_denominator Largest allowed denominator (>= 1).
/// @return Best approximation, found through the continued fraction of ratio.
Ratio limitDenominator(const Ratio& ratio, uint32_t max_denominator);

/// @brief Approximate a cents value by a fraction.
/// @param cents Interval in cents.
/// @param max_denominator Denominator bound for the sub-octave part.
/// @return 2^floor(cents/1200) times the bounded approximation of the
///         remaining sub-octave factor. Exact octaves map to exact powers of 2.
///         std::nullopt for non-finite cents or more than kMaxCentsOctaves
///         octaves in either direction.
std::optional<Ratio> centsToRatio(double cents,
                                  uint32_t max_denominator = kDefaultCentsMaxDenominator);

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_RATIO_CODEC_H
