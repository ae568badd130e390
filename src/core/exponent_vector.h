// Exponent vector arithmetic -- padding, elementwise combination,
// canonical trimming, and the ratio adjustment (period folding) rule.

#ifndef JUSTPITCH_CORE_EXPONENT_VECTOR_H
#define JUSTPITCH_CORE_EXPONENT_VECTOR_H

#include <cstddef>
#include <utility>

#include "core/basic_types.h"

namespace justpitch {

/// @brief Right-pad two vectors with zeros to a common length.
/// @param lhs First vector.
/// @param rhs Second vector.
/// @return Padded copies; the inputs are not modified.
std::pair<ExponentVector, ExponentVector> padExponents(const ExponentVector& lhs,
                                                       const ExponentVector& rhs);

/// @brief Drop trailing zero entries in place.
/// @param exponents Vector to canonicalize ({} stays {}).
void trimTrailingZeros(ExponentVector& exponents);

/// @brief Check canonical form (no trailing zero).
bool isCanonical(const ExponentVector& exponents);

/// @brief Elementwise sum (product of the represented ratios), trimmed.
ExponentVector addExponents(const ExponentVector& lhs, const ExponentVector& rhs);

/// @brief Elementwise difference (quotient of the represented ratios), trimmed.
ExponentVector subtractExponents(const ExponentVector& lhs, const ExponentVector& rhs);

/// @brief Elementwise negation (reciprocal of the represented ratio).
ExponentVector negateExponents(const ExponentVector& exponents);

/// @brief Common factors of two vectors, position by position.
/// @param lhs First vector.
/// @param rhs Second vector.
/// @param strict If true, a position survives only when both exponents are
///        equal. Otherwise both-positive keeps the minimum, both-negative keeps
///        the maximum, and any zero or mixed-sign pair yields 0.
/// @return Trimmed intersection.
///
/// Example: {-1, -1, 1} and {-1, -1, 0, 1} -> {-1, -1}.
ExponentVector intersectExponents(const ExponentVector& lhs, const ExponentVector& rhs,
                                  bool strict);

/// @brief Fold a ratio into the window [1, border).
/// @param ratio Positive fraction.
/// @param border Period; values <= 1 leave the ratio unchanged.
/// @return Folded fraction. Folding twice gives the same result.
Ratio ratioAdjust(const Ratio& ratio, int border);

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_EXPONENT_VECTOR_H
