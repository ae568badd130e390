// Implementation of exponent vector arithmetic.

#include "core/exponent_vector.h"

#include <algorithm>

namespace justpitch {

std::pair<ExponentVector, ExponentVector> padExponents(const ExponentVector& lhs,
                                                       const ExponentVector& rhs) {
  size_t length = std::max(lhs.size(), rhs.size());
  ExponentVector padded_lhs = lhs;
  ExponentVector padded_rhs = rhs;
  padded_lhs.resize(length, 0);
  padded_rhs.resize(length, 0);
  return {padded_lhs, padded_rhs};
}

void trimTrailingZeros(ExponentVector& exponents) {
  while (!exponents.empty() && exponents.back() == 0) exponents.pop_back();
}

bool isCanonical(const ExponentVector& exponents) {
  return exponents.empty() || exponents.back() != 0;
}

ExponentVector addExponents(const ExponentVector& lhs, const ExponentVector& rhs) {
  auto [result, other] = padExponents(lhs, rhs);
  for (size_t idx = 0; idx < result.size(); ++idx) result[idx] += other[idx];
  trimTrailingZeros(result);
  return result;
}

ExponentVector subtractExponents(const ExponentVector& lhs, const ExponentVector& rhs) {
  auto [result, other] = padExponents(lhs, rhs);
  for (size_t idx = 0; idx < result.size(); ++idx) result[idx] -= other[idx];
  trimTrailingZeros(result);
  return result;
}

ExponentVector negateExponents(const ExponentVector& exponents) {
  ExponentVector result = exponents;
  for (int& exponent : result) exponent = -exponent;
  trimTrailingZeros(result);
  return result;
}

ExponentVector intersectExponents(const ExponentVector& lhs, const ExponentVector& rhs,
                                  bool strict) {
  auto [padded_lhs, padded_rhs] = padExponents(lhs, rhs);
  ExponentVector result(padded_lhs.size(), 0);
  for (size_t idx = 0; idx < result.size(); ++idx) {
    int first = padded_lhs[idx];
    int second = padded_rhs[idx];
    if (first == 0 || second == 0) continue;
    if (strict) {
      if (first == second) result[idx] = first;
    } else if (first > 0 && second > 0) {
      result[idx] = std::min(first, second);
    } else if (first < 0 && second < 0) {
      result[idx] = std::max(first, second);
    }
  }
  trimTrailingZeros(result);
  return result;
}

Ratio ratioAdjust(const Ratio& ratio, int border) {
  if (border <= 1 || ratio.numerator() <= 0) return ratio;
  Ratio result = ratio;
  Ratio period{BigInt(border)};
  Ratio one{BigInt(1)};
  while (result >= period) result /= period;
  while (result < one) result *= period;
  return result;
}

}  // namespace justpitch
