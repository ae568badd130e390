// Implementation of the harmonicity metrics.

#include "harmony/harmonicity.h"

#include <cmath>
#include <limits>
#include <map>

#include "core/prime_utils.h"
#include "core/ratio_codec.h"

namespace justpitch {

double indigestibilityOfFactors(const std::vector<uint64_t>& factors) {
  std::map<uint64_t, int> powers;
  for (uint64_t factor : factors) ++powers[factor];

  double summed = 0.0;
  for (const auto& [prime, power] : powers) {
    double distance = static_cast<double>(prime - 1);
    summed += (power * distance * distance) / static_cast<double>(prime);
  }
  return 2 * summed;
}

double indigestibility(uint64_t number) {
  return indigestibilityOfFactors(factorList(factorize(number)));
}

double harmonicityBarlow(const JustIntonationPitch& pitch) {
  auto [numerator_factors, denominator_factors] = pitch.factorisedNumeratorAndDenominator();
  double numerator_value = indigestibilityOfFactors(numerator_factors);
  double denominator_value = indigestibilityOfFactors(denominator_factors);
  if (numerator_value == 0.0 && denominator_value == 0.0) {
    return std::numeric_limits<double>::infinity();
  }
  double sign = numerator_value - denominator_value < 0.0 ? -1.0 : 1.0;
  return sign / (numerator_value + denominator_value);
}

double harmonicitySimplifiedBarlow(const JustIntonationPitch& pitch) {
  double barlow = std::abs(harmonicityBarlow(pitch));
  if (std::isinf(barlow)) return 1.0;
  return barlow;
}

int64_t harmonicityEuler(const JustIntonationPitch& pitch) {
  int64_t gradus = 1;
  for (uint64_t factor : pitch.factorised()) gradus += static_cast<int64_t>(factor) - 1;
  return gradus;
}

double harmonicityTenney(const JustIntonationPitch& pitch) {
  auto [numerator, denominator] = exponentVectorToPair(pitch.exponentVector());
  BigInt product = numerator * denominator;
  return std::log2(product.convert_to<double>());
}

int64_t harmonicityVogel(const JustIntonationPitch& pitch) {
  int64_t complexity = 0;
  for (uint64_t factor : pitch.factorised()) {
    complexity += factor == 2 ? 1 : static_cast<int64_t>(factor);
  }
  return complexity;
}

int64_t harmonicityWilson(const JustIntonationPitch& pitch) {
  int64_t complexity = 0;
  for (uint64_t factor : pitch.factorised()) {
    if (factor != 2) complexity += static_cast<int64_t>(factor);
  }
  return complexity;
}

}  // namespace justpitch
