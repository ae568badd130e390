// Harmonicity metrics -- Barlow, Euler, Tenney, Vogel, and Wilson scores
// computed from the prime factorization of a just intonation pitch.

#ifndef JUSTPITCH_HARMONY_HARMONICITY_H
#define JUSTPITCH_HARMONY_HARMONICITY_H

#include <cstdint>
#include <vector>

#include "pitch/just_intonation_pitch.h"

namespace justpitch {

/// @brief Barlow's indigestibility of a factor list.
/// @param factors Prime factors with multiplicity, ascending (1 contributes 0).
/// @return 2 * sum over distinct primes p of k * (p - 1)^2 / p.
double indigestibilityOfFactors(const std::vector<uint64_t>& factors);

/// @brief Barlow's indigestibility of a positive integer.
///
/// Example: 1 -> 0, 2 -> 1, 3 -> 2.6666666666666665, 5 -> 6.4.
double indigestibility(uint64_t number);

/// @brief Barlow harmonicity: sign(I(num) - I(den)) / (I(num) + I(den)).
/// @return +infinity for 1/1. Negative for ratios with the more indigestible
///         term in the denominator.
double harmonicityBarlow(const JustIntonationPitch& pitch);

/// @brief |harmonicityBarlow|, with 1/1 mapped to 1.
double harmonicitySimplifiedBarlow(const JustIntonationPitch& pitch);

/// @brief Euler's gradus suavitatis: 1 + sum of (p - 1) over all factors.
int64_t harmonicityEuler(const JustIntonationPitch& pitch);

/// @brief Tenney height: log2(numerator * denominator).
double harmonicityTenney(const JustIntonationPitch& pitch);

/// @brief Vogel complexity: sum of factors other than 2, plus the count of 2s.
int64_t harmonicityVogel(const JustIntonationPitch& pitch);

/// @brief Wilson complexity: sum of factors other than 2.
int64_t harmonicityWilson(const JustIntonationPitch& pitch);

}  // namespace justpitch

#endif  // JUSTPITCH_HARMONY_HARMONICITY_H
