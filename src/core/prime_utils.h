// Prime number utilities -- prime table lookup, prime indexing, and
// integer factorization for exponent vector conversion.

#ifndef JUSTPITCH_CORE_PRIME_UTILS_H
#define JUSTPITCH_CORE_PRIME_UTILS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "core/basic_types.h"

namespace justpitch {

/// Prime factor -> multiplicity, ascending by prime.
using PrimeFactorMap = std::map<uint64_t, int>;

/// @brief Deterministic primality test for 64-bit integers.
/// @param number Value to test.
/// @return True if number is prime.
bool isPrime(uint64_t number);

/// @brief Get the prime at a zero-based position in the ascending sequence.
/// @param index Position (0 -> 2, 1 -> 3, 2 -> 5, ...).
/// @return The prime at that position.
uint64_t nthPrime(size_t index);

/// @brief Get the zero-based position of a prime in the ascending sequence.
/// @param prime Prime number.
/// @return Position (2 -> 0, 3 -> 1, ...). std::nullopt if the value is not
///         prime or exceeds kMaxSupportedPrime.
std::optional<size_t> primeIndex(uint64_t prime);

/// @brief Get the first `count` primes in ascending order.
/// @param count Number of primes.
/// @return Vector {2, 3, 5, ...} of size count.
std::vector<uint64_t> firstPrimes(size_t count);

/// @brief Factorize a positive 64-bit integer.
/// @param value Integer >= 1 (1 yields an empty map).
/// @return Prime factorization.
PrimeFactorMap factorize(uint64_t value);

/// @brief Factorize a positive arbitrary-precision integer.
/// @param value Integer >= 1.
/// @param factors Output factorization (cleared first).
/// @return False if value < 1 or if a prime factor does not fit in 64 bits.
///
/// Small factors are removed by trial division; the remaining cofactor is
/// split with Pollard's rho and checked with Miller-Rabin.
bool factorize(const BigInt& value, PrimeFactorMap& factors);

/// @brief Expand a factorization into a flat list with multiplicity.
/// @param factors Prime factorization.
/// @return Ascending list, e.g. {2: 2, 5: 1} -> {2, 2, 5}.
std::vector<uint64_t> factorList(const PrimeFactorMap& factors);

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_PRIME_UTILS_H
