/// @file
/// @brief Prime sieve, prime indexing, and integer factorization.

#include "core/prime_utils.h"

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/miller_rabin.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace justpitch {

namespace {

/// Primes below this bound are served from a static table.
constexpr uint64_t kSmallPrimeLimit = 65536;

/// Witnesses making Miller-Rabin deterministic for all 64-bit inputs.
constexpr uint64_t kWitnesses[] = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37};

/// @brief Sieve of Eratosthenes.
/// @return All primes <= limit.
std::vector<uint64_t> sieve(uint64_t limit) {
  std::vector<uint64_t> primes;
  if (limit < 2) return primes;
  std::vector<bool> composite(limit + 1, false);
  for (uint64_t num = 2; num <= limit; ++num) {
    if (composite[num]) continue;
    primes.push_back(num);
    for (uint64_t multiple = num * num; multiple <= limit; multiple += num) {
      composite[multiple] = true;
    }
  }
  return primes;
}

/// @brief Count primes <= limit without storing them.
size_t countPrimesUpTo(uint64_t limit) {
  if (limit < 2) return 0;
  std::vector<bool> composite(limit + 1, false);
  size_t count = 0;
  for (uint64_t num = 2; num <= limit; ++num) {
    if (composite[num]) continue;
    ++count;
    for (uint64_t multiple = num * num; multiple <= limit; multiple += num) {
      composite[multiple] = true;
    }
  }
  return count;
}

const std::vector<uint64_t>& smallPrimes() {
  static const std::vector<uint64_t> kPrimes = sieve(kSmallPrimeLimit);
  return kPrimes;
}

/// @brief Upper bound for the count-th prime (1-based), Rosser's estimate.
uint64_t primeUpperBound(size_t count) {
  if (count < 6) return 15;
  double num = static_cast<double>(count);
  return static_cast<uint64_t>(num * (std::log(num) + std::log(std::log(num)))) + 1;
}

using boost::multiprecision::uint128_t;

uint64_t mulMod(uint64_t lhs, uint64_t rhs, uint64_t mod) {
  return static_cast<uint64_t>(uint128_t(lhs) * rhs % mod);
}

uint64_t powMod(uint64_t base, uint64_t exp, uint64_t mod) {
  uint64_t result = 1;
  base %= mod;
  while (exp > 0) {
    if (exp & 1) result = mulMod(result, base, mod);
    base = mulMod(base, base, mod);
    exp >>= 1;
  }
  return result;
}

/// @brief Pollard's rho (Floyd cycle detection) for an odd composite.
/// @return A non-trivial divisor of num.
uint64_t pollardRho(uint64_t num) {
  for (uint64_t offset = 1;; ++offset) {
    auto step = [num, offset](uint64_t val) {
      return static_cast<uint64_t>((uint128_t(val) * val + offset) % num);
    };
    uint64_t tortoise = 2;
    uint64_t hare = 2;
    uint64_t divisor = 1;
    while (divisor == 1) {
      tortoise = step(tortoise);
      hare = step(step(hare));
      uint64_t diff = tortoise > hare ? tortoise - hare : hare - tortoise;
      divisor = std::gcd(diff, num);
    }
    if (divisor != num) return divisor;
  }
}

BigInt pollardRho(const BigInt& num) {
  for (unsigned offset = 1;; ++offset) {
    BigInt tortoise = 2;
    BigInt hare = 2;
    BigInt divisor = 1;
    while (divisor == 1) {
      tortoise = (tortoise * tortoise + offset) % num;
      hare = (hare * hare + offset) % num;
      hare = (hare * hare + offset) % num;
      BigInt diff = tortoise > hare ? BigInt(tortoise - hare) : BigInt(hare - tortoise);
      divisor = boost::multiprecision::gcd(diff, num);
    }
    if (divisor != num) return divisor;
  }
}

/// @brief Split a cofactor with no prime factors below the trial bound.
void factorCofactor(uint64_t num, PrimeFactorMap& factors) {
  if (num == 1) return;
  if (isPrime(num)) {
    ++factors[num];
    return;
  }
  uint64_t divisor = pollardRho(num);
  factorCofactor(divisor, factors);
  factorCofactor(num / divisor, factors);
}

void factorInto(uint64_t num, PrimeFactorMap& factors) {
  for (uint64_t prime : smallPrimes()) {
    if (prime * prime > num) break;
    while (num % prime == 0) {
      ++factors[prime];
      num /= prime;
    }
  }
  factorCofactor(num, factors);
}

bool factorInto(const BigInt& num, PrimeFactorMap& factors) {
  if (num == 1) return true;
  if (num <= std::numeric_limits<uint64_t>::max()) {
    factorInto(num.convert_to<uint64_t>(), factors);
    return true;
  }
  // A prime wider than 64 bits cannot be indexed.
  if (boost::multiprecision::miller_rabin_test(num, 25)) return false;
  BigInt divisor = pollardRho(num);
  return factorInto(divisor, factors) && factorInto(BigInt(num / divisor), factors);
}

}  // namespace

bool isPrime(uint64_t number) {
  if (number < 2) return false;
  for (uint64_t witness : kWitnesses) {
    if (number % witness == 0) return number == witness;
  }

  uint64_t odd_part = number - 1;
  int twos = 0;
  while ((odd_part & 1) == 0) {
    odd_part >>= 1;
    ++twos;
  }

  for (uint64_t witness : kWitnesses) {
    uint64_t val = powMod(witness, odd_part, number);
    if (val == 1 || val == number - 1) continue;
    bool witnessed_composite = true;
    for (int round = 1; round < twos; ++round) {
      val = mulMod(val, val, number);
      if (val == number - 1) {
        witnessed_composite = false;
        break;
      }
    }
    if (witnessed_composite) return false;
  }
  return true;
}

uint64_t nthPrime(size_t index) {
  const auto& table = smallPrimes();
  if (index < table.size()) return table[index];
  return sieve(primeUpperBound(index + 1))[index];
}

std::optional<size_t> primeIndex(uint64_t prime) {
  const auto& table = smallPrimes();
  if (prime <= table.back()) {
    auto iter = std::lower_bound(table.begin(), table.end(), prime);
    if (iter == table.end() || *iter != prime) return std::nullopt;
    return static_cast<size_t>(iter - table.begin());
  }
  if (prime > kMaxSupportedPrime || !isPrime(prime)) return std::nullopt;
  return countPrimesUpTo(prime) - 1;
}

std::vector<uint64_t> firstPrimes(size_t count) {
  const auto& table = smallPrimes();
  if (count <= table.size()) {
    return std::vector<uint64_t>(table.begin(), table.begin() + static_cast<long>(count));
  }
  std::vector<uint64_t> primes = sieve(primeUpperBound(count));
  primes.resize(count);
  return primes;
}

PrimeFactorMap factorize(uint64_t value) {
  PrimeFactorMap factors;
  if (value > 1) factorInto(value, factors);
  return factors;
}

bool factorize(const BigInt& value, PrimeFactorMap& factors) {
  factors.clear();
  if (value < 1) return false;

  BigInt remaining = value;
  for (uint64_t prime : smallPrimes()) {
    if (remaining <= std::numeric_limits<uint64_t>::max()) break;
    while (remaining % prime == 0) {
      ++factors[prime];
      remaining /= prime;
    }
  }
  return factorInto(remaining, factors);
}

std::vector<uint64_t> factorList(const PrimeFactorMap& factors) {
  std::vector<uint64_t> result;
  for (const auto& [prime, count] : factors) {
    for (int idx = 0; idx < count; ++idx) result.push_back(prime);
  }
  return result;
}

}  // namespace justpitch
