// Comma model -- reference commas per prime and comma compounds used to
// spell higher-prime just intervals as pythagorean interval plus comma.

#ifndef JUSTPITCH_CORE_COMMA_H
#define JUSTPITCH_CORE_COMMA_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "core/basic_types.h"

namespace justpitch {

/// @brief A small reference interval (e.g. the syntonic comma 80/81).
struct Comma {
  Ratio ratio{BigInt(1)};
};

/// @brief Prime (>= 5) -> reference comma lookup.
class PrimeCommaTable {
 public:
  PrimeCommaTable() = default;

  /// @brief Helmholtz-Ellis commas for the primes 5 through 47.
  static PrimeCommaTable helmholtzEllis();

  /// @brief Set or replace the comma of a prime.
  void set(uint64_t prime, const Comma& comma) { commas_[prime] = comma; }

  /// @brief Look up the comma of a prime.
  /// @return Pointer into the table, or nullptr if the prime has no comma.
  const Comma* find(uint64_t prime) const;

  size_t size() const { return commas_.size(); }
  bool empty() const { return commas_.empty(); }

  /// @brief All (prime, comma) entries in ascending prime order.
  const std::map<uint64_t, Comma>& entries() const { return commas_; }

 private:
  std::map<uint64_t, Comma> commas_;
};

/// @brief Frozen prime -> exponent mapping over reference commas.
///
/// The ratio of a compound is the product of each referenced comma raised to
/// its exponent. Zero exponents are dropped on construction.
class CommaCompound {
 public:
  CommaCompound() = default;

  /// @brief Build a compound from prime exponents.
  /// @param prime_to_exponent Prime -> exponent.
  /// @param table Comma source. Primes missing from it are skipped with a
  ///        warning.
  CommaCompound(const std::map<uint64_t, int>& prime_to_exponent, const PrimeCommaTable& table);

  /// @brief Sum of the absolute exponents.
  int size() const;

  bool empty() const { return prime_to_exponent_.empty(); }

  /// @brief Prime -> exponent (non-zero entries only).
  const std::map<uint64_t, int>& primeExponents() const { return prime_to_exponent_; }

  /// @brief Each referenced comma raised to its exponent, ascending by prime.
  std::vector<Ratio> commaPowers() const;

  /// @brief Product of commaPowers() (1/1 when empty).
  Ratio ratio() const;

 private:
  std::map<uint64_t, int> prime_to_exponent_;
  std::map<uint64_t, Comma> commas_;
};

/// @brief Raise a fraction to a signed integer power.
Ratio ratioPower(const Ratio& base, int exponent);

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_COMMA_H
