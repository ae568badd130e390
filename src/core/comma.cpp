// Implementation of the comma table and comma compounds.

#include "core/comma.h"

#include <cstdio>
#include <cstdlib>

#include "core/ratio_codec.h"

namespace justpitch {

namespace {

struct CommaEntry {
  uint64_t prime;
  int64_t numerator;
  int64_t denominator;
};

// Helmholtz-Ellis JI pitch notation, one comma per prime.
constexpr CommaEntry kHelmholtzEllisCommas[] = {
    {5, 80, 81},       {7, 63, 64},     {11, 33, 32},   {13, 26, 27},  {17, 2176, 2187},
    {19, 513, 512},    {23, 736, 729},  {29, 261, 256}, {31, 31, 32},  {37, 37, 36},
    {41, 82, 81},      {43, 129, 128},  {47, 752, 729},
};

}  // namespace

PrimeCommaTable PrimeCommaTable::helmholtzEllis() {
  PrimeCommaTable table;
  for (const auto& entry : kHelmholtzEllisCommas) {
    table.set(entry.prime, Comma{makeRatio(entry.numerator, entry.denominator)});
  }
  return table;
}

const Comma* PrimeCommaTable::find(uint64_t prime) const {
  auto iter = commas_.find(prime);
  if (iter == commas_.end()) return nullptr;
  return &iter->second;
}

CommaCompound::CommaCompound(const std::map<uint64_t, int>& prime_to_exponent,
                             const PrimeCommaTable& table) {
  for (const auto& [prime, exponent] : prime_to_exponent) {
    if (exponent == 0) continue;
    const Comma* comma = table.find(prime);
    if (comma == nullptr) {
      std::fprintf(stderr, "[CommaCompound] WARNING: no comma defined for prime %llu, skipped\n",
                   static_cast<unsigned long long>(prime));
      continue;
    }
    prime_to_exponent_[prime] = exponent;
    commas_[prime] = *comma;
  }
}

int CommaCompound::size() const {
  int total = 0;
  for (const auto& [prime, exponent] : prime_to_exponent_) total += std::abs(exponent);
  return total;
}

std::vector<Ratio> CommaCompound::commaPowers() const {
  std::vector<Ratio> powers;
  powers.reserve(prime_to_exponent_.size());
  for (const auto& [prime, exponent] : prime_to_exponent_) {
    powers.push_back(ratioPower(commas_.at(prime).ratio, exponent));
  }
  return powers;
}

Ratio CommaCompound::ratio() const {
  Ratio product{BigInt(1)};
  for (const auto& power : commaPowers()) product *= power;
  return product;
}

Ratio ratioPower(const Ratio& base, int exponent) {
  auto magnitude = static_cast<unsigned>(exponent < 0 ? -exponent : exponent);
  BigInt numerator = boost::multiprecision::pow(base.numerator(), magnitude);
  BigInt denominator = boost::multiprecision::pow(base.denominator(), magnitude);
  if (exponent < 0) {
    if (numerator < 0) return Ratio(BigInt(-denominator), BigInt(-numerator));
    return Ratio(denominator, numerator);
  }
  return Ratio(numerator, denominator);
}

}  // namespace justpitch
