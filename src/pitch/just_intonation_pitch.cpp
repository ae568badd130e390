// Implementation of JustIntonationPitch.

#include "pitch/just_intonation_pitch.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <map>
#include <optional>
#include <ostream>

#include "core/engine_config.h"
#include "core/exponent_vector.h"
#include "core/prime_utils.h"
#include "core/ratio_codec.h"

namespace justpitch {

namespace {

DirectPitch configuredConcertPitch() {
  return DirectPitch{engineConfig().concert_pitch_hz};
}

/// @brief Multiplicity histogram: counts[k - 1] = number of primes seen k times.
std::vector<int> multiplicityCounts(const std::vector<uint64_t>& factors,
                                    const std::set<uint64_t>& ignore) {
  std::map<uint64_t, int> per_prime;
  for (uint64_t factor : factors) {
    if (ignore.count(factor) == 0) ++per_prime[factor];
  }
  std::vector<int> counts;
  for (const auto& [prime, multiplicity] : per_prime) {
    if (counts.size() < static_cast<size_t>(multiplicity)) {
      counts.resize(static_cast<size_t>(multiplicity), 0);
    }
    ++counts[static_cast<size_t>(multiplicity) - 1];
  }
  return counts;
}

}  // namespace

JustIntonationPitch::JustIntonationPitch() : concert_pitch_(configuredConcertPitch()) {}

JustIntonationPitch::JustIntonationPitch(ExponentVector exponents)
    : JustIntonationPitch(std::move(exponents), configuredConcertPitch()) {}

JustIntonationPitch::JustIntonationPitch(ExponentVector exponents, const DirectPitch& concert_pitch)
    : exponents_(std::move(exponents)), concert_pitch_(concert_pitch) {
  trimTrailingZeros(exponents_);
}

PitchResult JustIntonationPitch::fromSource(const PitchSource& source) {
  return fromSource(source, configuredConcertPitch());
}

PitchResult JustIntonationPitch::fromSource(const PitchSource& source,
                                            const DirectPitch& concert_pitch) {
  PitchResult result;
  result.pitch.concert_pitch_ = concert_pitch;

  Ratio ratio;
  if (const auto* literal = std::get_if<RatioLiteral>(&source)) {
    RatioResult parsed = parseRatioString(literal->text);
    if (!parsed.ok()) {
      result.error = parsed.error;
      result.error_message = parsed.error_message;
      return result;
    }
    ratio = parsed.ratio;
  } else if (const auto* fraction = std::get_if<Ratio>(&source)) {
    ratio = *fraction;
  } else {
    result.pitch.exponents_ = std::get<ExponentVector>(source);
    trimTrailingZeros(result.pitch.exponents_);
    return result;
  }

  ExponentVectorResult exponents = ratioToExponentVector(ratio);
  if (!exponents.ok()) {
    result.error = exponents.error;
    result.error_message = exponents.error_message;
    return result;
  }
  result.pitch.exponents_ = std::move(exponents.exponents);
  return result;
}

PitchResult JustIntonationPitch::fromRatioString(const std::string& text) {
  return fromSource(RatioLiteral{text});
}

PitchResult JustIntonationPitch::fromRatio(const Ratio& ratio) {
  return fromSource(ratio);
}

// ---------------------------------------------------------------------------
// Attributes
// ---------------------------------------------------------------------------

Ratio JustIntonationPitch::ratio() const {
  return exponentVectorToRatio(exponents_);
}

BigInt JustIntonationPitch::numerator() const {
  return exponentVectorToPair(exponents_).first;
}

BigInt JustIntonationPitch::denominator() const {
  return exponentVectorToPair(exponents_).second;
}

double JustIntonationPitch::frequency() const {
  return toDouble() * concert_pitch_.frequency;
}

double JustIntonationPitch::interval() const {
  return ratioToCents(toDouble());
}

int JustIntonationPitch::octave() const {
  auto [num, den] = exponentVectorToPair(exponents_);
  int estimate = static_cast<int>(boost::multiprecision::msb(num)) -
                 static_cast<int>(boost::multiprecision::msb(den));
  // ratio lies in (2^(estimate - 1), 2^(estimate + 1)).
  bool reaches_estimate = estimate >= 0 ? num >= (den << estimate) : (num << -estimate) >= den;
  return reaches_estimate ? estimate : estimate - 1;
}

bool JustIntonationPitch::tonality() const {
  if (exponents_.empty()) return true;
  auto max_iter = std::max_element(exponents_.begin(), exponents_.end());
  auto min_iter = std::min_element(exponents_.begin(), exponents_.end());
  if (*max_iter <= 0 && *min_iter < 0) return false;
  if (*min_iter < 0 && min_iter > max_iter) return false;
  return true;
}

std::vector<uint64_t> JustIntonationPitch::primeTuple() const {
  return firstPrimes(exponents_.size());
}

std::vector<uint64_t> JustIntonationPitch::occupiedPrimes() const {
  std::vector<uint64_t> primes = primeTuple();
  std::vector<uint64_t> occupied;
  for (size_t idx = 0; idx < exponents_.size(); ++idx) {
    if (exponents_[idx] != 0) occupied.push_back(primes[idx]);
  }
  return occupied;
}

double JustIntonationPitch::toDouble() const {
  return ratioToDouble(ratio());
}

std::vector<uint64_t> JustIntonationPitch::factorised() const {
  if (exponents_.empty()) return {1};
  std::vector<uint64_t> primes = primeTuple();
  std::vector<uint64_t> factors;
  for (size_t idx = 0; idx < exponents_.size(); ++idx) {
    for (int count = 0; count < std::abs(exponents_[idx]); ++count) factors.push_back(primes[idx]);
  }
  return factors;
}

std::pair<std::vector<uint64_t>, std::vector<uint64_t>>
JustIntonationPitch::factorisedNumeratorAndDenominator() const {
  if (exponents_.empty()) return {{1}, {}};
  std::vector<uint64_t> primes = primeTuple();
  std::vector<uint64_t> numerator_factors;
  std::vector<uint64_t> denominator_factors;
  for (size_t idx = 0; idx < exponents_.size(); ++idx) {
    auto& target = exponents_[idx] > 0 ? numerator_factors : denominator_factors;
    for (int count = 0; count < std::abs(exponents_[idx]); ++count) target.push_back(primes[idx]);
  }
  return {numerator_factors, denominator_factors};
}

BigInt JustIntonationPitch::harmonic() const {
  auto [num, den] = exponentVectorToPair(exponents_);
  if (den % 2 == 0) return num;
  if (num % 2 == 0) return BigInt(-den);
  if (exponents_.empty()) return BigInt(1);
  return BigInt(0);
}

PitchBlueprint JustIntonationPitch::blueprint(const std::set<uint64_t>& ignore) const {
  auto [numerator_factors, denominator_factors] = factorisedNumeratorAndDenominator();
  PitchBlueprint result;
  result.numerator = multiplicityCounts(numerator_factors, ignore);
  result.denominator = multiplicityCounts(denominator_factors, ignore);
  return result;
}

JustIntonationPitch JustIntonationPitch::absolute() const {
  auto [num, den] = exponentVectorToPair(exponents_);
  if (num > den) return *this;
  return inverse();
}

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

bool JustIntonationPitch::assignRatio(const Ratio& ratio, const char* operation) {
  ExponentVectorResult converted = ratioToExponentVector(ratio);
  if (!converted.ok()) {
    std::fprintf(stderr, "[JustIntonationPitch] WARNING: %s left pitch unchanged: %s\n", operation,
                 converted.error_message.c_str());
    return false;
  }
  exponents_ = std::move(converted.exponents);
  return true;
}

void JustIntonationPitch::addCentsInPlace(double cents) {
  std::optional<Ratio> factor = centsToRatio(cents, engineConfig().cents_max_denominator);
  if (!factor) {
    std::fprintf(stderr,
                 "[JustIntonationPitch] WARNING: cents arithmetic left pitch unchanged: "
                 "%g cents has no exact representation\n",
                 cents);
    return;
  }
  assignRatio(ratio() * *factor, "cents arithmetic");
}

JustIntonationPitch JustIntonationPitch::add(const JustIntonationPitch& interval) const {
  JustIntonationPitch result = *this;
  result.addInPlace(interval);
  return result;
}

JustIntonationPitch JustIntonationPitch::add(const DirectPitchInterval& interval) const {
  JustIntonationPitch result = *this;
  result.addInPlace(interval);
  return result;
}

void JustIntonationPitch::addInPlace(const JustIntonationPitch& interval) {
  exponents_ = addExponents(exponents_, interval.exponents_);
}

void JustIntonationPitch::addInPlace(const DirectPitchInterval& interval) {
  addCentsInPlace(interval.cents);
}

JustIntonationPitch JustIntonationPitch::subtract(const JustIntonationPitch& interval) const {
  JustIntonationPitch result = *this;
  result.subtractInPlace(interval);
  return result;
}

JustIntonationPitch JustIntonationPitch::subtract(const DirectPitchInterval& interval) const {
  JustIntonationPitch result = *this;
  result.subtractInPlace(interval);
  return result;
}

void JustIntonationPitch::subtractInPlace(const JustIntonationPitch& interval) {
  exponents_ = subtractExponents(exponents_, interval.exponents_);
}

void JustIntonationPitch::subtractInPlace(const DirectPitchInterval& interval) {
  addCentsInPlace(interval.inverse().cents);
}

JustIntonationPitch JustIntonationPitch::normalize(int prime) const {
  JustIntonationPitch result = *this;
  result.normalizeInPlace(prime);
  return result;
}

void JustIntonationPitch::normalizeInPlace(int prime) {
  if (prime == 2) {
    // Octave folding only moves the exponent of 2.
    if (exponents_.empty()) return;
    exponents_[0] -= octave();
    trimTrailingZeros(exponents_);
    return;
  }
  assignRatio(ratioAdjust(ratio(), prime), "normalize");
}

JustIntonationPitch JustIntonationPitch::registerTo(int octave) const {
  JustIntonationPitch result = *this;
  result.registerToInPlace(octave);
  return result;
}

void JustIntonationPitch::registerToInPlace(int octave) {
  normalizeInPlace();
  if (exponents_.empty()) exponents_.push_back(0);
  exponents_[0] += octave;
  trimTrailingZeros(exponents_);
}

PitchResult JustIntonationPitch::moveToClosestRegister(const JustIntonationPitch& reference) const {
  return moveToClosestRegister(DirectPitchInterval{reference.interval()});
}

PitchResult JustIntonationPitch::moveToClosestRegister(const DirectPitchInterval& reference) const {
  PitchResult result;
  result.pitch = *this;
  result.error = result.pitch.moveToClosestRegisterInPlace(reference);
  if (!result.ok()) {
    result.error_message = "No register candidate for reference " +
                           std::to_string(reference.cents) + " cents";
  }
  return result;
}

PitchError JustIntonationPitch::moveToClosestRegisterInPlace(const JustIntonationPitch& reference) {
  return moveToClosestRegisterInPlace(DirectPitchInterval{reference.interval()});
}

PitchError JustIntonationPitch::moveToClosestRegisterInPlace(const DirectPitchInterval& reference) {
  if (!std::isfinite(reference.cents)) return PitchError::RegisterResolution;

  int reference_octave = reference.octave();
  if (reference_octave > kMaxCentsOctaves || reference_octave < -kMaxCentsOctaves) {
    return PitchError::RegisterResolution;
  }
  bool found = false;
  double best_distance = std::numeric_limits<double>::infinity();
  ExponentVector best;
  for (int adaption = -1; adaption <= 1; ++adaption) {
    JustIntonationPitch candidate = registerTo(reference_octave + adaption);
    double distance = std::abs(candidate.interval() - reference.cents);
    if (distance < best_distance) {
      best_distance = distance;
      best = candidate.exponents_;
      found = true;
    }
  }
  if (!found) return PitchError::RegisterResolution;
  exponents_ = std::move(best);
  return PitchError::None;
}

JustIntonationPitch JustIntonationPitch::inverse() const {
  JustIntonationPitch result = *this;
  result.inverseInPlace();
  return result;
}

JustIntonationPitch JustIntonationPitch::inverse(const JustIntonationPitch& axis) const {
  JustIntonationPitch result = *this;
  result.inverseInPlace(axis);
  return result;
}

void JustIntonationPitch::inverseInPlace() {
  exponents_ = negateExponents(exponents_);
}

void JustIntonationPitch::inverseInPlace(const JustIntonationPitch& axis) {
  ExponentVector distance = subtractExponents(exponents_, axis.exponents_);
  exponents_ = subtractExponents(axis.exponents_, distance);
}

JustIntonationPitch JustIntonationPitch::intersection(const JustIntonationPitch& other,
                                                      bool strict) const {
  JustIntonationPitch result = *this;
  result.intersectionInPlace(other, strict);
  return result;
}

void JustIntonationPitch::intersectionInPlace(const JustIntonationPitch& other, bool strict) {
  exponents_ = intersectExponents(exponents_, other.exponents_, strict);
}

JustIntonationPitch JustIntonationPitch::pitchIntervalTo(const JustIntonationPitch& other) const {
  return other.subtract(*this);
}

DirectPitchInterval JustIntonationPitch::pitchIntervalTo(const DirectPitch& other) const {
  return DirectPitchInterval{other.centsFrom(frequency())};
}

// ---------------------------------------------------------------------------
// Comparison and output
// ---------------------------------------------------------------------------

bool JustIntonationPitch::operator<(const JustIntonationPitch& other) const {
  return ratio() < other.ratio();
}

JustIntonationPitch operator+(const JustIntonationPitch& lhs, const JustIntonationPitch& rhs) {
  return lhs.add(rhs);
}

JustIntonationPitch operator-(const JustIntonationPitch& lhs, const JustIntonationPitch& rhs) {
  return lhs.subtract(rhs);
}

std::ostream& operator<<(std::ostream& out, const JustIntonationPitch& pitch) {
  return out << "JustIntonationPitch('" << ratioToString(pitch.ratio()) << "')";
}

}  // namespace justpitch
