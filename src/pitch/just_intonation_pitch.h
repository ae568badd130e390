// Just intonation pitch -- an exact frequency ratio stored as an exponent
// vector over ascending primes, relative to a concert pitch.

#ifndef JUSTPITCH_PITCH_JUST_INTONATION_PITCH_H
#define JUSTPITCH_PITCH_JUST_INTONATION_PITCH_H

#include <cstdint>
#include <iosfwd>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "core/basic_types.h"
#include "core/interval.h"

namespace justpitch {

/// @brief A "num/den" literal, parsed on construction.
struct RatioLiteral {
  std::string text;
};

/// @brief Any value a JustIntonationPitch can be built from.
using PitchSource = std::variant<RatioLiteral, Ratio, ExponentVector>;

/// @brief Counts of primes occurring once, twice, ... in numerator and
///        denominator. blueprint of 45/16 (3*3*5 / 2^4, ignoring 2) is
///        {{1, 1}, {}}: one prime once (5), one prime twice (3).
struct PitchBlueprint {
  std::vector<int> numerator;
  std::vector<int> denominator;

  bool operator==(const PitchBlueprint& other) const {
    return numerator == other.numerator && denominator == other.denominator;
  }
};

struct PitchResult;

/// @brief Exact just-intonation pitch or interval.
///
/// Every operation has a copying form (returns a new pitch) and an InPlace
/// form (replaces this pitch). The stored vector is always canonical.
class JustIntonationPitch {
 public:
  /// @brief The pitch 1/1 at the configured concert pitch.
  JustIntonationPitch();

  /// @brief Build from an exponent vector at the configured concert pitch.
  explicit JustIntonationPitch(ExponentVector exponents);

  /// @brief Build from an exponent vector at a given concert pitch.
  JustIntonationPitch(ExponentVector exponents, const DirectPitch& concert_pitch);

  /// @brief Build from any source value.
  /// @return ParseError for a malformed literal, UnsupportedType for a
  ///         non-positive ratio or one with a prime factor above 2^24.
  static PitchResult fromSource(const PitchSource& source);
  static PitchResult fromSource(const PitchSource& source, const DirectPitch& concert_pitch);

  /// @brief Shorthand for fromSource(RatioLiteral{text}).
  static PitchResult fromRatioString(const std::string& text);

  /// @brief Shorthand for fromSource(ratio).
  static PitchResult fromRatio(const Ratio& ratio);

  // -------------------------------------------------------------------------
  // Attributes
  // -------------------------------------------------------------------------

  const ExponentVector& exponentVector() const { return exponents_; }
  const DirectPitch& concertPitch() const { return concert_pitch_; }
  void setConcertPitch(const DirectPitch& concert_pitch) { concert_pitch_ = concert_pitch; }

  /// @brief Reduced fraction of the vector (no octave folding).
  Ratio ratio() const;
  BigInt numerator() const;
  BigInt denominator() const;

  /// @brief Frequency in Hz: ratio * concert pitch.
  double frequency() const;

  /// @brief Size of the ratio in cents.
  double interval() const;

  /// @brief Largest k with 2^k <= ratio (0 for 1/1, -1 for 3/4).
  int octave() const;

  /// @brief False (utonal) when the extreme exponent sits in the denominator.
  bool tonality() const;

  /// @brief Primes 2 .. p_n covering the vector length.
  std::vector<uint64_t> primeTuple() const;

  /// @brief Primes with a non-zero exponent.
  std::vector<uint64_t> occupiedPrimes() const;

  /// @brief Ratio as double.
  double toDouble() const;

  /// @brief Prime factors of numerator and denominator with multiplicity,
  ///        ascending. {1} for 1/1.
  std::vector<uint64_t> factorised() const;

  /// @brief Prime factors of numerator and denominator separately.
  ///        ({1}, {}) for 1/1.
  std::pair<std::vector<uint64_t>, std::vector<uint64_t>> factorisedNumeratorAndDenominator() const;

  /// @brief Harmonic number n (ratio n/2^k) or subharmonic -n (2^k/n).
  /// @return n, -n, 1 for 1/1, or 0 if the ratio is neither.
  BigInt harmonic() const;

  /// @brief Multiplicity histogram of numerator and denominator primes.
  /// @param ignore Primes left out of the count.
  PitchBlueprint blueprint(const std::set<uint64_t>& ignore = {2}) const;

  /// @brief This pitch if numerator > denominator, otherwise its reciprocal.
  JustIntonationPitch absolute() const;

  // -------------------------------------------------------------------------
  // Arithmetic
  // -------------------------------------------------------------------------

  /// @brief Stack an interval on this pitch.
  /// A DirectPitchInterval multiplies the ratio by 2^(cents/1200); the result
  /// is approximated by a fraction with a bounded denominator.
  JustIntonationPitch add(const JustIntonationPitch& interval) const;
  JustIntonationPitch add(const DirectPitchInterval& interval) const;
  void addInPlace(const JustIntonationPitch& interval);
  void addInPlace(const DirectPitchInterval& interval);

  /// @brief Remove an interval from this pitch.
  JustIntonationPitch subtract(const JustIntonationPitch& interval) const;
  JustIntonationPitch subtract(const DirectPitchInterval& interval) const;
  void subtractInPlace(const JustIntonationPitch& interval);
  void subtractInPlace(const DirectPitchInterval& interval);

  /// @brief Fold the ratio into [1, prime).
  /// @param prime Period (2 = octave). A period with prime factors above the
  ///        supported limit leaves the pitch unchanged.
  JustIntonationPitch normalize(int prime = 2) const;
  void normalizeInPlace(int prime = 2);

  /// @brief Move the pitch into the given octave (0 = [1, 2)).
  JustIntonationPitch registerTo(int octave) const;
  void registerToInPlace(int octave);

  /// @brief Choose the octave closest (in cents) to a reference.
  ///
  /// Candidates are the reference octave and its two neighbours, visited in
  /// ascending order; only a strictly smaller distance replaces the current
  /// choice, so equidistant candidates resolve to the lower octave.
  /// @return RegisterResolution if the reference is not finite or lies more
  ///         than kMaxCentsOctaves octaves away from 1/1.
  PitchResult moveToClosestRegister(const JustIntonationPitch& reference) const;
  PitchResult moveToClosestRegister(const DirectPitchInterval& reference) const;
  PitchError moveToClosestRegisterInPlace(const JustIntonationPitch& reference);
  PitchError moveToClosestRegisterInPlace(const DirectPitchInterval& reference);

  /// @brief Reciprocal ratio.
  JustIntonationPitch inverse() const;
  /// @brief Mirror around an axis: axis - (this - axis).
  JustIntonationPitch inverse(const JustIntonationPitch& axis) const;
  void inverseInPlace();
  void inverseInPlace(const JustIntonationPitch& axis);

  /// @brief Shared prime factors (see intersectExponents).
  JustIntonationPitch intersection(const JustIntonationPitch& other, bool strict = false) const;
  void intersectionInPlace(const JustIntonationPitch& other, bool strict = false);

  /// @brief Interval from this pitch to another: other - this.
  JustIntonationPitch pitchIntervalTo(const JustIntonationPitch& other) const;
  /// @brief Interval in cents from this pitch to a frequency.
  DirectPitchInterval pitchIntervalTo(const DirectPitch& other) const;

  // -------------------------------------------------------------------------
  // Comparison
  // -------------------------------------------------------------------------

  bool operator==(const JustIntonationPitch& other) const { return exponents_ == other.exponents_; }
  bool operator!=(const JustIntonationPitch& other) const { return !(*this == other); }
  bool operator<(const JustIntonationPitch& other) const;
  bool operator>(const JustIntonationPitch& other) const { return other < *this; }
  bool operator<=(const JustIntonationPitch& other) const { return !(other < *this); }
  bool operator>=(const JustIntonationPitch& other) const { return !(*this < other); }

  /// @brief Interval-only equality against a cents value.
  bool operator==(const DirectPitchInterval& other) const { return interval() == other.cents; }

  /// @brief Frequency comparison against a directly given pitch.
  bool operator<(const DirectPitch& other) const { return frequency() < other.frequency; }
  bool operator>(const DirectPitch& other) const { return frequency() > other.frequency; }

 private:
  /// @brief Replace the vector with the factorization of ratio.
  /// @return False (pitch unchanged, warning logged) if the ratio has no
  ///         supported factorization.
  bool assignRatio(const Ratio& ratio, const char* operation);

  void addCentsInPlace(double cents);

  ExponentVector exponents_;
  DirectPitch concert_pitch_;
};

/// @brief Result of building or register-moving a pitch.
struct PitchResult {
  JustIntonationPitch pitch;
  PitchError error = PitchError::None;
  std::string error_message;

  bool ok() const { return error == PitchError::None; }
};

JustIntonationPitch operator+(const JustIntonationPitch& lhs, const JustIntonationPitch& rhs);
JustIntonationPitch operator-(const JustIntonationPitch& lhs, const JustIntonationPitch& rhs);

/// Prints JustIntonationPitch('3/2').
std::ostream& operator<<(std::ostream& out, const JustIntonationPitch& pitch);

}  // namespace justpitch

#endif  // JUSTPITCH_PITCH_JUST_INTONATION_PITCH_H
