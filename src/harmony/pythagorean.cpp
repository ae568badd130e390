// Implementation of pythagorean approximation and spelling.

#include "harmony/pythagorean.h"

#include <cstdio>
#include <map>

#include "core/engine_config.h"
#include "core/pitch_utils.h"
#include "core/ratio_codec.h"

namespace justpitch {

namespace {

/// Floor division and non-negative modulo for a positive divisor.
int floorDiv(int value, int divisor) {
  int quotient = value / divisor;
  if (value % divisor != 0 && value < 0) --quotient;
  return quotient;
}

int floorMod(int value, int divisor) {
  return value - floorDiv(value, divisor) * divisor;
}

/// Exponent of 3 in the closest pythagorean interval.
int fifthsOf(const JustIntonationPitch& pythagorean) {
  const ExponentVector& exponents = pythagorean.exponentVector();
  return exponents.size() >= 2 ? exponents[1] : 0;
}

}  // namespace

CommaCompound helmholtzEllisCommas(const JustIntonationPitch& pitch, const PrimeCommaTable& table) {
  const ExponentVector& exponents = pitch.exponentVector();
  std::vector<uint64_t> primes = pitch.primeTuple();
  std::map<uint64_t, int> prime_to_exponent;
  for (size_t idx = 2; idx < exponents.size(); ++idx) {
    if (exponents[idx] != 0) prime_to_exponent[primes[idx]] = exponents[idx];
  }
  return CommaCompound(prime_to_exponent, table);
}

CommaCompound helmholtzEllisCommas(const JustIntonationPitch& pitch) {
  return helmholtzEllisCommas(pitch, engineConfig().comma_table);
}

JustIntonationPitch closestPythagoreanInterval(const JustIntonationPitch& pitch,
                                               const PrimeCommaTable& table) {
  CommaCompound commas = helmholtzEllisCommas(pitch, table);
  if (commas.empty()) return pitch.normalize();

  PitchResult comma_pitch = JustIntonationPitch::fromSource(commas.ratio(), pitch.concertPitch());
  if (!comma_pitch.ok()) {
    std::fprintf(stderr, "[Pythagorean] WARNING: comma compound not representable: %s\n",
                 comma_pitch.error_message.c_str());
    return pitch.normalize();
  }
  return pitch.subtract(comma_pitch.pitch).normalize();
}

JustIntonationPitch closestPythagoreanInterval(const JustIntonationPitch& pitch) {
  return closestPythagoreanInterval(pitch, engineConfig().comma_table);
}

double centDeviationFromClosestWesternPitchClass(const JustIntonationPitch& pitch,
                                                 const PrimeCommaTable& table) {
  double comma_deviation = ratioToCents(ratioToDouble(helmholtzEllisCommas(pitch, table).ratio()));
  double fifth_deviation = ratioToCents(1.5) - 7 * kSemitoneInCents;
  return comma_deviation + fifthsOf(closestPythagoreanInterval(pitch, table)) * fifth_deviation;
}

double centDeviationFromClosestWesternPitchClass(const JustIntonationPitch& pitch) {
  return centDeviationFromClosestWesternPitchClass(pitch, engineConfig().comma_table);
}

std::optional<std::string> closestPythagoreanPitchName(const JustIntonationPitch& pitch,
                                                       const std::string& reference,
                                                       const PrimeCommaTable& table) {
  if (reference.empty()) return std::nullopt;
  int position = cycleOfFifthsPosition(reference[0]);
  if (position < 0) return std::nullopt;
  int reference_accidentals = countAccidentals(reference.substr(1));

  int n_fifths = fifthsOf(closestPythagoreanInterval(pitch, table));
  int letter_index = floorMod(position + floorMod(n_fifths, 7), 7);
  int accidentals = floorDiv(position + n_fifths, 7) + reference_accidentals;

  std::string name(1, kDiatonicCycleOfFifths[letter_index]);
  return name + accidentalsFromCount(accidentals);
}

std::optional<std::string> closestPythagoreanPitchName(const JustIntonationPitch& pitch,
                                                       const std::string& reference) {
  return closestPythagoreanPitchName(pitch, reference, engineConfig().comma_table);
}

int countAccidentals(const std::string& accidentals) {
  int count = 0;
  for (char symbol : accidentals) {
    if (symbol == kSharpSymbol) {
      ++count;
    } else if (symbol == kFlatSymbol) {
      --count;
    } else {
      std::fprintf(stderr, "[Pythagorean] WARNING: unknown accidental '%c' ignored\n", symbol);
    }
  }
  return count;
}

std::string accidentalsFromCount(int count) {
  if (count > 0) return std::string(static_cast<size_t>(count), kSharpSymbol);
  return std::string(static_cast<size_t>(-count), kFlatSymbol);
}

}  // namespace justpitch
