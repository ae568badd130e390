// Pitch utilities -- cents/frequency conversion constants and helpers,
// and the diatonic cycle of fifths used for pitch naming.

#ifndef JUSTPITCH_CORE_PITCH_UTILS_H
#define JUSTPITCH_CORE_PITCH_UTILS_H

#include <cmath>
#include <cstdint>

#include "core/basic_types.h"

namespace justpitch {

// ---------------------------------------------------------------------------
// Cent constants
// ---------------------------------------------------------------------------

/// Cents in one octave (frequency ratio 2).
constexpr double kOctaveInCents = 1200.0;

/// Cents in one equal-tempered semitone.
constexpr double kSemitoneInCents = 100.0;

/// 1200 / log10(2). cents = kCentCalculationConstant * log10(ratio).
constexpr double kCentCalculationConstant = 3986.3137138648348;

/// MIDI pitch number of the concert pitch (a' = 69).
constexpr double kConcertPitchMidiNumber = 69.0;

// ---------------------------------------------------------------------------
// Diatonic names
// ---------------------------------------------------------------------------

/// Diatonic note letters ordered along the cycle of fifths.
constexpr char kDiatonicCycleOfFifths[7] = {'f', 'c', 'g', 'd', 'a', 'e', 'b'};

/// Accidental characters: 's' raises by a chromatic semitone, 'f' lowers.
constexpr char kSharpSymbol = 's';
constexpr char kFlatSymbol = 'f';

/// @brief Position of a diatonic letter in kDiatonicCycleOfFifths.
/// @param letter Lowercase note letter.
/// @return 0-6, or -1 if the letter is not diatonic.
inline int cycleOfFifthsPosition(char letter) {
  for (int idx = 0; idx < 7; ++idx) {
    if (kDiatonicCycleOfFifths[idx] == letter) return idx;
  }
  return -1;
}

// ---------------------------------------------------------------------------
// Conversions
// ---------------------------------------------------------------------------

/// @brief Interval in cents between two frequencies.
/// @param frequency Target frequency in Hz (> 0).
/// @param reference Reference frequency in Hz (> 0).
/// @return Positive if frequency is above reference.
inline double hertzToCents(double frequency, double reference) {
  return kCentCalculationConstant * std::log10(frequency / reference);
}

/// @brief Size of a frequency ratio in cents.
/// @param ratio Frequency ratio (> 0).
/// @return Cents (3/2 -> ~701.955, 2 -> 1200).
inline double ratioToCents(double ratio) {
  return kCentCalculationConstant * std::log10(ratio);
}

/// @brief Frequency ratio of an interval given in cents.
/// @param cents Interval size.
/// @return 10^(cents / kCentCalculationConstant).
inline double centsToFrequencyRatio(double cents) {
  return std::pow(10.0, cents / kCentCalculationConstant);
}

/// @brief Convert a frequency to a fractional MIDI pitch number.
/// @param frequency Frequency in Hz (> 0).
/// @param concert_pitch Frequency of MIDI pitch 69 in Hz.
/// @return e.g. 440 -> 69.0, 261.63 -> ~60.0.
inline double hertzToMidiPitchNumber(double frequency,
                                     double concert_pitch = kDefaultConcertPitchHz) {
  return kConcertPitchMidiNumber +
         hertzToCents(frequency, concert_pitch) / kSemitoneInCents;
}

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_PITCH_UTILS_H
