// Pythagorean approximation -- splits a just pitch into its closest 3-limit
// interval plus a comma compound, and derives cent deviation and a diatonic
// pitch name from that split.

#ifndef JUSTPITCH_HARMONY_PYTHAGOREAN_H
#define JUSTPITCH_HARMONY_PYTHAGOREAN_H

#include <optional>
#include <string>

#include "core/comma.h"
#include "pitch/just_intonation_pitch.h"

namespace justpitch {

/// @brief Comma compound of every prime >= 5 occurring in the pitch.
/// @param pitch Pitch to decompose.
/// @param table Comma source (defaults to the configured table).
CommaCompound helmholtzEllisCommas(const JustIntonationPitch& pitch, const PrimeCommaTable& table);
CommaCompound helmholtzEllisCommas(const JustIntonationPitch& pitch);

/// @brief The pitch with its commas removed, folded into [1, 2).
///
/// Example: 5/4 -> 81/64, 11/8 -> 4/3, 8/7 -> 9/8.
JustIntonationPitch closestPythagoreanInterval(const JustIntonationPitch& pitch,
                                               const PrimeCommaTable& table);
JustIntonationPitch closestPythagoreanInterval(const JustIntonationPitch& pitch);

/// @brief Deviation in cents from the nearest 12-tone equal tempered pitch
///        class: cents of the comma compound plus n_fifths * (3/2 - 700 cents).
///
/// Example: 5/4 -> -13.686, 11/8 -> 51.318.
double centDeviationFromClosestWesternPitchClass(const JustIntonationPitch& pitch,
                                                 const PrimeCommaTable& table);
double centDeviationFromClosestWesternPitchClass(const JustIntonationPitch& pitch);

/// @brief Diatonic name of the closest pythagorean interval above a reference.
/// @param pitch Interval above the reference.
/// @param reference Note letter (a-g) followed by accidentals, e.g. "c", "fs".
/// @return Name such as "e", "bf", "cs". std::nullopt for an empty reference
///         or an unknown note letter.
std::optional<std::string> closestPythagoreanPitchName(const JustIntonationPitch& pitch,
                                                       const std::string& reference,
                                                       const PrimeCommaTable& table);
std::optional<std::string> closestPythagoreanPitchName(const JustIntonationPitch& pitch,
                                                       const std::string& reference = "a");

/// @brief Net accidental count: +1 per 's', -1 per 'f'. Other characters are
///        ignored with a warning.
int countAccidentals(const std::string& accidentals);

/// @brief Accidental string for a net count (2 -> "ss", -1 -> "f", 0 -> "").
std::string accidentalsFromCount(int count);

}  // namespace justpitch

#endif  // JUSTPITCH_HARMONY_PYTHAGOREAN_H
