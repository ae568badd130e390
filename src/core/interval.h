// Pitch and interval values defined directly by frequency or cents.
// Used as register references and as interval operands for just pitches.

#ifndef JUSTPITCH_CORE_INTERVAL_H
#define JUSTPITCH_CORE_INTERVAL_H

#include "core/basic_types.h"
#include "core/pitch_utils.h"

namespace justpitch {

/// @brief A pitch given by its frequency in Hz.
struct DirectPitch {
  double frequency = kDefaultConcertPitchHz;

  /// @brief Interval to this pitch from a reference frequency.
  /// @param concert_pitch Reference frequency in Hz.
  /// @return Cents above (positive) or below the reference.
  double centsFrom(double concert_pitch) const {
    return hertzToCents(frequency, concert_pitch);
  }
};

/// @brief An interval given by its size in cents.
struct DirectPitchInterval {
  double cents = 0.0;

  /// @brief Octave of the interval: floor(cents / 1200), saturated to the
  ///        int range (0 for NaN).
  int octave() const;

  /// @brief The interval in the opposite direction.
  DirectPitchInterval inverse() const { return DirectPitchInterval{-cents}; }
};

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_INTERVAL_H
