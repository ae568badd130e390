// Implementation of direct pitch interval helpers.

#include "core/interval.h"

#include <cmath>
#include <limits>

namespace justpitch {

int DirectPitchInterval::octave() const {
  if (std::isnan(cents)) return 0;
  double octaves = std::floor(cents / kOctaveInCents);
  if (octaves >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  if (octaves <= static_cast<double>(std::numeric_limits<int>::min())) {
    return std::numeric_limits<int>::min();
  }
  return static_cast<int>(octaves);
}

}  // namespace justpitch
