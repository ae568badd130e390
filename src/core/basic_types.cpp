// Implementation of enum-to-string conversions.

#include "core/basic_types.h"

namespace justpitch {

const char* pitchErrorToString(PitchError error) {
  switch (error) {
    case PitchError::None:               return "None";
    case PitchError::ParseError:         return "ParseError";
    case PitchError::UnsupportedType:    return "UnsupportedType";
    case PitchError::RegisterResolution: return "RegisterResolution";
  }
  return "Unknown";
}

}  // namespace justpitch
