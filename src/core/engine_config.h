// Process-wide engine configuration -- default concert pitch, comma table,
// and the denominator bound for cents approximation.

#ifndef JUSTPITCH_CORE_ENGINE_CONFIG_H
#define JUSTPITCH_CORE_ENGINE_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/basic_types.h"
#include "core/comma.h"

namespace justpitch {

/// @brief Defaults shared by every pitch created without explicit values.
struct PitchEngineConfig {
  double concert_pitch_hz = kDefaultConcertPitchHz;  ///< Frequency of 1/1.
  PrimeCommaTable comma_table = PrimeCommaTable::helmholtzEllis();
  uint32_t cents_max_denominator = kDefaultCentsMaxDenominator;
};

/// @brief Result of building a configuration from JSON.
struct ConfigResult {
  PitchEngineConfig config;
  bool success = false;
  std::string error_message;
};

/// @brief Active configuration.
///
/// The first call freezes the configuration; later installs are rejected.
/// Safe for concurrent reads.
const PitchEngineConfig& engineConfig();

/// @brief Replace the defaults before the configuration is first read.
/// @param config New configuration.
/// @return False (and the config is left unchanged) once engineConfig() has
///         been called.
bool installEngineConfig(const PitchEngineConfig& config);

/// @brief Check whether the active configuration is frozen.
bool isEngineConfigFrozen();

/// @brief Build a configuration from a JSON object.
///
/// Keys (all optional):
///   concert_pitch: number (Hz, > 0)
///   cents_max_denominator: number (>= 1)
///   commas: object mapping a prime >= 5 to a ratio literal, e.g.
///           {"5": "80/81"}. Named entries replace defaults, others stay.
///
/// @param json JSON string.
/// @param length Length of the JSON string.
/// @return ConfigResult; any invalid entry rejects the whole document.
ConfigResult configFromJson(const char* json, size_t length);

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_ENGINE_CONFIG_H
