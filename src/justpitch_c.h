// C API for WASM and FFI bindings.

#ifndef JUSTPITCH_C_H
#define JUSTPITCH_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Error Definitions
// ============================================================================

/// @brief Error codes returned by API functions.
typedef enum {
  JUSTPITCH_OK = 0,
  JUSTPITCH_ERROR_INVALID_PARAM = 1,
  JUSTPITCH_ERROR_PARSE = 2,
  JUSTPITCH_ERROR_UNSUPPORTED_TYPE = 3,
  JUSTPITCH_ERROR_REGISTER_RESOLUTION = 4,
  JUSTPITCH_ERROR_INVALID_CONFIG = 5,
  JUSTPITCH_ERROR_CONFIG_FROZEN = 6,
  JUSTPITCH_ERROR_BUFFER_TOO_SMALL = 7,
  JUSTPITCH_ERROR_INVALID_REFERENCE = 8,
} JustPitchError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Numeric analysis of one ratio.
typedef struct {
  double frequency;            ///< Hz, ratio times concert pitch
  double cents;                ///< Interval above 1/1
  int32_t octave;              ///< floor(cents / 1200), computed exactly
  double barlow;               ///< Barlow harmonicity (+inf for 1/1)
  double simplified_barlow;    ///< |barlow|, 1 for 1/1
  int64_t euler;               ///< Gradus suavitatis
  double tenney;               ///< log2(numerator * denominator)
  int64_t vogel;               ///< Vogel complexity
  int64_t wilson;              ///< Wilson complexity
  uint8_t otonal;              ///< 1 if otonal, 0 if utonal
  double cent_deviation;       ///< Deviation from the closest 12-EDO pitch class
} JustPitchInfo;

/// @brief JSON report output.
typedef struct {
  char* json;     ///< JSON string
  size_t length;  ///< String length
} JustPitchReport;

// ============================================================================
// Analysis
// ============================================================================

/// @brief Analyze a ratio literal such as "3/2".
/// @param ratio Null-terminated ratio literal
/// @param concert_pitch_hz Frequency of 1/1 (<= 0 uses the configured default)
/// @param info Output
/// @return JUSTPITCH_OK on success
JustPitchError justpitch_analyze(const char* ratio, double concert_pitch_hz, JustPitchInfo* info);

/// @brief Analyze a ratio literal and return the result as JSON.
///
/// JSON fields: ratio, exponents, frequency, cents, octave, barlow,
/// simplified_barlow, euler, tenney, vogel, wilson, otonal, cent_deviation,
/// closest_pythagorean.
///
/// @param ratio Null-terminated ratio literal
/// @return Report (must be freed with justpitch_free_report), or NULL on error
JustPitchReport* justpitch_analyze_json(const char* ratio);

/// @brief Free a report.
/// @param report Pointer returned by justpitch_analyze_json
void justpitch_free_report(JustPitchReport* report);

/// @brief Closest pythagorean pitch name of a ratio above a reference note.
/// @param ratio Null-terminated ratio literal
/// @param reference Note letter with optional accidentals ("c", "fs", "bf")
/// @param buffer Output buffer (null-terminated on success)
/// @param size Size of buffer in bytes
/// @return JUSTPITCH_OK on success
JustPitchError justpitch_pitch_name(const char* ratio, const char* reference, char* buffer,
                                    size_t size);

// ============================================================================
// Configuration
// ============================================================================

/// @brief Install the process-wide configuration from JSON.
///
/// JSON fields (all optional, defaults applied):
///   concert_pitch: number (Hz, > 0, default 440)
///   cents_max_denominator: number (>= 1, default 10000)
///   commas: object, prime -> ratio string (e.g. {"5": "80/81"})
///
/// Must be called before any other function reads the configuration.
///
/// @param json JSON config string
/// @param length Length of the JSON string
/// @return JUSTPITCH_OK on success, JUSTPITCH_ERROR_CONFIG_FROZEN if the
///         configuration is already in use
JustPitchError justpitch_configure_from_json(const char* json, size_t length);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* justpitch_error_string(JustPitchError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* justpitch_version(void);

#ifdef __cplusplus
}
#endif

#endif  // JUSTPITCH_C_H
