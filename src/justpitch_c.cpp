// Implementation of C API for WASM and FFI bindings.

#include "justpitch_c.h"

#include <cstdlib>
#include <cstring>
#include <string>

#include "core/basic_types.h"
#include "core/engine_config.h"
#include "core/json_helpers.h"
#include "core/ratio_codec.h"
#include "core/version_info.h"
#include "harmony/harmonicity.h"
#include "harmony/pythagorean.h"
#include "pitch/just_intonation_pitch.h"

namespace {

/// @brief Map an engine error kind to a C error code.
JustPitchError toCError(justpitch::PitchError error) {
  switch (error) {
    case justpitch::PitchError::None:               return JUSTPITCH_OK;
    case justpitch::PitchError::ParseError:         return JUSTPITCH_ERROR_PARSE;
    case justpitch::PitchError::UnsupportedType:    return JUSTPITCH_ERROR_UNSUPPORTED_TYPE;
    case justpitch::PitchError::RegisterResolution: return JUSTPITCH_ERROR_REGISTER_RESOLUTION;
  }
  return JUSTPITCH_ERROR_INVALID_PARAM;
}

/// @brief Build the JSON analysis report of a pitch.
std::string buildReportJson(const justpitch::JustIntonationPitch& pitch) {
  justpitch::JsonWriter writer;
  writer.beginObject();

  writer.key("ratio");
  writer.value(justpitch::ratioToString(pitch.ratio()));
  writer.key("exponents");
  writer.beginArray();
  for (int exponent : pitch.exponentVector()) {
    writer.value(static_cast<int64_t>(exponent));
  }
  writer.endArray();

  writer.key("frequency");
  writer.value(pitch.frequency());
  writer.key("cents");
  writer.value(pitch.interval());
  writer.key("octave");
  writer.value(static_cast<int64_t>(pitch.octave()));
  writer.key("barlow");
  writer.value(justpitch::harmonicityBarlow(pitch));
  writer.key("simplified_barlow");
  writer.value(justpitch::harmonicitySimplifiedBarlow(pitch));
  writer.key("euler");
  writer.value(justpitch::harmonicityEuler(pitch));
  writer.key("tenney");
  writer.value(justpitch::harmonicityTenney(pitch));
  writer.key("vogel");
  writer.value(justpitch::harmonicityVogel(pitch));
  writer.key("wilson");
  writer.value(justpitch::harmonicityWilson(pitch));
  writer.key("otonal");
  writer.value(pitch.tonality());
  writer.key("cent_deviation");
  writer.value(justpitch::centDeviationFromClosestWesternPitchClass(pitch));
  writer.key("closest_pythagorean");
  writer.value(justpitch::ratioToString(justpitch::closestPythagoreanInterval(pitch).ratio()));

  writer.endObject();
  return writer.toString();
}

}  // namespace

extern "C" {

// ============================================================================
// Analysis
// ============================================================================

JustPitchError justpitch_analyze(const char* ratio, double concert_pitch_hz, JustPitchInfo* info) {
  if (!ratio || !info) {
    return JUSTPITCH_ERROR_INVALID_PARAM;
  }

  auto parsed = concert_pitch_hz > 0.0
                    ? justpitch::JustIntonationPitch::fromSource(
                          justpitch::RatioLiteral{ratio}, justpitch::DirectPitch{concert_pitch_hz})
                    : justpitch::JustIntonationPitch::fromRatioString(ratio);
  if (!parsed.ok()) {
    return toCError(parsed.error);
  }

  const auto& pitch = parsed.pitch;
  info->frequency = pitch.frequency();
  info->cents = pitch.interval();
  info->octave = pitch.octave();
  info->barlow = justpitch::harmonicityBarlow(pitch);
  info->simplified_barlow = justpitch::harmonicitySimplifiedBarlow(pitch);
  info->euler = justpitch::harmonicityEuler(pitch);
  info->tenney = justpitch::harmonicityTenney(pitch);
  info->vogel = justpitch::harmonicityVogel(pitch);
  info->wilson = justpitch::harmonicityWilson(pitch);
  info->otonal = pitch.tonality() ? 1 : 0;
  info->cent_deviation = justpitch::centDeviationFromClosestWesternPitchClass(pitch);
  return JUSTPITCH_OK;
}

JustPitchReport* justpitch_analyze_json(const char* ratio) {
  if (!ratio) return nullptr;
  auto parsed = justpitch::JustIntonationPitch::fromRatioString(ratio);
  if (!parsed.ok()) return nullptr;

  std::string json = buildReportJson(parsed.pitch);
  auto* result = static_cast<JustPitchReport*>(malloc(sizeof(JustPitchReport)));
  if (!result) return nullptr;

  result->length = json.size();
  result->json = static_cast<char*>(malloc(result->length + 1));
  if (!result->json) {
    free(result);
    return nullptr;
  }

  memcpy(result->json, json.c_str(), result->length + 1);
  return result;
}

void justpitch_free_report(JustPitchReport* report) {
  if (report) {
    free(report->json);
    free(report);
  }
}

JustPitchError justpitch_pitch_name(const char* ratio, const char* reference, char* buffer,
                                    size_t size) {
  if (!ratio || !reference || !buffer || size == 0) {
    return JUSTPITCH_ERROR_INVALID_PARAM;
  }

  auto parsed = justpitch::JustIntonationPitch::fromRatioString(ratio);
  if (!parsed.ok()) {
    return toCError(parsed.error);
  }

  auto name = justpitch::closestPythagoreanPitchName(parsed.pitch, reference);
  if (!name) {
    return JUSTPITCH_ERROR_INVALID_REFERENCE;
  }
  if (name->size() + 1 > size) {
    return JUSTPITCH_ERROR_BUFFER_TOO_SMALL;
  }
  memcpy(buffer, name->c_str(), name->size() + 1);
  return JUSTPITCH_OK;
}

// ============================================================================
// Configuration
// ============================================================================

JustPitchError justpitch_configure_from_json(const char* json, size_t length) {
  if (!json) {
    return JUSTPITCH_ERROR_INVALID_PARAM;
  }

  justpitch::ConfigResult parsed = justpitch::configFromJson(json, length);
  if (!parsed.success) {
    return JUSTPITCH_ERROR_INVALID_CONFIG;
  }
  if (!justpitch::installEngineConfig(parsed.config)) {
    return JUSTPITCH_ERROR_CONFIG_FROZEN;
  }
  return JUSTPITCH_OK;
}

// ============================================================================
// Error Handling
// ============================================================================

const char* justpitch_error_string(JustPitchError error) {
  switch (error) {
    case JUSTPITCH_OK: return "No error";
    case JUSTPITCH_ERROR_INVALID_PARAM: return "Invalid parameter";
    case JUSTPITCH_ERROR_PARSE: return "Malformed ratio literal";
    case JUSTPITCH_ERROR_UNSUPPORTED_TYPE: return "Ratio cannot be represented";
    case JUSTPITCH_ERROR_REGISTER_RESOLUTION: return "No register candidate found";
    case JUSTPITCH_ERROR_INVALID_CONFIG: return "Invalid configuration";
    case JUSTPITCH_ERROR_CONFIG_FROZEN: return "Configuration already in use";
    case JUSTPITCH_ERROR_BUFFER_TOO_SMALL: return "Output buffer too small";
    case JUSTPITCH_ERROR_INVALID_REFERENCE: return "Invalid reference note";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* justpitch_version(void) {
  return JUSTPITCH_VERSION;
}

}  // extern "C"
