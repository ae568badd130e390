// Implementation of the process-wide engine configuration.

#include "core/engine_config.h"

#include <cstdio>
#include <map>
#include <mutex>

#include "core/json_parser.h"
#include "core/prime_utils.h"
#include "core/ratio_codec.h"

namespace justpitch {

namespace {

constexpr const char* kCommaKeyPrefix = "commas.";

struct ConfigState {
  std::mutex mutex;
  PitchEngineConfig config;
  bool frozen = false;
};

ConfigState& configState() {
  static ConfigState state;
  return state;
}

ConfigResult configFailure(const std::string& message) {
  ConfigResult result;
  result.success = false;
  result.error_message = message;
  return result;
}

/// @brief Parse a decimal prime key such as "7".
bool parsePrimeKey(const std::string& text, uint64_t& prime) {
  if (text.empty() || text.size() > 19) return false;
  uint64_t value = 0;
  for (char chr : text) {
    if (chr < '0' || chr > '9') return false;
    value = value * 10 + static_cast<uint64_t>(chr - '0');
  }
  prime = value;
  return true;
}

}  // namespace

const PitchEngineConfig& engineConfig() {
  ConfigState& state = configState();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.frozen = true;
  return state.config;
}

bool installEngineConfig(const PitchEngineConfig& config) {
  ConfigState& state = configState();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (state.frozen) {
    std::fprintf(stderr, "[EngineConfig] WARNING: configuration already in use, install rejected\n");
    return false;
  }
  state.config = config;
  return true;
}

bool isEngineConfigFrozen() {
  ConfigState& state = configState();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.frozen;
}

ConfigResult configFromJson(const char* json, size_t length) {
  bool parsed = false;
  auto kv = parseJsonObject(json, length, &parsed);
  if (!parsed) return configFailure("Malformed JSON object");

  ConfigResult result;

  auto it = kv.find("concert_pitch");
  if (it != kv.end()) {
    if (it->second.type != JsonValue::Number || !(it->second.number_val > 0.0)) {
      return configFailure("concert_pitch must be a positive number");
    }
    result.config.concert_pitch_hz = it->second.number_val;
  }

  it = kv.find("cents_max_denominator");
  if (it != kv.end()) {
    uint32_t bound = it->second.asUint(0);
    if (bound < 1) {
      return configFailure("cents_max_denominator must be a whole number in [1, 2^32)");
    }
    result.config.cents_max_denominator = bound;
  }

  for (const auto& [key, value] : kv) {
    if (key.compare(0, std::char_traits<char>::length(kCommaKeyPrefix), kCommaKeyPrefix) != 0) {
      continue;
    }
    std::string prime_text = key.substr(std::char_traits<char>::length(kCommaKeyPrefix));
    uint64_t prime = 0;
    if (!parsePrimeKey(prime_text, prime) || prime < 5 || !isPrime(prime)) {
      return configFailure("Comma key '" + prime_text + "' is not a prime >= 5");
    }
    if (value.type != JsonValue::String) {
      return configFailure("Comma for prime " + prime_text + " must be a ratio string");
    }
    RatioResult comma = parseRatioString(value.string_val);
    if (!comma.ok()) return configFailure(comma.error_message);
    if (comma.ratio.numerator() <= 0) {
      return configFailure("Comma for prime " + prime_text + " must be positive");
    }
    result.config.comma_table.set(prime, Comma{comma.ratio});
  }

  result.success = true;
  return result;
}

}  // namespace justpitch
