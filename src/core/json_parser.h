// Minimal JSON object parser for engine configuration (no external
// dependencies).
//
// Handles string, number, and boolean values. Nested objects are flattened
// into dotted keys ({"commas": {"5": "80/81"}} -> "commas.5"). Arrays are
// skipped.

#ifndef JUSTPITCH_CORE_JSON_PARSER_H
#define JUSTPITCH_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace justpitch {

/// @brief A single JSON value (string, number, or boolean).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as unsigned integer, with default.
  ///
  /// Only whole numbers in [0, 2^32) convert; anything else yields default_val.
  uint32_t asUint(uint32_t default_val = 0) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;
};

/// @brief Parse a JSON object into a key-value map.
///
/// Keys of nested objects are joined to their parent key with '.'.
///
/// @param json Pointer to JSON string.
/// @param length Length of JSON string.
/// @param ok Optional output, set to false when the document is not a
///        well-formed object.
/// @return Map of key-value pairs. Empty map on parse error.
std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length,
                                                 bool* ok = nullptr);

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_JSON_PARSER_H
