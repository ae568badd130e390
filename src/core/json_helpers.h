// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for pitch analysis
// reports. Does not parse JSON.

#ifndef JUSTPITCH_CORE_JSON_HELPERS_H
#define JUSTPITCH_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace justpitch {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("ratio");
///   writer.value("3/2");
///   writer.key("octave");
///   writer.value(int64_t{0});
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"ratio":"3/2","octave":0}
/// @endcode
///
/// Supports nested objects and arrays. Tracks comma insertion automatically.
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a string value (JSON-escaped).
  void value(const char* val) { value(std::string_view(val)); }

  /// @brief Write an integer value.
  void value(int64_t val);

  /// @brief Write a floating-point value (NaN and infinity become null).
  void value(double val);

  /// @brief Write a boolean value.
  void value(bool val);

  /// @brief Write a null value.
  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const { return buffer_; }

 private:
  /// Append a scalar token, inserting a separating comma if needed.
  void appendValue(std::string_view token);

  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Close the innermost container.
  void closeContainer(char close);

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;
};

}  // namespace justpitch

#endif  // JUSTPITCH_CORE_JSON_HELPERS_H
