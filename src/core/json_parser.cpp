// Implementation of the minimal JSON object parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace justpitch {

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type != Number || !(number_val >= 0.0) ||
      number_val > static_cast<double>(std::numeric_limits<uint32_t>::max()) ||
      std::floor(number_val) != number_val) {
    return default_val;
  }
  return static_cast<uint32_t>(number_val);
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

namespace {

/// @brief Skip whitespace in JSON string.
void skipWhitespace(const char* json, size_t length, size_t& pos) {
  while (pos < length && std::isspace(static_cast<unsigned char>(json[pos]))) {
    ++pos;
  }
}

/// @brief Parse a JSON string literal (expects pos at opening quote).
/// @return False if the closing quote is missing.
bool parseString(const char* json, size_t length, size_t& pos, std::string& result) {
  result.clear();
  if (pos >= length || json[pos] != '"') return false;
  ++pos;  // skip opening quote

  while (pos < length && json[pos] != '"') {
    if (json[pos] == '\\' && pos + 1 < length) {
      ++pos;
      switch (json[pos]) {
        case '"':  result += '"'; break;
        case '\\': result += '\\'; break;
        case '/':  result += '/'; break;
        case 'n':  result += '\n'; break;
        case 't':  result += '\t'; break;
        case 'r':  result += '\r'; break;
        default:   result += json[pos]; break;
      }
    } else {
      result += json[pos];
    }
    ++pos;
  }

  if (pos >= length) return false;
  ++pos;  // skip closing quote
  return true;
}

/// @brief Parse a JSON number (integer, fraction, exponent).
bool parseNumber(const char* json, size_t length, size_t& pos, JsonValue& val) {
  size_t start = pos;
  if (pos < length && json[pos] == '-') ++pos;
  while (pos < length && (std::isdigit(static_cast<unsigned char>(json[pos])) ||
                          json[pos] == '.' || json[pos] == 'e' || json[pos] == 'E' ||
                          json[pos] == '+' || json[pos] == '-')) {
    ++pos;
  }

  std::string num_str(json + start, pos - start);
  char* end = nullptr;
  val.type = JsonValue::Number;
  val.number_val = std::strtod(num_str.c_str(), &end);
  return !num_str.empty() && end == num_str.c_str() + num_str.size();
}

/// @brief Skip an array (arrays are not stored).
bool skipArray(const char* json, size_t length, size_t& pos) {
  int depth = 0;
  std::string scratch;
  while (pos < length) {
    if (json[pos] == '"') {
      if (!parseString(json, length, pos, scratch)) return false;
      continue;
    }
    if (json[pos] == '[') ++depth;
    if (json[pos] == ']') --depth;
    ++pos;
    if (depth == 0) return true;
  }
  return false;
}

bool matchLiteral(const char* json, size_t length, size_t& pos, const char* literal) {
  size_t idx = 0;
  for (; literal[idx] != '\0'; ++idx) {
    if (pos + idx >= length || json[pos + idx] != literal[idx]) return false;
  }
  pos += idx;
  return true;
}

/// @brief Parse the members of an object (expects pos at '{').
/// @param prefix Dotted key prefix of the enclosing object ("" at top level).
bool parseMembers(const char* json, size_t length, size_t& pos, const std::string& prefix,
                  std::map<std::string, JsonValue>& result) {
  if (pos >= length || json[pos] != '{') return false;
  ++pos;  // skip '{'

  bool expect_member = false;
  while (true) {
    skipWhitespace(json, length, pos);
    if (pos >= length) return false;
    if (json[pos] == '}') {
      ++pos;
      return !expect_member;
    }

    // Parse key
    std::string key;
    if (!parseString(json, length, pos, key)) return false;
    std::string full_key = prefix.empty() ? key : prefix + "." + key;

    // Skip colon
    skipWhitespace(json, length, pos);
    if (pos >= length || json[pos] != ':') return false;
    ++pos;
    skipWhitespace(json, length, pos);
    if (pos >= length) return false;

    // Parse value
    JsonValue val;
    if (json[pos] == '"') {
      val.type = JsonValue::String;
      if (!parseString(json, length, pos, val.string_val)) return false;
      result[full_key] = val;
    } else if (json[pos] == 't' || json[pos] == 'f') {
      val.type = JsonValue::Bool;
      val.bool_val = json[pos] == 't';
      if (!matchLiteral(json, length, pos, val.bool_val ? "true" : "false")) return false;
      result[full_key] = val;
    } else if (json[pos] == 'n') {
      if (!matchLiteral(json, length, pos, "null")) return false;
      result[full_key] = val;
    } else if (json[pos] == '{') {
      if (!parseMembers(json, length, pos, full_key, result)) return false;
    } else if (json[pos] == '[') {
      if (!skipArray(json, length, pos)) return false;
    } else {
      if (!parseNumber(json, length, pos, val)) return false;
      result[full_key] = val;
    }

    // Comma between entries
    skipWhitespace(json, length, pos);
    expect_member = false;
    if (pos < length && json[pos] == ',') {
      ++pos;
      expect_member = true;
    } else if (pos < length && json[pos] != '}') {
      return false;
    }
  }
}

}  // namespace

std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length, bool* ok) {
  std::map<std::string, JsonValue> result;
  if (ok) *ok = false;
  if (!json || length == 0) return result;

  size_t pos = 0;
  skipWhitespace(json, length, pos);
  if (!parseMembers(json, length, pos, "", result)) {
    result.clear();
    return result;
  }
  skipWhitespace(json, length, pos);
  if (pos != length) {
    result.clear();
    return result;
  }
  if (ok) *ok = true;
  return result;
}

}  // namespace justpitch
