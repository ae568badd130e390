/// @file
/// @brief Implementation of the minimal JSON writer for analysis reports.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace justpitch {

namespace {

/// Significant digits for floating-point output (cents need sub-cent detail).
constexpr int kDoublePrecision = 15;

}  // namespace

void JsonWriter::beginObject() {
  maybeComma();
  buffer_ += '{';
  needs_comma_.push_back(false);
}

void JsonWriter::endObject() {
  closeContainer('}');
}

void JsonWriter::beginArray() {
  maybeComma();
  buffer_ += '[';
  needs_comma_.push_back(false);
}

void JsonWriter::endArray() {
  closeContainer(']');
}

void JsonWriter::key(std::string_view name) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The value that follows belongs to this key and takes no comma.
  if (!needs_comma_.empty()) {
    needs_comma_.back() = false;
  }
}

void JsonWriter::value(std::string_view val) {
  appendValue("\"" + escapeString(val) + "\"");
}

void JsonWriter::value(int64_t val) {
  appendValue(std::to_string(val));
}

void JsonWriter::value(double val) {
  if (!std::isfinite(val)) {
    appendValue("null");
    return;
  }
  std::ostringstream oss;
  oss << std::setprecision(kDoublePrecision) << val;
  appendValue(oss.str());
}

void JsonWriter::value(bool val) {
  appendValue(val ? "true" : "false");
}

void JsonWriter::valueNull() {
  appendValue("null");
}

void JsonWriter::appendValue(std::string_view token) {
  maybeComma();
  buffer_ += token;
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

void JsonWriter::maybeComma() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
    needs_comma_.back() = false;
  }
}

void JsonWriter::closeContainer(char close) {
  buffer_ += close;
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        // Remaining control characters (0x00-0x1F) as \u00XX.
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace justpitch
