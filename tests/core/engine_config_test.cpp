// Tests for core/engine_config.h -- defaults, freezing, JSON configuration.

#include "core/engine_config.h"

#include <gtest/gtest.h>

#include <cstring>
#include <string>

#include "test_helpers.h"

namespace justpitch {
namespace {

using test_helpers::ratioOf;

ConfigResult fromJson(const std::string& json) {
  return configFromJson(json.c_str(), json.size());
}

// ---------------------------------------------------------------------------
// Defaults and freezing
// ---------------------------------------------------------------------------

TEST(EngineConfigTest, Defaults) {
  PitchEngineConfig config;
  EXPECT_DOUBLE_EQ(config.concert_pitch_hz, 440.0);
  EXPECT_EQ(config.cents_max_denominator, 10000u);
  EXPECT_EQ(config.comma_table.size(), 13u);
}

TEST(EngineConfigTest, ActiveConfigUsesDefaults) {
  const PitchEngineConfig& config = engineConfig();
  EXPECT_DOUBLE_EQ(config.concert_pitch_hz, 440.0);
  EXPECT_EQ(config.comma_table.find(5)->ratio, ratioOf(80, 81));
}

TEST(EngineConfigTest, InstallRejectedAfterFirstRead) {
  engineConfig();
  EXPECT_TRUE(isEngineConfigFrozen());

  PitchEngineConfig changed;
  changed.concert_pitch_hz = 415.0;
  EXPECT_FALSE(installEngineConfig(changed));
  EXPECT_DOUBLE_EQ(engineConfig().concert_pitch_hz, 440.0);
}

// ---------------------------------------------------------------------------
// configFromJson
// ---------------------------------------------------------------------------

TEST(ConfigFromJsonTest, AllKeys) {
  auto result = fromJson(
      R"({"concert_pitch": 432, "cents_max_denominator": 5000,
          "commas": {"5": "81/80", "53": "53/54"}})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_DOUBLE_EQ(result.config.concert_pitch_hz, 432.0);
  EXPECT_EQ(result.config.cents_max_denominator, 5000u);
  EXPECT_EQ(result.config.comma_table.find(5)->ratio, ratioOf(81, 80));
  EXPECT_EQ(result.config.comma_table.find(53)->ratio, ratioOf(53, 54));
  // Unnamed entries keep their defaults.
  EXPECT_EQ(result.config.comma_table.find(7)->ratio, ratioOf(63, 64));
}

TEST(ConfigFromJsonTest, EmptyObjectGivesDefaults) {
  auto result = fromJson("{}");
  ASSERT_TRUE(result.success);
  EXPECT_DOUBLE_EQ(result.config.concert_pitch_hz, 440.0);
  EXPECT_EQ(result.config.comma_table.size(), 13u);
}

TEST(ConfigFromJsonTest, UnknownKeysIgnored) {
  auto result = fromJson(R"({"tuning": "werckmeister", "concert_pitch": 442})");
  ASSERT_TRUE(result.success);
  EXPECT_DOUBLE_EQ(result.config.concert_pitch_hz, 442.0);
}

TEST(ConfigFromJsonTest, InvalidDocumentsRejected) {
  for (const char* json : {R"({"concert_pitch": 0})", R"({"concert_pitch": "440"})",
                           R"({"cents_max_denominator": 0})", R"({"commas": {"3": "3/2"}})",
                           R"({"commas": {"9": "9/8"}})", R"({"commas": {"x": "1/1"}})",
                           R"({"commas": {"5": "80-81"}})", R"({"commas": {"5": 1.0125}})",
                           R"({"commas": {"5": "-80/81"}})", R"({"concert_pitch": )",
                           R"({"cents_max_denominator": 1e10})",
                           R"({"cents_max_denominator": 2.7})",
                           R"({"cents_max_denominator": -5})"}) {
    auto result = configFromJson(json, std::strlen(json));
    EXPECT_FALSE(result.success) << json;
    EXPECT_FALSE(result.error_message.empty()) << json;
  }
}

}  // namespace
}  // namespace justpitch
