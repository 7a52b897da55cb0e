#include "core/config/settings.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <filesystem>
#include <memory>
#include <stdexcept>

using namespace calmroom;
using calmroom::testing::TempDir;
using calmroom::testing::read_file;
using calmroom::testing::write_file;

namespace {

void expect_default_pattern(const Settings &settings) {
  EXPECT_EQ(settings.get_breathe_in(), 4);
  EXPECT_EQ(settings.get_breathe_hold(), 4);
  EXPECT_EQ(settings.get_breathe_out(), 6);
  EXPECT_EQ(settings.get_favorite_strategy(), "");
}

} // namespace

TEST(SettingsTest, MissingFileGivesDefaults) {
  TempDir dir;
  Settings settings((dir / "settings.json").string());

  expect_default_pattern(settings);
  EXPECT_TRUE(settings.get_load_error().empty());
}

TEST(SettingsTest, MalformedFileGivesDefaults) {
  TempDir dir;
  write_file(dir / "settings.json", "{ not json");

  std::unique_ptr<Settings> settings;
  EXPECT_NO_THROW(settings = std::make_unique<Settings>(
                      (dir / "settings.json").string()));
  expect_default_pattern(*settings);
  EXPECT_FALSE(settings->get_load_error().empty());
}

TEST(SettingsTest, NonObjectFileGivesDefaults) {
  TempDir dir;
  write_file(dir / "settings.json", "[1, 2, 3]");

  Settings settings((dir / "settings.json").string());
  expect_default_pattern(settings);
}

TEST(SettingsTest, WrongTypesFallBackPerKey) {
  TempDir dir;
  write_file(dir / "settings.json",
             R"({"breathe_in": "seven", "breathe_hold": 2, "breathe_out": null,
                 "favorite_strategy": 5, "sound_enabled": "no"})");

  Settings settings((dir / "settings.json").string());
  EXPECT_EQ(settings.get_breathe_in(), 4);
  EXPECT_EQ(settings.get_breathe_hold(), 2);
  EXPECT_EQ(settings.get_breathe_out(), 6);
  EXPECT_EQ(settings.get_favorite_strategy(), "");
  EXPECT_TRUE(settings.get_sound_enabled());
}

TEST(SettingsTest, OutOfRangeValuesAreClamped) {
  TempDir dir;
  write_file(dir / "settings.json",
             R"({"breathe_in": 0, "breathe_hold": 42, "breathe_out": -3,
                 "music_volume": 7.5})");

  Settings settings((dir / "settings.json").string());
  EXPECT_EQ(settings.get_breathe_in(), Settings::kMinBreatheIn);
  EXPECT_EQ(settings.get_breathe_hold(), Settings::kMaxBreatheHold);
  EXPECT_EQ(settings.get_breathe_out(), Settings::kMinBreatheOut);
  EXPECT_DOUBLE_EQ(settings.get_music_volume(), 1.0);
}

TEST(SettingsTest, SaveAndReload) {
  TempDir dir;
  const std::string path = (dir / "settings.json").string();
  {
    Settings settings(path);
    settings.set_breathing_pattern({5, 0, 8});
    settings.set_favorite_strategy("Cold water");
    settings.set_sound_enabled(false);
    settings.set_music_volume(0.55);
    settings.save();
  }

  Settings reloaded(path);
  BreathingPattern pattern = reloaded.get_breathing_pattern();
  EXPECT_EQ(pattern.inhale, 5);
  EXPECT_EQ(pattern.hold, 0);
  EXPECT_EQ(pattern.exhale, 8);
  EXPECT_EQ(reloaded.get_favorite_strategy(), "Cold water");
  EXPECT_FALSE(reloaded.get_sound_enabled());
  EXPECT_DOUBLE_EQ(reloaded.get_music_volume(), 0.55);
}

TEST(SettingsTest, SavePreservesUnknownKeys) {
  TempDir dir;
  const std::string path = (dir / "settings.json").string();
  write_file(path, R"({"theme": "dark", "breathe_in": 3})");

  Settings settings(path);
  settings.set_favorite_strategy("Fidget");
  settings.save();

  rapidjson::Document doc;
  doc.Parse(read_file(path).c_str());
  ASSERT_TRUE(doc.IsObject());
  ASSERT_TRUE(doc.HasMember("theme"));
  EXPECT_STREQ(doc["theme"].GetString(), "dark");
  EXPECT_EQ(doc["breathe_in"].GetInt(), 3);
  EXPECT_STREQ(doc["favorite_strategy"].GetString(), "Fidget");
}

TEST(SettingsTest, SetterClampsPattern) {
  TempDir dir;
  Settings settings((dir / "settings.json").string());
  settings.set_breathing_pattern({99, -1, 0});

  EXPECT_EQ(settings.get_breathe_in(), Settings::kMaxBreatheIn);
  EXPECT_EQ(settings.get_breathe_hold(), Settings::kMinBreatheHold);
  EXPECT_EQ(settings.get_breathe_out(), Settings::kMinBreatheOut);
}

TEST(SettingsTest, SaveCreatesParentDirectory) {
  TempDir dir;
  const auto path = dir / "nested" / "deeper" / "settings.json";
  Settings settings(path.string());
  settings.set_sound_enabled(false);

  EXPECT_NO_THROW(settings.save());
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(SettingsTest, SaveFailureThrows) {
  TempDir dir;
  write_file(dir / "blocker", "file, not a directory");
  Settings settings((dir / "blocker" / "settings.json").string());

  EXPECT_THROW(settings.save(), std::runtime_error);
}

TEST(SettingsTest, OtherDefaults) {
  TempDir dir;
  Settings settings((dir / "settings.json").string());

  EXPECT_TRUE(settings.get_sound_enabled());
  EXPECT_TRUE(settings.get_notifications_enabled());
  EXPECT_DOUBLE_EQ(settings.get_music_volume(), Settings::kDefaultMusicVolume);
  EXPECT_FALSE(settings.get_audio_output().empty());
}
