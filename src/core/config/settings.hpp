#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "../../breathing/breathing_cycle.hpp"
#include "../../common/paths.hpp"

namespace calmroom {

class Settings {
public:
  static constexpr int kDefaultBreatheIn = 4;
  static constexpr int kDefaultBreatheHold = 4;
  static constexpr int kDefaultBreatheOut = 6;
  static constexpr double kDefaultMusicVolume = 0.3;

  // Ranges offered by the preferences panel
  static constexpr int kMinBreatheIn = 1, kMaxBreatheIn = 10;
  static constexpr int kMinBreatheHold = 0, kMaxBreatheHold = 10;
  static constexpr int kMinBreatheOut = 1, kMaxBreatheOut = 15;

private:
  rapidjson::Document settings;
  std::string settings_path;
  std::string load_error;

  void reset_to_defaults() {
    settings.SetObject();
  }

  std::string get_string_value(const char *key,
                               const std::string &default_value = "") const {
    if (settings.HasMember(key) && settings[key].IsString()) {
      return settings[key].GetString();
    }
    return default_value;
  }

  bool get_bool_value(const char *key, bool default_value = false) const {
    if (settings.HasMember(key) && settings[key].IsBool()) {
      return settings[key].GetBool();
    }
    return default_value;
  }

  int get_int_value(const char *key, int default_value = 0) const {
    if (settings.HasMember(key) && settings[key].IsInt()) {
      return settings[key].GetInt();
    }
    return default_value;
  }

  double get_double_value(const char *key, double default_value = 0.0) const {
    if (settings.HasMember(key) && settings[key].IsNumber()) {
      return settings[key].GetDouble();
    }
    return default_value;
  }

  void set_value(const char *key, rapidjson::Value value) {
    auto &allocator = settings.GetAllocator();
    auto it = settings.FindMember(key);
    if (it != settings.MemberEnd()) {
      it->value = value;
    } else {
      settings.AddMember(rapidjson::Value(key, allocator), value, allocator);
    }
  }

public:
  // Missing or malformed files leave every value at its default
  explicit Settings(const std::string &path = "")
      : settings_path(path.empty() ? paths::get_settings_path() : path) {
    reset_to_defaults();

    std::ifstream file(settings_path);
    if (!file.good()) {
      return;
    }

    std::string json_str((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    rapidjson::Document parsed;
    if (parsed.Parse(json_str.c_str()).HasParseError() || !parsed.IsObject()) {
      load_error = "Invalid settings file format: " + settings_path;
      return;
    }
    settings.Swap(parsed);
  }

  Settings(const Settings &) = delete;
  Settings &operator=(const Settings &) = delete;

  // Throws std::runtime_error when the file cannot be written
  void save() const {
    paths::ensure_directory_exists(
        std::filesystem::path(settings_path).parent_path().string());

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    settings.Accept(writer);

    std::ofstream file(settings_path, std::ios::trunc);
    if (!file) {
      throw std::runtime_error("Cannot write settings file: " + settings_path);
    }
    file << buffer.GetString() << std::endl;
    if (!file) {
      throw std::runtime_error("Failed writing settings file: " + settings_path);
    }
  }

  const std::string &path() const { return settings_path; }
  const std::string &get_load_error() const { return load_error; }

  int get_breathe_in() const {
    return std::clamp(get_int_value("breathe_in", kDefaultBreatheIn),
                      kMinBreatheIn, kMaxBreatheIn);
  }

  int get_breathe_hold() const {
    return std::clamp(get_int_value("breathe_hold", kDefaultBreatheHold),
                      kMinBreatheHold, kMaxBreatheHold);
  }

  int get_breathe_out() const {
    return std::clamp(get_int_value("breathe_out", kDefaultBreatheOut),
                      kMinBreatheOut, kMaxBreatheOut);
  }

  BreathingPattern get_breathing_pattern() const {
    return {get_breathe_in(), get_breathe_hold(), get_breathe_out()};
  }

  std::string get_favorite_strategy() const {
    return get_string_value("favorite_strategy", "");
  }

  bool get_sound_enabled() const {
    return get_bool_value("sound_enabled", true);
  }

  bool get_notifications_enabled() const {
    return get_bool_value("show_notifications", true);
  }

  double get_music_volume() const {
    return std::clamp(get_double_value("music_volume", kDefaultMusicVolume),
                      0.0, 1.0);
  }

  std::string get_audio_output() const {
#ifdef _WIN32
    return get_string_value("audio_output", "wasapi");
#elif defined(__APPLE__)
    return get_string_value("audio_output", "coreaudio");
#else
    return get_string_value("audio_output", "pulse");
#endif
  }

  void set_breathing_pattern(const BreathingPattern &pattern) {
    set_value("breathe_in", rapidjson::Value(std::clamp(
                                pattern.inhale, kMinBreatheIn, kMaxBreatheIn)));
    set_value("breathe_hold",
              rapidjson::Value(std::clamp(pattern.hold, kMinBreatheHold,
                                          kMaxBreatheHold)));
    set_value("breathe_out", rapidjson::Value(std::clamp(
                                 pattern.exhale, kMinBreatheOut, kMaxBreatheOut)));
  }

  void set_favorite_strategy(const std::string &strategy) {
    set_value("favorite_strategy",
              rapidjson::Value(strategy.c_str(), settings.GetAllocator()));
  }

  void set_sound_enabled(bool enabled) {
    set_value("sound_enabled", rapidjson::Value(enabled));
  }

  void set_notifications_enabled(bool enabled) {
    set_value("show_notifications", rapidjson::Value(enabled));
  }

  void set_music_volume(double volume) {
    set_value("music_volume", rapidjson::Value(std::clamp(volume, 0.0, 1.0)));
  }
};

} // namespace calmroom
