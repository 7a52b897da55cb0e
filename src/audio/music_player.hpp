#pragma once

#include "../common/Track.h"
#include "pipeline.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace calmroom {

enum class PlaybackState { Stopped, Playing, Paused };

// Looping background music. All calls, including process_events(), must come
// from the host loop.
class MusicPlayer {
public:
  static constexpr double kDefaultVolume = 0.3;

  MusicPlayer(std::vector<std::filesystem::path> music_dirs,
              PipelineFactory pipeline_factory);
  ~MusicPlayer();

  MusicPlayer(const MusicPlayer &) = delete;
  MusicPlayer &operator=(const MusicPlayer &) = delete;

  std::vector<Track> get_available_tracks() const;

  // Without a path the first available track is played
  bool play(const std::optional<std::string> &path = std::nullopt);
  bool play_next();
  void pause();
  void resume();
  void stop();
  void toggle();
  void set_volume(double volume);

  std::optional<Track> get_current_track_info() const;

  void process_events();
  void set_wakeup_callback(std::function<void()> callback);
  void set_state_callback(std::function<void()> callback);

  double volume() const { return current_volume; }
  bool is_playing() const { return state == PlaybackState::Playing; }
  PlaybackState get_state() const { return state; }
  bool has_pipeline() const { return pipeline != nullptr; }
  const std::optional<std::string> &current_track() const {
    return current_path;
  }
  const std::vector<std::filesystem::path> &get_music_dirs() const {
    return music_dirs;
  }
  const std::string &get_last_error() const { return last_error; }

private:
  void handle_end_of_stream();
  void handle_error(const std::string &message);
  void log_error(const std::string &message);
  void notify_state_change();

  std::vector<std::filesystem::path> music_dirs;
  PipelineFactory pipeline_factory;

  std::unique_ptr<PlaybackPipeline> pipeline;
  PlaybackState state = PlaybackState::Stopped;
  std::optional<std::string> current_path;
  double current_volume = kDefaultVolume;
  std::string last_error;

  std::function<void()> on_wakeup;
  std::function<void()> on_state_change;
};

} // namespace calmroom
