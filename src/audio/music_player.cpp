#include "music_player.hpp"
#include "../common/notification.hpp"
#include "track_catalog.hpp"
#include <algorithm>
#include <exception>
#include <fmt/format.h>
#include <utility>

namespace calmroom {

MusicPlayer::MusicPlayer(std::vector<std::filesystem::path> music_dirs,
                         PipelineFactory pipeline_factory)
    : music_dirs(std::move(music_dirs)),
      pipeline_factory(std::move(pipeline_factory)) {}

MusicPlayer::~MusicPlayer() { pipeline.reset(); }

std::vector<Track> MusicPlayer::get_available_tracks() const {
  return discover_tracks(music_dirs);
}

bool MusicPlayer::play(const std::optional<std::string> &path) {
  std::string track_path;
  if (path && !path->empty()) {
    track_path = resolve_track_path(*path);
  } else {
    auto tracks = get_available_tracks();
    if (tracks.empty()) {
      return false;
    }
    track_path = tracks.front().path;
  }

  stop();

  try {
    pipeline = pipeline_factory(track_path);
  } catch (const std::exception &e) {
    log_error(fmt::format("Cannot play {}: {}", track_path, e.what()));
    pipeline.reset();
  }
  if (!pipeline) {
    return false;
  }

  pipeline->set_volume(current_volume);
  pipeline->set_wakeup_callback([this] {
    if (on_wakeup) {
      on_wakeup();
    }
  });
  pipeline->set_playing(true);

  state = PlaybackState::Playing;
  current_path = track_path;
  notify_state_change();
  return true;
}

bool MusicPlayer::play_next() {
  auto tracks = get_available_tracks();
  if (tracks.empty()) {
    return false;
  }

  size_t next_index = 0;
  if (current_path) {
    auto it = std::find_if(tracks.begin(), tracks.end(), [this](const Track &t) {
      return t.path == *current_path;
    });
    // A track that vanished from disk restarts the list
    if (it != tracks.end()) {
      next_index = (static_cast<size_t>(it - tracks.begin()) + 1) % tracks.size();
    }
  }
  return play(tracks[next_index].path);
}

void MusicPlayer::pause() {
  if (pipeline && state == PlaybackState::Playing) {
    pipeline->set_playing(false);
    state = PlaybackState::Paused;
    notify_state_change();
  }
}

void MusicPlayer::resume() {
  if (pipeline && state != PlaybackState::Playing) {
    pipeline->set_playing(true);
    state = PlaybackState::Playing;
    notify_state_change();
  }
}

void MusicPlayer::stop() {
  bool changed = pipeline != nullptr || state != PlaybackState::Stopped;
  pipeline.reset();
  state = PlaybackState::Stopped;
  current_path.reset();
  if (changed) {
    notify_state_change();
  }
}

void MusicPlayer::toggle() {
  if (state == PlaybackState::Playing) {
    pause();
  } else if (pipeline) {
    resume();
  } else {
    play();
  }
}

void MusicPlayer::set_volume(double volume) {
  current_volume = std::clamp(volume, 0.0, 1.0);
  if (pipeline) {
    pipeline->set_volume(current_volume);
  }
}

std::optional<Track> MusicPlayer::get_current_track_info() const {
  if (!current_path) {
    return std::nullopt;
  }
  for (const auto &track : get_available_tracks()) {
    if (track.path == *current_path) {
      return track;
    }
  }
  return std::nullopt;
}

void MusicPlayer::process_events() {
  if (!pipeline) {
    return;
  }
  for (const auto &event : pipeline->poll_events()) {
    switch (event.type) {
    case PipelineEvent::Type::EndOfStream:
      handle_end_of_stream();
      break;
    case PipelineEvent::Type::Error:
      handle_error(event.message);
      // stop() released the pipeline that produced the batch
      return;
    }
  }
}

void MusicPlayer::set_wakeup_callback(std::function<void()> callback) {
  on_wakeup = std::move(callback);
}

void MusicPlayer::set_state_callback(std::function<void()> callback) {
  on_state_change = std::move(callback);
}

// Loop: restart from the beginning, the track never finishes
void MusicPlayer::handle_end_of_stream() {
  if (pipeline && current_path) {
    pipeline->seek_to_start();
    // keep-open pauses at EOF; a pause issued meanwhile must stick
    pipeline->set_playing(state == PlaybackState::Playing);
  }
}

void MusicPlayer::handle_error(const std::string &message) {
  log_error("Music playback error: " + message);
  stop();
}

void MusicPlayer::log_error(const std::string &message) {
  last_error = message;
  notifications::send("[MusicPlayer Error] " + message);
}

void MusicPlayer::notify_state_change() {
  if (on_state_change) {
    on_state_change();
  }
}

} // namespace calmroom
