#include "mpv_pipeline.hpp"
#include <cstring>
#include <stdexcept>
#include <utility>

namespace calmroom {

MpvPipeline::MpvPipeline(const std::string &path,
                         const std::string &audio_output) {
  mpv.reset(mpv_create());
  if (!mpv) {
    throw std::runtime_error("Failed to create MPV instance");
  }

  // Starts paused; the player unpauses once volume and listeners are set.
  // keep-open leaves the file loaded at EOF so it can seek back to 0.
  const std::vector<std::pair<std::string, std::string>> mpv_options = {
      {"video", "no"},
      {"audio-display", "no"},
      {"terminal", "no"},
      {"quiet", "yes"},
      {"keep-open", "yes"},
      {"pause", "yes"},
      {"ao", audio_output},
  };

  for (const auto &[option, value] : mpv_options) {
    if (value.empty()) {
      continue;
    }
    int result = mpv_set_option_string(mpv.get(), option.c_str(), value.c_str());
    if (result < 0) {
      throw std::runtime_error("Failed to set option " + option + ": " +
                               mpv_error_string(result));
    }
  }

  if (mpv_initialize(mpv.get()) < 0) {
    throw std::runtime_error("MPV initialization failed");
  }

  mpv_observe_property(mpv.get(), 0, "eof-reached", MPV_FORMAT_FLAG);

  const char *cmd[] = {"loadfile", path.c_str(), NULL};
  int result = mpv_command(mpv.get(), cmd);
  if (result < 0) {
    throw std::runtime_error("Failed to load " + path + ": " +
                             mpv_error_string(result));
  }
}

MpvPipeline::~MpvPipeline() {
  if (mpv) {
    mpv_set_wakeup_callback(mpv.get(), nullptr, nullptr);
  }
  mpv.reset();
}

void MpvPipeline::set_playing(bool playing) {
  int paused = playing ? 0 : 1;
  mpv_set_property_async(mpv.get(), 0, "pause", MPV_FORMAT_FLAG, &paused);
}

void MpvPipeline::set_volume(double volume) {
  double mpv_volume = volume * 100.0;
  mpv_set_property_async(mpv.get(), 0, "volume", MPV_FORMAT_DOUBLE,
                         &mpv_volume);
}

void MpvPipeline::seek_to_start() {
  const char *cmd[] = {"seek", "0", "absolute", NULL};
  mpv_command_async(mpv.get(), 0, cmd);
}

std::vector<PipelineEvent> MpvPipeline::poll_events() {
  std::vector<PipelineEvent> events;
  while (true) {
    mpv_event *event = mpv_wait_event(mpv.get(), 0);
    if (event->event_id == MPV_EVENT_NONE) {
      break;
    }

    switch (event->event_id) {
    case MPV_EVENT_PROPERTY_CHANGE: {
      auto *prop = static_cast<mpv_event_property *>(event->data);
      if (strcmp(prop->name, "eof-reached") == 0 &&
          prop->format == MPV_FORMAT_FLAG &&
          *static_cast<int *>(prop->data) != 0) {
        events.push_back({PipelineEvent::Type::EndOfStream, ""});
      }
      break;
    }
    case MPV_EVENT_END_FILE: {
      auto *end_file = static_cast<mpv_event_end_file *>(event->data);
      if (end_file->reason == MPV_END_FILE_REASON_ERROR) {
        events.push_back(
            {PipelineEvent::Type::Error, mpv_error_string(end_file->error)});
      }
      break;
    }
    default:
      break;
    }
  }
  return events;
}

void MpvPipeline::set_wakeup_callback(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(wakeup_mutex);
    on_wakeup = std::move(callback);
  }
  mpv_set_wakeup_callback(mpv.get(), &MpvPipeline::on_mpv_wakeup, this);
}

void MpvPipeline::on_mpv_wakeup(void *ctx) {
  auto *self = static_cast<MpvPipeline *>(ctx);
  std::lock_guard<std::mutex> lock(self->wakeup_mutex);
  if (self->on_wakeup) {
    self->on_wakeup();
  }
}

PipelineFactory make_mpv_pipeline_factory(const std::string &audio_output) {
  return [audio_output](const std::string &path) {
    return std::make_unique<MpvPipeline>(path, audio_output);
  };
}

} // namespace calmroom
