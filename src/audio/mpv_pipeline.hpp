#pragma once

#include "pipeline.hpp"
#include <functional>
#include <memory>
#include <mpv/client.h>
#include <mutex>
#include <string>
#include <vector>

namespace calmroom {

class MpvPipeline : public PlaybackPipeline {
public:
  MpvPipeline(const std::string &path, const std::string &audio_output);
  ~MpvPipeline() override;

  MpvPipeline(const MpvPipeline &) = delete;
  MpvPipeline &operator=(const MpvPipeline &) = delete;

  void set_playing(bool playing) override;
  void set_volume(double volume) override;
  void seek_to_start() override;
  std::vector<PipelineEvent> poll_events() override;
  void set_wakeup_callback(std::function<void()> callback) override;

private:
  static void on_mpv_wakeup(void *ctx);

  // Smart pointer with custom deleter for mpv handle
  std::unique_ptr<mpv_handle, decltype(&mpv_terminate_destroy)> mpv{
      nullptr, mpv_terminate_destroy};

  std::mutex wakeup_mutex;
  std::function<void()> on_wakeup;
};

PipelineFactory make_mpv_pipeline_factory(const std::string &audio_output);

} // namespace calmroom
