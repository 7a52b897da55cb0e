#pragma once

#include "audio/pipeline.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace calmroom {
namespace testing {

class FakePipeline;

// Shared view of every pipeline the factory built
struct PipelineProbe {
  int alive = 0;
  int created = 0;
  std::vector<std::string> paths;
  FakePipeline *current = nullptr;
  bool fail_next = false;
};

class FakePipeline : public PlaybackPipeline {
public:
  FakePipeline(PipelineProbe &probe, std::string path)
      : probe(probe), path(std::move(path)) {
    ++probe.alive;
    ++probe.created;
    probe.paths.push_back(this->path);
    probe.current = this;
  }

  ~FakePipeline() override {
    --probe.alive;
    if (probe.current == this) {
      probe.current = nullptr;
    }
  }

  void set_playing(bool value) override { playing = value; }
  void set_volume(double value) override { volume = value; }
  // Mirrors mpv keep-open: the stream sits paused at its end
  void seek_to_start() override {
    ++seeks;
    playing = false;
  }

  std::vector<PipelineEvent> poll_events() override {
    std::vector<PipelineEvent> events;
    events.swap(pending);
    return events;
  }

  void set_wakeup_callback(std::function<void()> callback) override {
    wakeup = std::move(callback);
  }

  void emit(PipelineEvent event) {
    pending.push_back(std::move(event));
    if (wakeup) {
      wakeup();
    }
  }

  PipelineProbe &probe;
  std::string path;
  bool playing = false;
  double volume = -1.0;
  int seeks = 0;
  std::vector<PipelineEvent> pending;
  std::function<void()> wakeup;
};

inline PipelineFactory make_fake_factory(PipelineProbe &probe) {
  return [&probe](const std::string &path) -> std::unique_ptr<PlaybackPipeline> {
    if (probe.fail_next) {
      probe.fail_next = false;
      throw std::runtime_error("no audio device");
    }
    return std::make_unique<FakePipeline>(probe, path);
  };
}

} // namespace testing
} // namespace calmroom
