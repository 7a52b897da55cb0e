#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace calmroom {

struct PipelineEvent {
  enum class Type { EndOfStream, Error };

  Type type;
  std::string message;
};

// One live decoding/output session for a single file
class PlaybackPipeline {
public:
  virtual ~PlaybackPipeline() = default;

  virtual void set_playing(bool playing) = 0;
  // 0.0 - 1.0
  virtual void set_volume(double volume) = 0;
  virtual void seek_to_start() = 0;

  // Drains events queued since the last call. Must run on the host loop.
  virtual std::vector<PipelineEvent> poll_events() = 0;

  // Called from an arbitrary thread when poll_events() has work
  virtual void set_wakeup_callback(std::function<void()> callback) = 0;
};

// Throws std::runtime_error when the pipeline cannot be built
using PipelineFactory =
    std::function<std::unique_ptr<PlaybackPipeline>(const std::string &path)>;

} // namespace calmroom
