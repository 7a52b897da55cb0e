#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace calmroom {

// Fixed-cadence timer thread. on_tick runs on the worker thread, so callers
// use it only to post work onto their own loop.
class Ticker {
private:
  std::chrono::milliseconds interval;
  std::unique_ptr<std::thread> worker;
  std::mutex mutex;
  std::condition_variable wake;
  bool stop_requested = false;

public:
  explicit Ticker(std::chrono::milliseconds interval) : interval(interval) {}

  ~Ticker() { stop(); }

  Ticker(const Ticker &) = delete;
  Ticker &operator=(const Ticker &) = delete;

  // No-op while already running
  void start(std::function<void()> on_tick) {
    if (worker) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex);
      stop_requested = false;
    }
    worker = std::make_unique<std::thread>([this, on_tick = std::move(on_tick)] {
      std::unique_lock<std::mutex> lock(mutex);
      while (!wake.wait_for(lock, interval, [this] { return stop_requested; })) {
        lock.unlock();
        on_tick();
        lock.lock();
      }
    });
  }

  // Must not be called from on_tick
  void stop() {
    if (!worker) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex);
      stop_requested = true;
    }
    wake.notify_all();
    if (worker->joinable()) {
      worker->join();
    }
    worker.reset();
  }

  bool running() const { return worker != nullptr; }
};

} // namespace calmroom
