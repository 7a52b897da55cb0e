#pragma once

#include <string>

namespace calmroom {
namespace speech {

struct Voice {
    std::string piper_model = "en_US-lessac-medium";
    int piper_sample_rate = 22050;
    std::string espeak_voice = "en";
};

// Piper piped into aplay, espeak-ng as fallback. Every external process is
// bounded by a 10 second timeout. Returns true when one engine spoke.
bool speak_blocking(const std::string& text, const Voice& voice = Voice());

// Runs speak_blocking on a detached thread; failures are ignored
void speak(const std::string& text, const Voice& voice = Voice());

} // namespace speech
} // namespace calmroom
