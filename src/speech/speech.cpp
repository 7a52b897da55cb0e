#include "speech.hpp"
#include "../common/paths.hpp"
#include "../common/shell.hpp"
#include <atomic>
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace calmroom {
namespace speech {

namespace {

constexpr int kTimeoutSeconds = 10;

std::string temp_audio_path() {
    static std::atomic<unsigned> counter{0};
    std::string dir = paths::get_cache_dir();
    paths::ensure_directory_exists(dir);
    return fmt::format("{}/speech-{}-{}.raw", dir, static_cast<long>(getpid()),
                       counter.fetch_add(1));
}

bool speak_with_piper(const std::string& text, const Voice& voice) {
    std::string piper = paths::find_executable("piper");
    std::string aplay = paths::find_executable("aplay");
    if (piper.empty() || aplay.empty()) {
        return false;
    }

    std::string raw_path = temp_audio_path();
    std::string synth = fmt::format(
        "printf '%s' {} | timeout {} {} --model {} --output-raw > {} 2>/dev/null",
        shell::quote(text), kTimeoutSeconds, shell::quote(piper),
        shell::quote(voice.piper_model), shell::quote(raw_path));

    bool spoken = false;
    std::error_code ec;
    if (shell::run(synth) && std::filesystem::file_size(raw_path, ec) > 0 && !ec) {
        std::string play = fmt::format(
            "timeout {} {} -r {} -f S16_LE -q {} 2>/dev/null", kTimeoutSeconds,
            shell::quote(aplay), voice.piper_sample_rate, shell::quote(raw_path));
        spoken = shell::run(play);
    }
    std::filesystem::remove(raw_path, ec);
    return spoken;
}

bool speak_with_espeak(const std::string& text, const Voice& voice) {
    std::string espeak = paths::find_executable("espeak-ng");
    if (espeak.empty()) {
        return false;
    }
    return shell::run(fmt::format("timeout {} {} -v {} {} >/dev/null 2>&1",
                                  kTimeoutSeconds, shell::quote(espeak),
                                  shell::quote(voice.espeak_voice),
                                  shell::quote(text)));
}

} // namespace

bool speak_blocking(const std::string& text, const Voice& voice) {
    if (text.empty()) {
        return false;
    }
    if (speak_with_piper(text, voice)) {
        return true;
    }
    return speak_with_espeak(text, voice);
}

void speak(const std::string& text, const Voice& voice) {
    std::thread([text, voice]() {
        try {
            speak_blocking(text, voice);
        } catch (const std::exception&) {
            // No audio is an acceptable outcome
        }
    }).detach();
}

} // namespace speech
} // namespace calmroom
