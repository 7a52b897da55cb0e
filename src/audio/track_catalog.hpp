#pragma once

#include "../common/Track.h"
#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace calmroom {

struct BundledTrack {
  const char *id;
  const char *file;
  const char *title;
  const char *composer;
};

// Tracks shipped with the application, in display order
inline constexpr std::array<BundledTrack, 4> kBundledTracks = {{
    {"satie_gymnopedie1", "satie_gymnopedie1.mp3", "Gymnopédie No. 1",
     "Erik Satie"},
    {"debussy_clair_de_lune", "debussy_clair_de_lune.mp3", "Clair de Lune",
     "Claude Debussy"},
    {"bach_air", "bach_air.mp3", "Air on the G String", "J.S. Bach"},
    {"beethoven_moonlight", "beethoven_moonlight.mp3", "Moonlight Sonata",
     "Ludwig van Beethoven"},
}};

inline constexpr std::array<const char *, 5> kAudioExtensions = {
    ".mp3", ".ogg", ".opus", ".wav", ".flac"};

bool is_audio_file(const std::filesystem::path &path);

// "calm_rain_sounds.ogg" -> "Calm Rain Sounds"
std::string title_from_filename(const std::filesystem::path &path);

// Canonical form used to compare track paths; falls back to the lexically
// normalized absolute path when the file cannot be resolved
std::string resolve_track_path(const std::filesystem::path &path);

// Bundled catalog first, then other audio files per directory in name order.
// Unreadable or missing directories contribute nothing.
std::vector<Track>
discover_tracks(const std::vector<std::filesystem::path> &music_dirs);

} // namespace calmroom
