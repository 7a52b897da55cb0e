#include "track_catalog.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace calmroom {

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool is_regular(const fs::path &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::vector<fs::path> list_audio_files(const fs::path &dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return files;
  }

  fs::directory_iterator it(dir, ec);
  if (ec) {
    return files;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    const fs::path &path = it->path();
    if (is_audio_file(path) && is_regular(path)) {
      files.push_back(path);
    }
  }

  std::sort(files.begin(), files.end(), [](const fs::path &a, const fs::path &b) {
    return a.filename().string() < b.filename().string();
  });
  return files;
}

} // namespace

bool is_audio_file(const fs::path &path) {
  const std::string extension = to_lower(path.extension().string());
  return std::find(kAudioExtensions.begin(), kAudioExtensions.end(),
                   extension) != kAudioExtensions.end();
}

std::string title_from_filename(const fs::path &path) {
  std::string title = path.stem().string();
  std::replace(title.begin(), title.end(), '_', ' ');

  // Upper-case the first letter of each word, lower-case the rest.
  // Bytes of multi-byte UTF-8 sequences count as letters and stay untouched.
  bool in_word = false;
  for (char &ch : title) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (c >= 0x80) {
      in_word = true;
    } else if (std::isalpha(c)) {
      ch = static_cast<char>(in_word ? std::tolower(c) : std::toupper(c));
      in_word = true;
    } else {
      in_word = false;
    }
  }
  return title;
}

std::string resolve_track_path(const fs::path &path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (ec) {
    resolved = fs::absolute(path, ec);
    if (ec) {
      resolved = path;
    }
    resolved = resolved.lexically_normal();
  }
  return resolved.string();
}

std::vector<Track> discover_tracks(const std::vector<fs::path> &music_dirs) {
  std::vector<Track> tracks;
  std::unordered_set<std::string> seen;

  for (const auto &bundled : kBundledTracks) {
    for (const auto &dir : music_dirs) {
      fs::path candidate = dir / bundled.file;
      if (!is_regular(candidate)) {
        continue;
      }
      std::string resolved = resolve_track_path(candidate);
      if (seen.insert(resolved).second) {
        tracks.push_back({bundled.id, resolved, bundled.title, bundled.composer});
      }
      break;
    }
  }

  // User-added files
  for (const auto &dir : music_dirs) {
    for (const auto &file : list_audio_files(dir)) {
      std::string resolved = resolve_track_path(file);
      if (!seen.insert(resolved).second) {
        continue;
      }
      tracks.push_back(
          {file.filename().string(), resolved, title_from_filename(file), ""});
    }
  }

  return tracks;
}

} // namespace calmroom
