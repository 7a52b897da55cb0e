#include "audio/track_catalog.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace calmroom;
using calmroom::testing::TempDir;
using calmroom::testing::write_file;

TEST(TrackCatalogTest, MissingDirectoriesYieldNothing) {
  TempDir dir;
  auto tracks = discover_tracks({dir / "nope", dir / "also-missing"});
  EXPECT_TRUE(tracks.empty());
}

TEST(TrackCatalogTest, BundledTracksComeFirstInCatalogOrder) {
  TempDir dir;
  write_file(dir / "user" / "zeta.mp3");
  write_file(dir / "user" / "beethoven_moonlight.mp3");
  write_file(dir / "system" / "satie_gymnopedie1.mp3");

  auto tracks = discover_tracks({dir / "system", dir / "user"});

  ASSERT_EQ(tracks.size(), 3u);
  EXPECT_EQ(tracks[0].id, "satie_gymnopedie1");
  EXPECT_EQ(tracks[1].id, "beethoven_moonlight");
  EXPECT_EQ(tracks[1].composer, "Ludwig van Beethoven");
  EXPECT_EQ(tracks[2].id, "zeta.mp3");
  EXPECT_EQ(tracks[2].title, "Zeta");
  EXPECT_EQ(tracks[2].composer, "");
}

TEST(TrackCatalogTest, UserFilesFollowDirectoryThenNameOrder) {
  TempDir dir;
  write_file(dir / "a" / "zeta.mp3");
  write_file(dir / "a" / "alpha.wav");
  write_file(dir / "a" / "notes.txt");
  write_file(dir / "b" / "beta.flac");
  write_file(dir / "b" / "Loud.MP3");

  auto tracks = discover_tracks({dir / "a", dir / "b"});

  ASSERT_EQ(tracks.size(), 4u);
  EXPECT_EQ(tracks[0].id, "alpha.wav");
  EXPECT_EQ(tracks[1].id, "zeta.mp3");
  EXPECT_EQ(tracks[2].id, "Loud.MP3");
  EXPECT_EQ(tracks[3].id, "beta.flac");
}

TEST(TrackCatalogTest, FirstDirectoryWinsForBundledTrack) {
  TempDir dir;
  write_file(dir / "system" / "bach_air.mp3");
  write_file(dir / "config" / "bach_air.mp3");

  auto tracks = discover_tracks({dir / "system", dir / "config"});

  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(tracks[0].id, "bach_air");
  EXPECT_EQ(tracks[0].path, resolve_track_path(dir / "system" / "bach_air.mp3"));
  // The second copy is a different file, listed as a user track
  EXPECT_EQ(tracks[1].id, "bach_air.mp3");
  EXPECT_EQ(tracks[1].title, "Bach Air");
}

TEST(TrackCatalogTest, NoDuplicateResolvedPaths) {
  TempDir dir;
  write_file(dir / "music" / "debussy_clair_de_lune.mp3");
  write_file(dir / "music" / "rain.ogg");
  std::filesystem::create_directories(dir / "links");
  std::filesystem::create_symlink(dir / "music" / "rain.ogg",
                                  dir / "links" / "rain_link.ogg");

  auto tracks = discover_tracks(
      {dir / "music", dir / "music", dir / "links" / ".." / "music", dir / "links"});

  std::set<std::string> unique;
  for (const auto &track : tracks) {
    EXPECT_TRUE(unique.insert(track.path).second) << track.path;
  }
  EXPECT_EQ(tracks.size(), 2u);
}

TEST(TrackCatalogTest, AudioExtensionsAreCaseInsensitive) {
  EXPECT_TRUE(is_audio_file("song.mp3"));
  EXPECT_TRUE(is_audio_file("song.OGG"));
  EXPECT_TRUE(is_audio_file("song.Opus"));
  EXPECT_TRUE(is_audio_file("song.wav"));
  EXPECT_TRUE(is_audio_file("song.flac"));
  EXPECT_FALSE(is_audio_file("song.txt"));
  EXPECT_FALSE(is_audio_file("mp3"));
}

TEST(TrackCatalogTest, TitleFromFilename) {
  EXPECT_EQ(title_from_filename("calm_rain_sounds.ogg"), "Calm Rain Sounds");
  EXPECT_EQ(title_from_filename("OCEAN_waves.mp3"), "Ocean Waves");
  EXPECT_EQ(title_from_filename("track2b.mp3"), "Track2B");
  EXPECT_EQ(title_from_filename("forest-walk.wav"), "Forest-Walk");
}

TEST(TrackCatalogTest, DisplayStringIncludesComposer) {
  Track bundled{"bach_air", "/x/bach_air.mp3", "Air on the G String", "J.S. Bach"};
  Track user{"rain.ogg", "/x/rain.ogg", "Rain", ""};
  EXPECT_EQ(bundled.to_string(), "J.S. Bach — Air on the G String");
  EXPECT_EQ(user.to_string(), "Rain");
}
