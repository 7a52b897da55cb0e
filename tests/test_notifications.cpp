#include "common/notification.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <thread>

using namespace calmroom;
using namespace std::chrono_literals;
using calmroom::testing::TempDir;
using calmroom::testing::read_file;
using calmroom::testing::write_file;

namespace {

class NotificationsTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (const char *old = getenv("PATH")) {
      saved_path = old;
    }
    log_path = dir / "notify.log";
    // Slow notify-send, as when no notification daemon answers
    write_file(dir / "bin" / "notify-send",
               "#!/bin/sh\nsleep 3\necho \"$@\" >> '" + log_path.string() +
                   "'\n");
    chmod((dir / "bin" / "notify-send").c_str(), 0755);
    setenv("PATH", ((dir / "bin").string() + ":/usr/bin:/bin").c_str(), 1);
  }

  void TearDown() override {
    notifications::reset();
    if (saved_path) {
      setenv("PATH", saved_path->c_str(), 1);
    } else {
      unsetenv("PATH");
    }
  }

  bool wait_for_log() const {
    auto deadline = std::chrono::steady_clock::now() + 15s;
    while (std::chrono::steady_clock::now() < deadline) {
      if (std::filesystem::exists(log_path)) {
        return true;
      }
      std::this_thread::sleep_for(50ms);
    }
    return false;
  }

  TempDir dir;
  std::filesystem::path log_path;
  std::optional<std::string> saved_path;
};

} // namespace

TEST_F(NotificationsTest, DesktopSendDoesNotWaitForNotifySend) {
  notifications::init(nullptr);

  auto before = std::chrono::steady_clock::now();
  notifications::send("Music playback error: it's broken");
  EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);

  ASSERT_TRUE(wait_for_log());
  // The writer may still be flushing its single line
  std::this_thread::sleep_for(100ms);
  EXPECT_NE(read_file(log_path).find("Music playback error: it's broken"),
            std::string::npos);
}

TEST_F(NotificationsTest, DisabledSettingSkipsNotifySend) {
  Settings settings((dir / "settings.json").string());
  settings.set_notifications_enabled(false);
  notifications::init(&settings);

  notifications::send("ignored");
  std::this_thread::sleep_for(3500ms);

  EXPECT_FALSE(std::filesystem::exists(log_path));
}

TEST_F(NotificationsTest, BeforeInitMessagesGoToStderr) {
  ::testing::internal::CaptureStderr();
  notifications::send("starting up");
  std::string err = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(err, "[calmroom] starting up\n");
  EXPECT_FALSE(std::filesystem::exists(log_path));
}
