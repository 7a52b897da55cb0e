#include "audio/music_player.hpp"
#include "audio/mpv_pipeline.hpp"
#include "calm/calm_content.hpp"
#include "common/notification.hpp"
#include "common/paths.hpp"
#include "core/config/settings.hpp"
#include "speech/speech.hpp"
#include "storage/session_export.hpp"
#include "storage/session_log.hpp"
#include "ui/breathing_widget.hpp"
#include <chrono>
#include <clocale>
#include <cmath>
#include <exception>
#include <fmt/format.h>
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace calmroom;

namespace {

std::string breathing_info(const BreathingPattern &pattern) {
  return fmt::format("Breathe in {}s · Hold {}s · Breathe out {}s",
                     pattern.inhale, pattern.hold, pattern.exhale);
}

std::vector<std::string> track_labels(const std::vector<Track> &tracks) {
  std::vector<std::string> labels;
  for (const auto &track : tracks) {
    labels.push_back("🎵 " + track.to_string());
  }
  return labels;
}

} // namespace

int main() {
  using namespace ftxui;

  std::setlocale(LC_ALL, "");
  // libmpv refuses to start with a non-C numeric locale
  std::setlocale(LC_NUMERIC, "C");

  Settings settings;
  SessionLog session_log;
  // A missing or unreadable history starts empty
  [[maybe_unused]] const bool history_loaded = session_log.load();

  MusicPlayer player(paths::get_music_dirs(),
                     make_mpv_pipeline_factory(settings.get_audio_output()));
  player.set_volume(settings.get_music_volume());

  auto screen = ScreenInteractive::Fullscreen();
  BreathingWidget breathing(screen);

  std::string status_text;
  auto report = [&](const std::string &message) {
    status_text = message;
    notifications::send(message);
    screen.PostEvent(Event::Custom);
  };

  auto save_settings = [&] {
    try {
      settings.save();
    } catch (const std::exception &e) {
      status_text = e.what();
      notifications::send_settings_failed(e.what());
    }
  };

  // Tabs
  std::vector<std::string> tab_entries = {"Breathe", "Strategies",
                                          "How do I feel?", "Music",
                                          "Preferences"};
  int selected_tab = 0;
  auto tab_toggle = Toggle(&tab_entries, &selected_tab);

  // How do I feel?
  int stress_level = kDefaultStress;
  std::optional<int> stress_at_start;

  // Breathe
  std::string breathe_button_text = "Start";
  auto start_breathing = [&] {
    if (breathing.running()) {
      return;
    }
    try {
      breathing.start(settings.get_breathing_pattern());
      stress_at_start = stress_level;
      breathe_button_text = "Running…";
    } catch (const std::exception &e) {
      report(e.what());
    }
  };
  auto stop_breathing = [&] {
    if (breathing.running()) {
      auto minutes = std::chrono::duration_cast<std::chrono::duration<double>>(
                         breathing.elapsed())
                         .count() /
                     60.0;
      breathing.stop();
      try {
        session_log.log_session("breathing",
                                static_cast<int>(std::lround(minutes)),
                                stress_at_start, stress_level);
      } catch (const std::exception &e) {
        report(e.what());
      }
    } else {
      breathing.stop();
    }
    stress_at_start.reset();
    breathe_button_text = "Start";
  };

  auto breathe_start_button = Button(
      &breathe_button_text, start_breathing,
      ButtonOption::Animated(Color::Default, Color::GrayDark, Color::Default,
                             Color::White));
  auto breathe_stop_button = Button(
      "Stop", stop_breathing,
      ButtonOption::Animated(Color::Default, Color::RedLight, Color::Default,
                             Color::White));

  auto breathe_page = Renderer(
      Container::Horizontal({breathe_start_button, breathe_stop_button}), [&] {
        return vbox({
            text("Breathing Exercise") | bold | hcenter,
            separator(),
            breathing.Render() | hcenter,
            hbox({breathe_start_button->Render(),
                  breathe_stop_button->Render()}) |
                hcenter,
            text(breathing_info(settings.get_breathing_pattern())) | dim |
                hcenter,
        });
      });

  // Emergency dialog
  bool show_emergency = false;
  EmergencyMessage emergency = emergency_message("");
  auto open_emergency = [&] {
    emergency = emergency_message(settings.get_favorite_strategy());
    if (settings.get_sound_enabled()) {
      speech::speak(emergency.spoken);
    }
    show_emergency = true;
  };
  auto emergency_breathe = Button("Go to breathing", [&] {
    show_emergency = false;
    selected_tab = 0;
    screen.Post(start_breathing);
  });
  auto emergency_ok = Button("OK", [&] { show_emergency = false; });
  auto emergency_dialog = Renderer(
      Container::Horizontal({emergency_breathe, emergency_ok}), [&] {
        return vbox({
                   text(emergency.heading) | bold | hcenter,
                   separator(),
                   paragraph(emergency.body),
                   separator(),
                   hbox({emergency_breathe->Render(), emergency_ok->Render()}) |
                       hcenter,
               }) |
               size(WIDTH, LESS_THAN, 60) | border;
      });

  // Strategies
  std::vector<std::string> strategy_entries;
  auto refresh_strategy_entries = [&] {
    strategy_entries.clear();
    std::string favorite = settings.get_favorite_strategy();
    for (const auto &strategy : kStrategies) {
      std::string label = std::string(strategy.icon) + " " + strategy.name;
      if (favorite == strategy.name) {
        label += "  ★";
      }
      strategy_entries.push_back(label);
    }
  };
  refresh_strategy_entries();
  int selected_strategy = 0;

  auto emergency_button = Button(
      "🆘 I need help NOW", open_emergency,
      ButtonOption::Animated(Color::Default, Color::Red, Color::Default,
                             Color::White));
  auto strategy_menu =
      Menu(&strategy_entries, &selected_strategy) |
      CatchEvent([&](Event event) {
        if (event == Event::Character('f')) {
          std::string name = kStrategies[selected_strategy].name;
          if (settings.get_favorite_strategy() == name) {
            name.clear();
          }
          settings.set_favorite_strategy(name);
          save_settings();
          refresh_strategy_entries();
          return true;
        }
        return false;
      });

  auto strategies_page = Renderer(
      Container::Vertical({emergency_button, strategy_menu}), [&] {
        const auto &strategy = kStrategies[selected_strategy];
        return vbox({
            emergency_button->Render() | hcenter,
            separator(),
            strategy_menu->Render() | frame | flex,
            separator(),
            paragraph(strategy.description) | dim,
            text("f: mark as favorite") | dim,
        });
      });

  // How do I feel?
  auto stress_slider = Slider("", &stress_level, kMinStress, kMaxStress, 1);
  auto feeling_page = Renderer(stress_slider, [&] {
    return vbox({
        text("How stressed are you right now?") | bold | hcenter,
        separator(),
        text(stress_emoji(stress_level)) | hcenter,
        hbox({text(stress_mark(kMinStress) + " "), stress_slider->Render() | flex,
              text(" " + stress_mark(kMaxStress))}),
        text(fmt::format("{} / {}", stress_level, kMaxStress)) | hcenter,
        separator(),
        paragraph(stress_suggestion(stress_level)) | dim,
    });
  });

  // Music
  std::vector<Track> tracks = player.get_available_tracks();
  std::vector<std::string> track_strings = track_labels(tracks);
  std::string now_playing;
  std::string music_button_text = "▶";
  int volume = static_cast<int>(std::lround(player.volume() * 100));
  int applied_volume = volume;

  player.set_state_callback([&] {
    music_button_text = player.is_playing() ? "❚❚" : "▶";
    auto info = player.get_current_track_info();
    now_playing = info ? "♫ " + info->to_string() : "";
    screen.PostEvent(Event::Custom);
  });
  player.set_wakeup_callback([&] {
    screen.Post([&] {
      player.process_events();
      if (!player.get_last_error().empty() && !player.has_pipeline()) {
        status_text = player.get_last_error();
      }
    });
  });

  auto music_toggle = Button(
      &music_button_text,
      [&] {
        player.toggle();
        if (!player.has_pipeline() && tracks.empty()) {
          status_text = "No music files found";
        }
      },
      ButtonOption::Animated(Color::Default, Color::GrayDark, Color::Default,
                             Color::White));
  auto music_next = Button("->", [&] {
    tracks = player.get_available_tracks();
    track_strings = track_labels(tracks);
    if (!player.play_next()) {
      status_text = "No music files found";
    }
  });
  auto volume_slider = Slider("", &volume, 0, 100, 5);

  auto sync_volume = [&] {
    if (volume != applied_volume) {
      applied_volume = volume;
      player.set_volume(volume / 100.0);
      settings.set_music_volume(player.volume());
    }
  };

  auto music_page = Renderer(
      Container::Vertical(
          {Container::Horizontal({music_toggle, music_next}), volume_slider}),
      [&] {
        sync_volume();
        std::vector<Element> track_elements;
        for (const auto &label : track_strings) {
          track_elements.push_back(text(label) | dim);
        }
        Element track_list =
            track_elements.empty()
                ? vbox({text("No music files found."),
                        text(fmt::format("Add .mp3 files to {}/music/",
                                         paths::get_config_dir()))}) |
                      dim
                : vbox(std::move(track_elements));
        return vbox({
            text("Background Music") | bold | hcenter,
            text("Calming classical music for relaxation") | dim | hcenter,
            separator(),
            text(now_playing) | dim | hcenter,
            hbox({music_toggle->Render(), music_next->Render()}) | hcenter,
            hbox({text("♪ ") | color(Color::Blue),
                  volume_slider->Render() | size(WIDTH, EQUAL, 30)}) |
                hcenter,
            separator(),
            track_list | hcenter,
        });
      });

  // Preferences
  BreathingPattern pattern = settings.get_breathing_pattern();
  bool sound_enabled = settings.get_sound_enabled();
  bool notifications_enabled = settings.get_notifications_enabled();
  auto in_slider = Slider("", &pattern.inhale, Settings::kMinBreatheIn,
                          Settings::kMaxBreatheIn, 1);
  auto hold_slider = Slider("", &pattern.hold, Settings::kMinBreatheHold,
                            Settings::kMaxBreatheHold, 1);
  auto out_slider = Slider("", &pattern.exhale, Settings::kMinBreatheOut,
                           Settings::kMaxBreatheOut, 1);
  auto sound_checkbox = Checkbox("Speak in emergencies", &sound_enabled);
  auto notify_checkbox =
      Checkbox("Desktop notifications", &notifications_enabled);
  auto save_button = Button("Save", [&] {
    settings.set_breathing_pattern(pattern);
    settings.set_sound_enabled(sound_enabled);
    settings.set_notifications_enabled(notifications_enabled);
    save_settings();
    pattern = settings.get_breathing_pattern();
    status_text = "Preferences saved";
  });

  auto preferences_page = Renderer(
      Container::Vertical({in_slider, hold_slider, out_slider, sound_checkbox,
                           notify_checkbox, save_button}),
      [&] {
        auto row = [](const std::string &label, Component slider, int value) {
          return hbox({text(label) | size(WIDTH, EQUAL, 24),
                       slider->Render() | size(WIDTH, EQUAL, 30),
                       text(fmt::format(" {:>2}s", value))});
        };
        return vbox({
            text("Breathing Pattern") | bold,
            separator(),
            row("Breathe in (seconds)", in_slider, pattern.inhale),
            row("Hold (seconds)", hold_slider, pattern.hold),
            row("Breathe out (seconds)", out_slider, pattern.exhale),
            separator(),
            sound_checkbox->Render(),
            notify_checkbox->Render(),
            separator(),
            save_button->Render(),
        });
      });

  auto tab_container = Container::Tab(
      {breathe_page, strategies_page, feeling_page, music_page,
       preferences_page},
      &selected_tab);

  auto component = Container::Vertical({tab_toggle, tab_container});

  component = component | CatchEvent([&](Event event) {
                if (event == Event::Character('q')) {
                  screen.Exit();
                  return true;
                }
                if (event == Event::Character('e') ||
                    event == Event::Character('E')) {
                  ExportFormat format = event == Event::Character('e')
                                            ? ExportFormat::Csv
                                            : ExportFormat::Json;
                  try {
                    std::string path = export_sessions(
                        session_log.records(), format, paths::get_export_dir());
                    status_text = "Exported " + path;
                    notifications::send_export_complete(path);
                  } catch (const std::exception &e) {
                    status_text = e.what();
                    notifications::send_export_failed(e.what());
                  }
                  return true;
                }
                if (event == Event::Character(' ') && selected_tab == 3) {
                  player.toggle();
                  return true;
                }
                return false;
              });

  auto renderer = Renderer(component, [&] {
    return vbox({
        hbox({text(" Calming Room ") | bgcolor(Color::Blue) |
                  color(Color::White),
              text(" "), tab_toggle->Render(), filler(),
              text(now_playing) | dim}) |
            bold,
        separator(),
        tab_container->Render() | flex,
        separator(),
        hbox({text(" " + status_text + " ") | dim, filler(),
              text("Space:Music ") | dim, text("e/E:Export ") | dim,
              text("q:Quit ") | dim,
              text(fmt::format(" {} Sessions ", session_log.records().size())) |
                  dim}),
    });
  });

  auto app = renderer | Modal(emergency_dialog, &show_emergency);

  notifications::init(&settings);
  screen.Loop(app);
  notifications::reset();

  stop_breathing();
  player.stop();
  try {
    settings.save();
  } catch (const std::exception &e) {
    std::cerr << "Could not save settings: " << e.what() << std::endl;
  }
  return 0;
}
