#pragma once

#include <array>
#include <string>

namespace calmroom {

struct Strategy {
  const char *icon;
  const char *name;
  const char *description;
};

inline constexpr std::array<Strategy, 8> kStrategies = {{
    {"🫁", "Deep breathing", "Slow, deep breaths to calm your nervous system"},
    {"🧊", "Hold ice", "Hold an ice cube. The cold sensation helps ground you"},
    {"5️⃣", "5-4-3-2-1 grounding",
     "5 things you see, 4 you hear, 3 you touch, 2 you smell, 1 you taste"},
    {"🎧", "Listen to music", "Put on calming music or white noise"},
    {"🤗", "Pressure",
     "Hug yourself tight, use a weighted blanket, or squeeze a stress ball"},
    {"🚶", "Walk away",
     "Leave the situation. Go somewhere quiet for a few minutes"},
    {"💧", "Cold water", "Splash cold water on your face or wrists"},
    {"🧶", "Fidget", "Use a fidget toy, rubber band, or squeeze something"},
}};

// Self-reported stress, 1 (calm) to 10 (overload)
inline constexpr int kMinStress = 1;
inline constexpr int kMaxStress = 10;
inline constexpr int kDefaultStress = 3;

std::string stress_emoji(int level);
std::string stress_suggestion(int level);
std::string stress_mark(int level);

struct EmergencyMessage {
  std::string heading;
  std::string body;
  std::string spoken;
};

EmergencyMessage emergency_message(const std::string &favorite_strategy);

} // namespace calmroom
