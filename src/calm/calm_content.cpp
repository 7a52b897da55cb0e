#include "calm_content.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace calmroom {

std::string stress_emoji(int level) {
  static const std::array<const char *, 10> emojis = {
      "😊", "🙂", "😐", "😕", "😟", "😰", "😫", "🤯", "😭", "💥"};
  if (level < kMinStress || level > kMaxStress) {
    return "😐";
  }
  return emojis[static_cast<size_t>(level - kMinStress)];
}

std::string stress_suggestion(int level) {
  level = std::clamp(level, kMinStress, kMaxStress);
  if (level <= 3) {
    return "You seem calm. Great! Keep doing what you're doing.";
  }
  if (level <= 5) {
    return "Getting a bit tense. Try a short breathing exercise.";
  }
  if (level <= 7) {
    return "High stress. Take a break now. Try the breathing exercise or one "
           "of the strategies.";
  }
  return "Very high stress. Press the emergency button or go to breathing "
         "immediately. You are safe. 💙";
}

// Scale labels shown under 1, 5 and 10
std::string stress_mark(int level) {
  switch (level) {
  case 1:
    return "Calm";
  case 5:
    return "Medium";
  case 10:
    return "Overload";
  default:
    return "";
  }
}

EmergencyMessage emergency_message(const std::string &favorite_strategy) {
  EmergencyMessage message;
  message.heading = "You are safe 💙";
  if (!favorite_strategy.empty()) {
    message.body = fmt::format("Your favorite strategy: {}", favorite_strategy);
  } else {
    message.body = "Try this: Take 5 deep breaths. Count each one. You are safe.";
  }
  message.spoken = "You are safe. Take a deep breath.";
  return message;
}

} // namespace calmroom
