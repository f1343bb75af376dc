#include "KeyInput.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace {
struct NamedKey {
  const char* name;
  const char* text;
  int keycode;
};

// Directions go through the numpad digits so they work in every input mode.
constexpr NamedKey kNamedKeys[] = {
    {"key_tab", nullptr, 9},
    {"key_esc", nullptr, 27},
    {"key_enter", "\r", 0},
    {"key_dir_n", "8", 0},
    {"key_dir_ne", "9", 0},
    {"key_dir_e", "6", 0},
    {"key_dir_se", "3", 0},
    {"key_dir_s", "2", 0},
    {"key_dir_sw", "1", 0},
    {"key_dir_w", "4", 0},
    {"key_dir_nw", "7", 0},
};

constexpr const char* kCtrlPrefix = "key_ctrl_";
}  // namespace

json encodeKey(const std::string& key) {
  for (const auto& named : kNamedKeys) {
    if (key == named.name) {
      if (named.text != nullptr) {
        return json{{"msg", "input"}, {"text", named.text}};
      }
      return json{{"msg", "key"}, {"keycode", named.keycode}};
    }
  }
  const std::size_t prefixLen = std::char_traits<char>::length(kCtrlPrefix);
  if (key.size() == prefixLen + 1 && key.rfind(kCtrlPrefix, 0) == 0) {
    const char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(key.back())));
    if (ch >= 'a' && ch <= 'z') {
      return json{{"msg", "key"}, {"keycode", ch - 'a' + 1}};
    }
  }
  return json{{"msg", "input"}, {"text", key}};
}

std::optional<std::string> directionKey(const std::string& direction) {
  std::string d = direction;
  std::transform(d.begin(), d.end(), d.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  static const char* const kDirections[] = {"n", "ne", "e", "se", "s", "sw", "w", "nw"};
  for (const char* dir : kDirections) {
    if (d == dir) {
      return std::string("key_dir_") + dir;
    }
  }
  return std::nullopt;
}
