#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// Logical key names understood by encodeKey(). Anything else is sent as text.
inline constexpr const char* kKeyEscape = "key_esc";
inline constexpr const char* kKeyTab = "key_tab";
inline constexpr const char* kKeyEnter = "key_enter";
inline constexpr const char* kKeyRedraw = "key_ctrl_r";
inline constexpr const char* kKeyQuit = "key_ctrl_q";
inline constexpr const char* kKeySave = "key_ctrl_s";

// Builds the outbound message for one logical key: {"msg":"key","keycode":N}
// for escape, tab and ctrl-letters, {"msg":"input","text":...} otherwise.
nlohmann::json encodeKey(const std::string& key);

// "n", "ne", ... "nw" (any case) to the matching direction key name.
std::optional<std::string> directionKey(const std::string& direction);
