#include "UiOverlayTracker.hpp"

#include <cstdint>
#include <sstream>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
// Menu and popup text fields are either a plain string or {"text": ...}.
std::string textOf(const json& value, const std::string& fallback = "") {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_object()) {
    if (auto text = getStringField(value, {"text"})) {
      return *text;
    }
  }
  return fallback;
}

std::string fieldText(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

bool present(const json& obj, const char* key) {
  if (!obj.contains(key)) {
    return false;
  }
  const json& value = obj[key];
  if (value.is_null()) return false;
  if (value.is_string()) return !value.get_ref<const std::string&>().empty();
  if (value.is_array() || value.is_object()) return !value.empty();
  if (value.is_boolean()) return value.get<bool>();
  if (value.is_number()) return value.get<double>() != 0.0;
  return true;
}

void mergeFields(json& target, const json& update) {
  for (auto it = update.begin(); it != update.end(); ++it) {
    if (it.key() != "msg") {
      target[it.key()] = it.value();
    }
  }
}

std::vector<json> itemsOf(const json& payload) {
  std::vector<json> items;
  if (payload.contains("items") && payload["items"].is_array()) {
    for (const auto& item : payload["items"]) {
      items.push_back(item);
    }
  }
  return items;
}
}  // namespace

bool UiOverlayTracker::apply(const ServerMessage& msg) {
  if (const auto* menu = std::get_if<MenuMsg>(&msg)) {
    onMenu(*menu);
    return menu->kind == MessageKind::Menu || menu->kind == MessageKind::UpdateMenu ||
           menu->kind == MessageKind::UpdateMenuItems;
  }
  if (const auto* ui = std::get_if<UiMsg>(&msg)) {
    onUi(*ui);
    return ui->kind != MessageKind::UiPop;
  }
  return false;
}

void UiOverlayTracker::onMenu(const MenuMsg& msg) {
  const json& payload = msg.payload;
  switch (msg.kind) {
    case MessageKind::Menu:
      menu_ = payload;
      menuItems_ = itemsOf(payload);
      break;
    case MessageKind::UpdateMenu:
      if (menu_) {
        mergeFields(*menu_, payload);
        if (payload.contains("items")) {
          menuItems_ = itemsOf(payload);
        }
      }
      break;
    case MessageKind::UpdateMenuItems: {
      const int chunkStart = getIntField(payload, {"chunk_start"}).value_or(0);
      if (chunkStart < 0) {
        spdlog::warn("Ignoring menu items with negative chunk_start {}", chunkStart);
        break;
      }
      const auto items = itemsOf(payload);
      for (std::size_t i = 0; i < items.size(); ++i) {
        const std::size_t idx = static_cast<std::size_t>(chunkStart) + i;
        if (idx < menuItems_.size()) {
          menuItems_[idx] = items[i];
        } else {
          menuItems_.push_back(items[i]);
        }
      }
      break;
    }
    case MessageKind::CloseMenu:
    case MessageKind::CloseAllMenus:
      clearMenu();
      break;
    default:
      break;
  }
}

void UiOverlayTracker::onUi(const UiMsg& msg) {
  switch (msg.kind) {
    case MessageKind::UiPush:
      popup_ = msg.payload;
      break;
    case MessageKind::UiState:
      if (popup_) {
        mergeFields(*popup_, msg.payload);
      }
      break;
    case MessageKind::UiPop:
      popup_.reset();
      break;
    default:
      break;
  }
}

std::string UiOverlayTracker::menuTitle() const {
  if (!menu_ || !menu_->contains("title")) {
    return "a menu";
  }
  return stripFormatting(textOf((*menu_)["title"], "a menu"));
}

std::string UiOverlayTracker::popupType() const {
  if (!popup_) {
    return "";
  }
  return getStringField(*popup_, {"type"}).value_or("unknown");
}

void UiOverlayTracker::clearMenu() {
  menu_.reset();
  menuItems_.clear();
}

void UiOverlayTracker::clear() {
  clearMenu();
  clearPopup();
}

std::string UiOverlayTracker::menuText() const {
  if (!menu_) {
    return "No menu is currently open.";
  }
  const json& m = *menu_;
  std::ostringstream out;
  const std::string tag = getStringField(m, {"tag"}).value_or("unknown");
  const std::string title = m.contains("title") ? textOf(m["title"], "Menu") : "Menu";
  out << "=== " << stripFormatting(title) << " (type: " << tag << ") ===";

  if (m.contains("more")) {
    const std::string more = stripFormatting(textOf(m["more"]));
    if (!more.empty()) {
      out << "\n" << more;
    }
  }

  for (const auto& item : menuItems_) {
    if (!item.is_object()) {
      continue;
    }
    const std::string text = stripFormatting(getStringField(item, {"text"}).value_or(""));
    if (text.empty()) {
      continue;
    }
    const int level = getIntField(item, {"level"}).value_or(2);
    const json hotkeys = item.contains("hotkeys") ? item["hotkeys"] : json::array();
    if (level < 2) {
      out << "\n\n  " << text;
    } else if (hotkeys.is_array() && !hotkeys.empty()) {
      const json& first = hotkeys[0];
      std::string key;
      if (first.is_number_integer()) {
        const auto code = first.get<std::int64_t>();
        if (code > 0 && code <= 255) {
          key = std::string(1, static_cast<char>(code));
        }
      } else if (first.is_string()) {
        key = first.get<std::string>();
      }
      if (key.empty()) {
        out << "\n      " << text;
      } else {
        out << "\n  [" << key << "] " << text;
      }
    } else {
      out << "\n      " << text;
    }
  }
  return out.str();
}

std::string UiOverlayTracker::popupText() const {
  if (!popup_) {
    return "No popup is currently open.";
  }
  const json& p = *popup_;
  std::vector<std::string> lines{"=== Popup: " + popupType() + " ==="};

  if (present(p, "title")) {
    lines.push_back(stripFormatting(textOf(p["title"])));
  }
  if (present(p, "body")) {
    lines.push_back(stripFormatting(textOf(p["body"], p["body"].dump())));
  }
  for (const char* field : {"prompt", "description", "quote", "spells_description", "stats"}) {
    if (present(p, field)) {
      lines.push_back(stripFormatting(fieldText(p[field])));
    }
  }

  if (lines.size() == 1) {
    std::string keys;
    for (auto it = p.begin(); it != p.end(); ++it) {
      if (it.key() == "msg" || it.key() == "type" || it.key() == "generation_id") {
        continue;
      }
      if (!keys.empty()) {
        keys += ", ";
      }
      keys += it.key();
    }
    lines.push_back("Data keys: " + keys);
  }

  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out += "\n";
    }
    out += lines[i];
  }
  return out;
}

std::string UiOverlayTracker::text() const {
  if (menu_) {
    return menuText();
  }
  if (popup_) {
    return popupText();
  }
  return "No menu or popup is currently open.";
}
