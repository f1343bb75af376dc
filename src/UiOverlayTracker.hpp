#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Protocol.hpp"

// Cache of the server-pushed menu and popup. Never talks to the server; the
// dispatcher decides what to send.
class UiOverlayTracker {
 public:
  // Updates the caches for menu and ui-* messages; returns true when the
  // message opened or updated a menu or popup.
  bool apply(const ServerMessage& msg);

  bool hasMenu() const { return menu_.has_value(); }
  bool hasPopup() const { return popup_.has_value(); }
  bool anyOpen() const { return hasMenu() || hasPopup(); }

  std::string menuTitle() const;
  std::string popupType() const;
  const std::vector<nlohmann::json>& menuItems() const { return menuItems_; }

  void clearMenu();
  void clearPopup() { popup_.reset(); }
  void clear();

  std::string menuText() const;
  std::string popupText() const;
  std::string text() const;

 private:
  void onMenu(const MenuMsg& msg);
  void onUi(const UiMsg& msg);

  std::optional<nlohmann::json> menu_;
  std::vector<nlohmann::json> menuItems_;
  std::optional<nlohmann::json> popup_;
};
