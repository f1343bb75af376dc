#include "ActionDispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

#include <spdlog/spdlog.h>

#include "KeyInput.hpp"

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

namespace {
constexpr const char* kStatMarker = "(S)trength";

std::string joinKeys(const std::vector<std::string>& keys) {
  std::string out;
  for (const auto& key : keys) {
    if (!out.empty()) {
      out += ",";
    }
    out += key;
  }
  return out;
}

bool opensOverlay(const ServerMessage& msg) {
  if (const auto* menu = std::get_if<MenuMsg>(&msg)) {
    return menu->kind == MessageKind::Menu || menu->kind == MessageKind::UpdateMenu ||
           menu->kind == MessageKind::UpdateMenuItems;
  }
  if (const auto* ui = std::get_if<UiMsg>(&msg)) {
    return ui->kind == MessageKind::UiPush || ui->kind == MessageKind::UiState;
  }
  return false;
}
}  // namespace

ActionDispatcher::ActionDispatcher(ProtocolSession& session, StateMirror& mirror, UiOverlayTracker& ui,
                                   DispatcherConfig config)
    : session_(session), mirror_(mirror), ui_(ui), config_(config) {}

std::optional<std::string> ActionDispatcher::guard(bool menuTraffic) {
  if (menuTraffic) {
    return std::nullopt;
  }
  if (config_.narrateInterval > 0 && actionsSinceNarration_ >= config_.narrateInterval) {
    return "[ERROR: You must call narrate() before continuing. You've taken " +
           std::to_string(actionsSinceNarration_) + " actions without narrating for stream viewers.]";
  }
  ++actionsSinceNarration_;

  if (statPromptPending_) {
    return std::string(
        "[ERROR: Stat increase prompt is waiting! Call choose_stat('s'), choose_stat('i'), or choose_stat('d') "
        "to pick Strength, Intelligence, or Dexterity.]");
  }
  if (ui_.hasMenu()) {
    return "[ERROR: " + ui_.menuTitle() +
           " is still open. Use read_ui() to see it, select_menu_item() to interact, or dismiss() to close it "
           "first.]";
  }
  if (ui_.hasPopup()) {
    return std::string("[ERROR: A popup is still open. Use read_ui() to see it or dismiss() to close it first.]");
  }
  return std::nullopt;
}

std::vector<std::string> ActionDispatcher::dispatch(const std::vector<std::string>& keys,
                                                    std::optional<milliseconds> timeout, bool menuTraffic) {
  Transport& transport = session_.transport();
  if (!session_.inGame()) {
    return {"Not in game"};
  }
  if (auto rejected = guard(menuTraffic)) {
    return {*rejected};
  }

  const auto firstSequence = mirror_.messageSequence();
  drain(config_.strayDrain);
  for (const auto& key : keys) {
    ::sendKey(transport, key);
  }

  const milliseconds budget = timeout.value_or(config_.defaultTimeout);
  const auto deadline = Clock::now() + budget;
  const std::string label = joinKeys(keys);
  bool ready = false;

  while (!ready && !mirror_.player().dead) {
    const auto now = Clock::now();
    if (now >= deadline) {
      break;
    }
    const auto remaining = std::chrono::duration_cast<milliseconds>(deadline - now);
    const auto msgs = transport.recvMessages(std::min(config_.pollSlice, remaining));

    for (const auto& msg : msgs) {
      route(msg);
      if (const auto* input = std::get_if<InputModeMsg>(&msg)) {
        spdlog::debug("input_mode={} (keys={})", input->mode, label);
        switch (static_cast<InputMode>(input->mode)) {
          case InputMode::Command:
          case InputMode::Target:
          case InputMode::TargetDir:
          case InputMode::TargetPath:
            ready = true;
            break;
          case InputMode::More:
            ::sendKey(transport, " ");
            break;
          case InputMode::Prompt:
            if (statPromptInRecentMessages()) {
              statPromptPending_ = true;
              ready = true;
              spdlog::info("Stat increase prompt detected (keys={})", label);
            } else {
              spdlog::info("Text prompt during exchange, escaping (keys={})", label);
              ::sendKey(transport, kKeyEscape);
            }
            break;
          case InputMode::Normal:
            break;
          default:
            spdlog::info("Unrecognized input_mode={}, escaping (keys={})", input->mode, label);
            ::sendKey(transport, kKeyEscape);
            break;
        }
      } else if (opensOverlay(msg)) {
        spdlog::info("{} during exchange (keys={})", messageKindName(messageKind(msg)), label);
        ready = true;
      }
    }
  }

  if (ready) {
    drain(config_.settleDrain);
    consecutiveTimeouts_ = 0;
  } else if (!mirror_.player().dead) {
    ++consecutiveTimeouts_;
    spdlog::warn("Exchange finished without a ready signal (keys={}, timeout={}ms, consecutive={})", label,
                 budget.count(), consecutiveTimeouts_);
    if (consecutiveTimeouts_ >= kRecoveryThreshold) {
      recover();
    }
  }

  std::vector<std::string> result = mirror_.messagesSince(firstSequence);
  const bool unknown = std::any_of(result.begin(), result.end(), [](const std::string& m) {
    return m.find("Unknown command") != std::string::npos;
  });
  if (unknown) {
    result.emplace_back(
        "[HINT: 'Unknown command' means a key you sent was invalid in this context. Check if you're sending the "
        "right arguments.]");
  }
  return result;
}

void ActionDispatcher::recover() {
  spdlog::warn("{} consecutive timeouts, sending escapes and a redraw request to resync", consecutiveTimeouts_);
  for (int i = 0; i < 3; ++i) {
    sendKey(kKeyEscape);
    pace();
  }
  sendKey(kKeyRedraw);
  pace(3);

  bool menuPushed = false;
  bool popupPushed = false;
  for (int i = 0; i < kRecoveryDrains; ++i) {
    const auto msgs = session_.recv(config_.recoveryDrain);
    if (msgs.empty()) {
      break;
    }
    for (const auto& msg : msgs) {
      route(msg);
      if (const auto* menu = std::get_if<MenuMsg>(&msg); menu && menu->kind == MessageKind::Menu) {
        menuPushed = true;
      } else if (const auto* ui = std::get_if<UiMsg>(&msg); ui && ui->kind == MessageKind::UiPush) {
        popupPushed = true;
      } else if (const auto* input = std::get_if<InputModeMsg>(&msg);
                 input && input->mode == static_cast<int>(InputMode::Command)) {
        spdlog::info("Recovery: ready signal received, state resynced");
      }
    }
  }

  if (!menuPushed && ui_.hasMenu()) {
    spdlog::info("Recovery: closed phantom menu");
    ui_.clearMenu();
  }
  if (!popupPushed && ui_.hasPopup()) {
    spdlog::info("Recovery: dismissed phantom popup");
    ui_.clearPopup();
  }
  consecutiveTimeouts_ = 0;
  ++recoveries_;
}

bool ActionDispatcher::statPromptInRecentMessages() const {
  for (const auto& msg : mirror_.recentMessages(5)) {
    if (msg.find(kStatMarker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::vector<ServerMessage> ActionDispatcher::drain(milliseconds timeout) {
  auto msgs = session_.recv(timeout);
  for (const auto& msg : msgs) {
    route(msg);
  }
  return msgs;
}

void ActionDispatcher::route(const ServerMessage& msg) {
  mirror_.apply(msg);
  ui_.apply(msg);
  if (std::holds_alternative<CloseMsg>(msg)) {
    spdlog::info("Game closed by server, character died");
    mirror_.markDead();
    session_.setInGame(false);
    ++session_.record().deaths;
  }
}

void ActionDispatcher::sendKey(const std::string& key) {
  session_.sendKey(key);
}

void ActionDispatcher::pace(int steps) const {
  if (config_.keyPacing.count() > 0) {
    std::this_thread::sleep_for(config_.keyPacing * steps);
  }
}

std::string ActionDispatcher::selectMenuItem(const std::string& key) {
  if (!ui_.hasMenu()) {
    return "No menu is currently open.";
  }
  sendKey(key);
  pace(3);
  bool closed = false;
  for (const auto& msg : drain(config_.menuWait)) {
    if (const auto* menu = std::get_if<MenuMsg>(&msg); menu && menu->kind == MessageKind::CloseMenu) {
      closed = true;
    }
  }
  if (closed) {
    return "Menu closed after pressing '" + key + "'.";
  }
  if (ui_.hasMenu()) {
    return "Pressed '" + key + "'. Menu still open. Use read_ui() to see updated state.";
  }
  return "Pressed '" + key + "'.";
}

std::string ActionDispatcher::dismiss() {
  if (ui_.hasMenu()) {
    sendKey(kKeyEscape);
    pace(3);
    drain(config_.menuWait);
    ui_.clearMenu();
    return "Menu closed.";
  }
  if (ui_.hasPopup()) {
    sendKey(kKeyEscape);
    pace(3);
    drain(config_.menuWait);
    ui_.clearPopup();
    return "Popup dismissed.";
  }
  sendKey(kKeyEscape);
  return "Escape pressed.";
}

std::vector<std::string> ActionDispatcher::chooseStat(const std::string& stat) {
  const char choice = stat.size() == 1 ? static_cast<char>(std::toupper(static_cast<unsigned char>(stat[0]))) : '\0';
  if (choice != 'S' && choice != 'I' && choice != 'D') {
    return {"[ERROR: Invalid stat. Use 'S' (Strength), 'I' (Intelligence), or 'D' (Dexterity).]"};
  }
  if (!statPromptPending_) {
    return {"[No stat increase prompt pending.]"};
  }
  statPromptPending_ = false;
  return dispatch({std::string(1, choice)}, std::nullopt, true);
}

std::vector<std::string> ActionDispatcher::escape() {
  // Also the way out of a stat prompt that was latched by mistake.
  statPromptPending_ = false;
  return dispatch({kKeyEscape}, std::nullopt, true);
}

std::vector<std::string> ActionDispatcher::respond(const std::string& action) {
  std::string lowered = action;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  std::string key = kKeyEscape;
  if (lowered == "yes") {
    key = "Y";
  } else if (lowered == "no") {
    key = "N";
  }
  return dispatch({key}, std::nullopt, true);
}

std::optional<std::vector<std::string>> ActionDispatcher::interlevelTravel(const std::string& destination) {
  sendKey("G");
  pace(3);
  bool gotPrompt = false;
  for (const auto& msg : drain(config_.menuWait)) {
    if (const auto* input = std::get_if<InputModeMsg>(&msg)) {
      gotPrompt = gotPrompt || input->mode == static_cast<int>(InputMode::Prompt) ||
                  input->mode == static_cast<int>(InputMode::Normal);
    } else if (const auto* menu = std::get_if<MenuMsg>(&msg); menu && menu->kind == MessageKind::Menu) {
      gotPrompt = true;
    }
  }

  if (!gotPrompt) {
    spdlog::debug("No travel prompt after G, escaping");
    sendKey(kKeyEscape);
    pace();
    drain(config_.menuWait / 5);
    return std::nullopt;
  }
  return dispatch({destination, kKeyEnter}, config_.travelTimeout, true);
}

void ActionDispatcher::reset() {
  consecutiveTimeouts_ = 0;
  statPromptPending_ = false;
  actionsSinceNarration_ = 0;
}
