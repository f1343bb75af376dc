#include "ActionCommands.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>

#include <spdlog/spdlog.h>

#include "KeyInput.hpp"

namespace {
std::string lowerCopy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool anyContains(const std::vector<std::string>& lines, std::initializer_list<const char*> needles) {
  for (const auto& line : lines) {
    const std::string lowered = lowerCopy(line);
    for (const char* needle : needles) {
      if (lowered.find(needle) != std::string::npos) {
        return true;
      }
    }
  }
  return false;
}

bool validSlot(const std::string& slot) {
  return slot.size() == 1 && letterToSlot(slot[0]).has_value();
}

// A guard refused the command before anything was sent.
bool rejected(const std::vector<std::string>& result) {
  return result.size() == 1 && (result.front().rfind("[ERROR", 0) == 0 || result.front() == "Not in game");
}

std::string invalidSlot(const std::string& slot) {
  return "Invalid inventory slot '" + slot + "'. Use a letter a-z or A-Z.";
}
}  // namespace

ActionCommands::ActionCommands(ActionDispatcher& dispatcher) : dispatcher_(dispatcher) {}

ActionCommands::Result ActionCommands::move(const std::string& direction) {
  const auto key = directionKey(direction);
  if (!key) {
    return {"Invalid direction: " + direction + ". Use n/s/e/w/ne/nw/se/sw"};
  }
  const int turnBefore = dispatcher_.mirror().player().turn;
  Result result = dispatcher_.dispatch({*key});
  if (rejected(result) || dispatcher_.mirror().player().dead) {
    return result;
  }
  if (dispatcher_.mirror().player().turn != turnBefore) {
    failedMoves_ = 0;
    return result;
  }

  ++failedMoves_;
  const std::string n = std::to_string(failedMoves_);
  if (failedMoves_ >= 5) {
    result.push_back("[You've failed to move " + n +
                     " times in a row. Something is clearly wrong with your approach. Stop and reconsider: what "
                     "other tools do you have for navigation?]");
  } else if (failedMoves_ >= 3) {
    result.push_back("[" + n + " consecutive failed moves. There's a wall or obstacle to the " + direction +
                     ". Think about what other navigation tools are available.]");
  } else {
    result.push_back("[Nothing happened — there's a wall or obstacle to the " + direction + ".]");
  }
  return result;
}

ActionCommands::Result ActionCommands::attack(const std::string& direction) {
  return move(direction);
}

ActionCommands::Result ActionCommands::autoExplore() {
  const int turnBefore = dispatcher_.mirror().player().turn;
  Result result = dispatcher_.dispatch({"o"});
  if (rejected(result) || dispatcher_.mirror().player().turn != turnBefore) {
    return result;
  }
  if (!dispatcher_.mirror().nearbyEnemies().empty() || anyContains(result, {"is nearby", "comes into view"})) {
    result.emplace_back(kExploreInterruptedHint);
  } else {
    result.emplace_back(kFloorExploredHint);
  }
  return result;
}

ActionCommands::Result ActionCommands::autoFight() {
  if (dispatcher_.mirror().nearbyEnemies().empty()) {
    return {"No enemies in sight. Use auto_explore() to keep moving."};
  }
  return dispatcher_.dispatch({kKeyTab});
}

ActionCommands::Result ActionCommands::rest() {
  const auto enemies = dispatcher_.mirror().nearbyEnemies();
  if (!enemies.empty()) {
    std::string names;
    for (std::size_t i = 0; i < enemies.size() && i < 3; ++i) {
      names += (i > 0 ? ", " : "") + enemies[i].name;
    }
    return {"Can't rest — enemies in sight: " + names + ". Kill or flee first."};
  }
  return dispatcher_.dispatch({"5"});
}

ActionCommands::Result ActionCommands::waitTurn() {
  return dispatcher_.dispatch({"."});
}

ActionCommands::Result ActionCommands::upstairs() {
  return stairs("<", false);
}

ActionCommands::Result ActionCommands::downstairs() {
  return stairs(">", true);
}

ActionCommands::Result ActionCommands::stairs(const std::string& key, bool down) {
  const PlayerState& player = dispatcher_.mirror().player();
  const int depthBefore = player.depth;
  const std::string placeBefore = player.place;
  Result result = dispatcher_.dispatch({key});
  if (rejected(result)) {
    return result;
  }

  const bool sameLevel = player.place == placeBefore && (down ? player.depth <= depthBefore
                                                              : player.depth >= depthBefore);
  if (!sameLevel || !dispatcher_.session().inGame()) {
    return result;
  }
  // Not on the stairs: let interlevel travel walk there.
  spdlog::debug("'{}' did not change level, trying interlevel travel", key);
  if (auto travelled = dispatcher_.interlevelTravel(key)) {
    return *travelled;
  }
  result.emplace_back("[Not on stairs. Use get_landmarks() to find stairs, then move() toward them step by step.]");
  return result;
}

ActionCommands::Result ActionCommands::pickUp() {
  Result result = dispatcher_.dispatch({","});
  if (dispatcher_.ui().hasMenu()) {
    result.emplace_back(
        "[A pickup menu opened — use read_ui() to see items, select_menu_item() to pick specific items, or "
        "dismiss() to cancel]");
  }
  return result;
}

ActionCommands::Result ActionCommands::itemCommand(const char* command, const std::string& slot) {
  if (!validSlot(slot)) {
    return {invalidSlot(slot)};
  }
  return dispatcher_.dispatch({command, slot});
}

ActionCommands::Result ActionCommands::wield(const std::string& slot) {
  return itemCommand("w", slot);
}

ActionCommands::Result ActionCommands::wear(const std::string& slot) {
  return itemCommand("W", slot);
}

ActionCommands::Result ActionCommands::quaff(const std::string& slot) {
  return itemCommand("q", slot);
}

ActionCommands::Result ActionCommands::read(const std::string& slot) {
  return itemCommand("r", slot);
}

ActionCommands::Result ActionCommands::drop(const std::string& slot) {
  return itemCommand("d", slot);
}

ActionCommands::Result ActionCommands::zap(const std::string& slot, const std::string& direction) {
  if (!validSlot(slot)) {
    return {invalidSlot(slot)};
  }
  std::vector<std::string> keys{"V", slot};
  if (!direction.empty()) {
    keys.push_back(directionKey(direction).value_or(direction));
  }
  return dispatcher_.dispatch(keys);
}

ActionCommands::Result ActionCommands::evoke(const std::string& slot) {
  return itemCommand("v", slot);
}

ActionCommands::Result ActionCommands::throwItem(const std::string& slot, const std::string& direction) {
  if (!validSlot(slot)) {
    return {invalidSlot(slot)};
  }
  return dispatcher_.dispatch({"F", slot, directionKey(direction).value_or(direction)});
}

ActionCommands::Result ActionCommands::putOn(const std::string& slot) {
  return itemCommand("P", slot);
}

ActionCommands::Result ActionCommands::remove(const std::string& slot) {
  if (slot.empty()) {
    return dispatcher_.dispatch({"R"});
  }
  return itemCommand("R", slot);
}

ActionCommands::Result ActionCommands::takeOff(const std::string& slot) {
  return itemCommand("T", slot);
}

ActionCommands::Result ActionCommands::examine(const std::string& slot) const {
  for (const auto& item : dispatcher_.mirror().inventory()) {
    if (slot.size() == 1 && item.letter == slot[0]) {
      std::ostringstream out;
      out << slot << " - " << item.name << " (qty: " << item.quantity << ")";
      return {out.str()};
    }
  }
  return {"No item in slot '" + slot + "'."};
}

ActionCommands::Result ActionCommands::ability(const std::string& key) {
  return dispatcher_.dispatch({"a", key});
}

ActionCommands::Result ActionCommands::cast(const std::string& key, const std::string& direction) {
  if (!dispatcher_.session().inGame()) {
    return {"Not in game"};
  }
  StateMirror& mirror = dispatcher_.mirror();
  const auto firstSequence = mirror.messageSequence();

  // Open the spell menu and pick the spell; targeting spells then wait for a
  // direction or "." to fire at the nearest target.
  dispatcher_.sendKey("z");
  dispatcher_.sendKey(key);
  dispatcher_.pace();
  bool targeting = false;
  for (const auto& msg : dispatcher_.drain(dispatcher_.config().pollSlice)) {
    if (const auto* input = std::get_if<InputModeMsg>(&msg)) {
      targeting = targeting || input->mode == static_cast<int>(InputMode::TargetPath) ||
                  input->mode == static_cast<int>(InputMode::Prompt);
    }
  }

  if (!targeting) {
    dispatcher_.drain(dispatcher_.config().settleDrain * 3);
    return mirror.messagesSince(firstSequence);
  }

  const std::string target = direction.empty() ? "." : directionKey(direction).value_or(direction);
  Result result = dispatcher_.dispatch({target}, std::nullopt, true);
  if (anyContains(result, {"can't see", "can't reach"})) {
    dispatcher_.sendKey(kKeyEscape);
    dispatcher_.pace();
    dispatcher_.drain(dispatcher_.config().settleDrain * 3);
    result.emplace_back(
        "[Spell targeting cancelled — target not visible. Try without direction to auto-target nearest enemy.]");
  }
  return result;
}

ActionCommands::Result ActionCommands::pray() {
  const std::string god = lowerCopy(dispatcher_.mirror().player().god);
  if (god.empty() || god == "none" || god == "no god") {
    return {"You don't worship a god. Find an altar and use it to join a religion."};
  }
  return dispatcher_.dispatch({"p"});
}

ActionCommands::Result ActionCommands::confirm() {
  return dispatcher_.dispatch({"Y"}, std::nullopt, true);
}

ActionCommands::Result ActionCommands::deny() {
  return dispatcher_.dispatch({"N"}, std::nullopt, true);
}

ActionCommands::Result ActionCommands::respond(const std::string& action) {
  return dispatcher_.respond(action);
}

ActionCommands::Result ActionCommands::escape() {
  return dispatcher_.escape();
}

ActionCommands::Result ActionCommands::chooseStat(const std::string& stat) {
  return dispatcher_.chooseStat(stat);
}

ActionCommands::Result ActionCommands::sendKeys(const std::string& keys) {
  std::vector<std::string> split;
  std::istringstream tokens(keys);
  for (std::string token; tokens >> token;) {
    if (token.rfind("key_", 0) == 0) {
      split.push_back(token);
      continue;
    }
    for (const char ch : token) {
      split.emplace_back(1, ch);
    }
  }
  if (split.empty()) {
    return {"No keys given."};
  }
  return dispatcher_.dispatch(split);
}
