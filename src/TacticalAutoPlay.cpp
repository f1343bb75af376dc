#include "TacticalAutoPlay.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {
const std::regex kKillPattern("You (?:kill|slay|destroy) (.+?)!");
const std::regex kPickupPattern("^([a-zA-Z]) - (.+)$");

constexpr std::array<const char*, 10> kBadStatus{{
    "pois", "conf", "para", "slow", "petr", "mesm", "held", "sick", "fear", "weak",
}};

std::string lowerCopy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string joinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    out += (out.empty() ? "" : ", ") + name;
  }
  return out;
}
}  // namespace

AutoPlayOptions AutoPlayOptions::clamped() const {
  AutoPlayOptions out = *this;
  out.hpStopPercent = std::clamp(hpStopPercent, TacticalAutoPlay::kMinHpStopPercent, 100);
  out.maxActions = std::clamp(maxActions, 1, TacticalAutoPlay::kMaxActions);
  out.enemyCountThreshold = std::max(enemyCountThreshold, 1);
  return out;
}

std::string AutoPlayReport::summary() const {
  std::ostringstream out;
  out << "Auto-play stopped: " << stopReason << " after " << actions << " actions.";
  out << "\nKills: " << kills();
  if (!killed.empty()) {
    out << " (" << joinNames(killed) << ")";
  }
  out << "\nPickups: " << pickups();
  if (!pickedUp.empty()) {
    out << " (" << joinNames(pickedUp) << ")";
  }
  for (const auto& floor : floors) {
    out << "\n[" << (floor.place.empty() ? "?" : floor.place) << ":" << floor.depth << "]";
    if (floor.events.empty()) {
      out << " nothing notable";
    }
    for (const auto& event : floor.events) {
      out << "\n  - " << event;
    }
  }
  return out.str();
}

TacticalAutoPlay::TacticalAutoPlay(ActionCommands& commands, ActionDispatcher& dispatcher)
    : commands_(commands), dispatcher_(dispatcher) {}

void TacticalAutoPlay::enterFloor(AutoPlayReport& report) const {
  const PlayerState& player = dispatcher_.mirror().player();
  report.floors.push_back({player.place, player.depth, {}});
}

TacticalAutoPlay::ScanResult TacticalAutoPlay::scan(const std::vector<std::string>& lines,
                                                    AutoPlayReport& report) {
  ScanResult result;
  for (const auto& line : lines) {
    if (line.rfind(kFloorExploredHint, 0) == 0) {
      result.floorExplored = true;
      continue;
    }
    if (line.empty() || line.front() == '[') {
      continue;
    }
    std::smatch match;
    if (std::regex_search(line, match, kKillPattern)) {
      report.killed.push_back(match[1].str());
      report.floors.back().events.push_back("Killed " + match[1].str());
    } else if (std::regex_match(line, match, kPickupPattern)) {
      report.pickedUp.push_back(match[2].str());
      report.floors.back().events.push_back("Picked up " + match[2].str() + " (" + match[1].str() + ")");
      result.pickup = true;
    }
    if (lowerCopy(line).find("altar") != std::string::npos) {
      report.floors.back().events.push_back("Altar: " + line);
      result.altar = true;
    }
    if (line.find("Done exploring") != std::string::npos) {
      result.floorExplored = true;
    }
  }
  return result;
}

std::optional<std::string> TacticalAutoPlay::checkStop(const AutoPlayOptions& options, int startXl) const {
  const StateMirror& mirror = dispatcher_.mirror();
  const PlayerState& player = mirror.player();
  const UiOverlayTracker& ui = dispatcher_.ui();

  if (player.dead) {
    return std::string("character died");
  }
  if (!dispatcher_.session().inGame()) {
    return std::string("not in game");
  }
  if (dispatcher_.statPromptPending()) {
    return std::string("stat increase prompt pending");
  }
  if (ui.hasMenu()) {
    return "menu open: " + ui.menuTitle();
  }
  if (ui.hasPopup()) {
    return "popup open: " + ui.popupType();
  }

  const auto enemies = mirror.nearbyEnemies();
  for (const auto& enemy : enemies) {
    if (enemy.threat >= kThreatDangerous) {
      return "dangerous enemy spotted: " + enemy.name;
    }
  }
  if (player.maxHp > 0 && player.hp * 100 < options.hpStopPercent * player.maxHp) {
    return "hp below " + std::to_string(options.hpStopPercent) + "% (" + std::to_string(player.hp) + "/" +
           std::to_string(player.maxHp) + ")";
  }
  for (const auto& status : player.status) {
    const std::string label = lowerCopy(status.light.empty() ? status.text : status.light);
    for (const char* bad : kBadStatus) {
      if (label.find(bad) != std::string::npos) {
        return "bad status effect: " + (status.light.empty() ? status.text : status.light);
      }
    }
  }
  if (player.xl > startXl) {
    return "experience level gained (XL " + std::to_string(player.xl) + ")";
  }
  const auto nonTrivial = std::count_if(enemies.begin(), enemies.end(),
                                        [](const EnemyInfo& e) { return e.threat > kThreatTrivial; });
  if (nonTrivial >= options.enemyCountThreshold) {
    return std::to_string(nonTrivial) + " non-trivial enemies in sight";
  }
  return std::nullopt;
}

AutoPlayReport TacticalAutoPlay::run(const AutoPlayOptions& requested, const std::atomic<bool>* cancel) {
  const AutoPlayOptions options = requested.clamped();
  const StateMirror& mirror = dispatcher_.mirror();
  const PlayerState& player = mirror.player();

  AutoPlayReport report;
  enterFloor(report);
  const int startXl = player.xl;
  std::optional<int> lastTurn;
  int stalled = 0;
  int fightStreak = 0;
  bool restBlocked = false;

  auto stop = [&report](std::string reason) {
    spdlog::info("Auto-play stopping: {}", reason);
    report.stopReason = std::move(reason);
    return report;
  };

  while (report.actions < options.maxActions) {
    if (cancel && cancel->load()) {
      return stop("cancelled");
    }
    if (lastTurn && *lastTurn == player.turn) {
      if (++stalled >= kStallLimit) {
        return stop("no progress for " + std::to_string(kStallLimit) + " iterations");
      }
    } else {
      stalled = 0;
      lastTurn = player.turn;
    }
    if (auto reason = checkStop(options, startXl)) {
      return stop(*reason);
    }

    if (!mirror.nearbyEnemies().empty()) {
      const int turnBefore = player.turn;
      scan(commands_.autoFight(), report);
      ++report.actions;
      ++fightStreak;
      if (player.turn == turnBefore && report.actions < options.maxActions) {
        // Target unreachable; move on instead of swinging at nothing.
        scan(commands_.autoExplore(), report);
        ++report.actions;
      }
      const auto enemies = mirror.nearbyEnemies();
      const bool packRemains = std::any_of(enemies.begin(), enemies.end(),
                                           [](const EnemyInfo& e) { return e.threat > kThreatTrivial; });
      if (fightStreak > kProlongedFight && packRemains) {
        return stop("prolonged fight (" + std::to_string(fightStreak) + " fight actions)");
      }
      continue;
    }
    fightStreak = 0;

    if (player.hp < player.maxHp && !restBlocked) {
      const int turnBefore = player.turn;
      scan(commands_.rest(), report);
      ++report.actions;
      restBlocked = player.turn == turnBefore;
      continue;
    }

    const int turnBefore = player.turn;
    const ScanResult found = scan(commands_.autoExplore(), report);
    ++report.actions;
    if (player.turn != turnBefore) {
      restBlocked = false;
    }
    if (found.pickup && options.stopOnItemPickup) {
      return stop("picked up " + report.pickedUp.back());
    }
    if (found.altar && options.stopOnAltar) {
      return stop("found an altar");
    }
    if (!found.floorExplored) {
      continue;
    }
    if (!options.autoDescend) {
      return stop("floor fully explored");
    }

    if (player.hp < player.maxHp && report.actions < options.maxActions) {
      scan(commands_.rest(), report);
      ++report.actions;
    }
    if (report.actions >= options.maxActions) {
      break;
    }
    const int depthBefore = player.depth;
    const std::string placeBefore = player.place;
    scan(commands_.downstairs(), report);
    ++report.actions;
    if (player.depth == depthBefore && player.place == placeBefore) {
      return stop("could not reach the downstairs");
    }
    report.floors.back().events.push_back("Descended to " + player.place + ":" + std::to_string(player.depth));
    enterFloor(report);
    restBlocked = false;
  }
  return stop("action limit reached (" + std::to_string(options.maxActions) + ")");
}
