#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "ActionCommands.hpp"

struct AutoPlayOptions {
  int hpStopPercent = 50;
  int maxActions = 100;
  bool stopOnItemPickup = false;
  bool stopOnAltar = false;
  bool autoDescend = false;
  int enemyCountThreshold = 1;

  // Copy with every field pulled into its safe range.
  AutoPlayOptions clamped() const;
};

struct FloorLog {
  std::string place;
  int depth = 0;
  std::vector<std::string> events;
};

struct AutoPlayReport {
  std::string stopReason;
  int actions = 0;
  std::vector<std::string> killed;
  std::vector<std::string> pickedUp;
  std::vector<FloorLog> floors;

  int kills() const { return static_cast<int>(killed.size()); }
  int pickups() const { return static_cast<int>(pickedUp.size()); }
  std::string summary() const;
};

// Explore/fight/rest/descend loop for routine floor clearing. Stops as soon
// as anything needs a real decision.
class TacticalAutoPlay {
 public:
  static constexpr int kMinHpStopPercent = 20;
  static constexpr int kMaxActions = 500;
  static constexpr int kStallLimit = 5;
  static constexpr int kProlongedFight = 15;

  TacticalAutoPlay(ActionCommands& commands, ActionDispatcher& dispatcher);

  // cancel, when given, is checked between actions.
  AutoPlayReport run(const AutoPlayOptions& options, const std::atomic<bool>* cancel = nullptr);

 private:
  struct ScanResult {
    bool altar = false;
    bool pickup = false;
    bool floorExplored = false;
  };

  ScanResult scan(const std::vector<std::string>& lines, AutoPlayReport& report);
  std::optional<std::string> checkStop(const AutoPlayOptions& options, int startXl) const;
  void enterFloor(AutoPlayReport& report) const;

  ActionCommands& commands_;
  ActionDispatcher& dispatcher_;
};
