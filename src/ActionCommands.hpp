#pragma once

#include <string>
#include <vector>

#include "ActionDispatcher.hpp"

inline constexpr const char* kExploreInterruptedHint = "[Explore interrupted by enemy.]";
inline constexpr const char* kFloorExploredHint =
    "[Floor fully explored. Call go_downstairs() to auto-travel to the nearest downstairs and descend.]";

// The game command surface. Each command is a key sequence over
// ActionDispatcher::dispatch plus, where useful, a check of what changed.
class ActionCommands {
 public:
  using Result = std::vector<std::string>;

  explicit ActionCommands(ActionDispatcher& dispatcher);

  Result move(const std::string& direction);
  Result attack(const std::string& direction);
  Result autoExplore();
  Result autoFight();
  Result rest();
  Result waitTurn();
  Result upstairs();
  Result downstairs();
  Result pickUp();

  Result wield(const std::string& slot);
  Result wear(const std::string& slot);
  Result quaff(const std::string& slot);
  Result read(const std::string& slot);
  Result drop(const std::string& slot);
  Result zap(const std::string& slot, const std::string& direction = "");
  Result evoke(const std::string& slot);
  Result throwItem(const std::string& slot, const std::string& direction);
  Result putOn(const std::string& slot);
  Result remove(const std::string& slot = "");
  Result takeOff(const std::string& slot);
  Result examine(const std::string& slot) const;

  Result ability(const std::string& key);
  Result cast(const std::string& key, const std::string& direction = "");
  Result pray();

  Result confirm();
  Result deny();
  Result respond(const std::string& action);
  Result escape();
  Result chooseStat(const std::string& stat);
  // Each character is one key; a "key_..." token is sent as a named key.
  // Whitespace only separates tokens.
  Result sendKeys(const std::string& keys);

  int consecutiveFailedMoves() const { return failedMoves_; }
  void reset() { failedMoves_ = 0; }

 private:
  Result itemCommand(const char* command, const std::string& slot);
  Result stairs(const std::string& key, bool down);

  ActionDispatcher& dispatcher_;
  int failedMoves_ = 0;
};
