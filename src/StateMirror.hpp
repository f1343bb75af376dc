#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Protocol.hpp"

struct PlayerState {
  int hp = 0;
  int maxHp = 0;
  int mp = 0;
  int maxMp = 0;
  int ac = 0;
  int ev = 0;
  int sh = 0;
  int acMod = 0;
  int evMod = 0;
  int shMod = 0;
  int str = 0;
  int intel = 0;
  int dex = 0;
  int xl = 1;
  int xlProgress = 0;
  int depth = 0;
  int gold = 0;
  int turn = 0;
  int elapsedTime = 0;
  int pietyRank = 0;
  int contam = 0;
  int noise = -1;
  int form = 0;
  int poisonSurvival = 0;
  int realHpMax = 0;
  int weaponIndex = -1;
  int offhandIndex = -1;
  int doom = 0;
  int lives = 0;
  int serverDeaths = 0;
  std::string place;
  std::string god;
  std::string species;
  std::string title;
  std::string quiverDesc;
  bool penance = false;
  Position pos;
  std::vector<StatusEffect> status;
  bool dead = false;
};

struct InventoryItem {
  int slot = 0;
  std::string name;
  int quantity = 1;
  bool useless = false;
  std::string inscription;
};

// Inventory entry as presented to callers, with the derived equip tag.
struct InventoryEntry {
  char letter = '?';
  std::string name;
  int quantity = 1;
  std::string equipped;  // "weapon", "offhand" or empty
  bool useless = false;
  std::string inscription;
};

struct MapCell {
  std::string glyph;
  int feature = 0;
  std::uint16_t overlays = 0;
  int orbGlow = 0;
  std::uint64_t fg = 0;
};

struct Monster {
  std::optional<int> id;
  std::string name;
  int threat = 0;
};

// Server monster threat values.
constexpr int kThreatTrivial = 0;
constexpr int kThreatDangerous = 2;

struct EnemyInfo {
  std::string name;
  Position offset;
  std::string direction;
  int distance = 0;
  int threat = 0;
  std::string threatLabel;
  std::string status;
};

// Canonical mirror of the game as seen through player/map/msgs diffs.
// Diffs only ever set what they mention; replaying a diff is a no-op.
class StateMirror {
 public:
  static constexpr std::size_t kMessageCap = 200;
  static constexpr std::size_t kMessageKeep = 100;
  static constexpr int kEnemyRadius = 8;

  // Bit layout of the per-cell foreground flags (server tile-flags.h).
  static constexpr std::uint64_t kBehaviorMask = 0x00700000ull;
  static constexpr std::uint64_t kBehaviorSleeping = 0x00100000ull;
  static constexpr std::uint64_t kBehaviorUnaware = 0x00200000ull;
  static constexpr std::uint64_t kBehaviorFleeing = 0x00300000ull;
  static constexpr std::uint64_t kBehaviorParalysed = 0x00400000ull;
  static constexpr std::uint64_t kWoundMask = 0x1C0000000ull;
  static constexpr std::uint64_t kWoundLight = 0x040000000ull;
  static constexpr std::uint64_t kWoundModerate = 0x080000000ull;
  static constexpr std::uint64_t kWoundHeavy = 0x0C0000000ull;
  static constexpr std::uint64_t kWoundSevere = 0x100000000ull;
  static constexpr std::uint64_t kWoundAlmostDead = 0x1C0000000ull;

  // Routes player, map and msgs diffs; other kinds are ignored.
  void apply(const ServerMessage& msg);

  void applyPlayer(const PlayerDiff& diff);
  void applyMap(const MapMsg& map);
  void applyMessages(const MessagesMsg& msgs);

  // Back to the empty state of a fresh game.
  void reset();
  void markDead() { player_.dead = true; }

  const PlayerState& player() const { return player_; }
  const std::map<int, InventoryItem>& inventoryItems() const { return inventory_; }
  const std::map<Position, MapCell>& cells() const { return cells_; }
  const std::map<Position, Monster>& monsters() const { return monsters_; }
  const MapCell* cellAt(const Position& pos) const;
  const Monster* monsterAt(const Position& pos) const;

  // Sequence number of the next message to arrive.
  std::uint64_t messageSequence() const { return nextSequence_; }
  std::vector<std::string> messagesSince(std::uint64_t sequence) const;
  std::vector<std::string> recentMessages(std::size_t n = 10) const;

  std::vector<InventoryEntry> inventory() const;
  std::vector<EnemyInfo> nearbyEnemies() const;
  std::string monsterStatus(const Position& pos) const;
  std::uint16_t overlaysAt(const Position& pos) const;

  std::string statsLine() const;
  std::string stateText() const;
  std::string mapText(int radius = 7) const;
  std::string landmarksText() const;
  std::string tacticalText() const;
  std::string inventoryText() const;
  std::string enemiesText() const;
  std::string messagesText(std::size_t n = 10) const;

 private:
  struct StoredMessage {
    std::uint64_t sequence;
    std::string text;
  };

  PlayerState player_;
  std::map<int, InventoryItem> inventory_;
  std::map<Position, MapCell> cells_;
  std::map<Position, Monster> monsters_;
  std::unordered_map<int, std::string> monsterNames_;
  std::deque<StoredMessage> messages_;
  std::uint64_t nextSequence_ = 0;
};

std::string directionLabel(int dx, int dy);
const char* threatLabel(int threat);
