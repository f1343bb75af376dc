#include "StateMirror.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <set>
#include <sstream>
#include <utility>

namespace {
template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

template <typename T>
struct FieldCopy {
  std::optional<T> PlayerDiff::*from;
  T PlayerState::*to;
};

const std::array<FieldCopy<int>, 30> kIntFields{{
    {&PlayerDiff::hp, &PlayerState::hp},
    {&PlayerDiff::hpMax, &PlayerState::maxHp},
    {&PlayerDiff::mp, &PlayerState::mp},
    {&PlayerDiff::mpMax, &PlayerState::maxMp},
    {&PlayerDiff::ac, &PlayerState::ac},
    {&PlayerDiff::ev, &PlayerState::ev},
    {&PlayerDiff::sh, &PlayerState::sh},
    {&PlayerDiff::acMod, &PlayerState::acMod},
    {&PlayerDiff::evMod, &PlayerState::evMod},
    {&PlayerDiff::shMod, &PlayerState::shMod},
    {&PlayerDiff::str, &PlayerState::str},
    {&PlayerDiff::intel, &PlayerState::intel},
    {&PlayerDiff::dex, &PlayerState::dex},
    {&PlayerDiff::xl, &PlayerState::xl},
    {&PlayerDiff::progress, &PlayerState::xlProgress},
    {&PlayerDiff::depth, &PlayerState::depth},
    {&PlayerDiff::gold, &PlayerState::gold},
    {&PlayerDiff::turn, &PlayerState::turn},
    {&PlayerDiff::time, &PlayerState::elapsedTime},
    {&PlayerDiff::pietyRank, &PlayerState::pietyRank},
    {&PlayerDiff::contam, &PlayerState::contam},
    {&PlayerDiff::noise, &PlayerState::noise},
    {&PlayerDiff::form, &PlayerState::form},
    {&PlayerDiff::poisonSurvival, &PlayerState::poisonSurvival},
    {&PlayerDiff::realHpMax, &PlayerState::realHpMax},
    {&PlayerDiff::weaponIndex, &PlayerState::weaponIndex},
    {&PlayerDiff::offhandIndex, &PlayerState::offhandIndex},
    {&PlayerDiff::doom, &PlayerState::doom},
    {&PlayerDiff::lives, &PlayerState::lives},
    {&PlayerDiff::deaths, &PlayerState::serverDeaths},
}};

const std::array<FieldCopy<std::string>, 5> kStringFields{{
    {&PlayerDiff::place, &PlayerState::place},
    {&PlayerDiff::god, &PlayerState::god},
    {&PlayerDiff::species, &PlayerState::species},
    {&PlayerDiff::title, &PlayerState::title},
    {&PlayerDiff::quiverDesc, &PlayerState::quiverDesc},
}};

const std::array<FieldCopy<bool>, 1> kBoolFields{{
    {&PlayerDiff::penance, &PlayerState::penance},
}};

const std::array<const char*, 19> kFormNames{{
    "", "Spider", "Blade Hands", "Statue", "Serpent", "Dragon", "Death", "Bat", "Pig", "Tree",
    "Wisp", "Jelly", "Fungus", "Storm", "Quill", "Maw", "Flux", "Slaughter", "Vampire",
}};

const std::set<std::string> kIgnoredMonsters{
    "plant", "withered plant", "fungus", "toadstool", "bush",
    "ballistomycete spore", "briar patch", "pillar of salt", "block of ice", "spectral weapon",
};

const std::set<std::string> kKnownDangerous{
    "sigmund", "jessica", "edmund", "eustachio", "natasha", "robin, the goblin", "ijyb", "terence",
    "ogre", "centaur", "gnoll sergeant", "orc priest", "orc wizard",
};

struct Landmark {
  const char* type;
  int order;
};

std::optional<Landmark> landmarkFor(const std::string& glyph) {
  if (glyph == ">") return Landmark{"downstairs", 0};
  if (glyph == "<") return Landmark{"upstairs", 1};
  if (glyph == "_") return Landmark{"altar", 2};
  if (glyph == "+") return Landmark{"door", 3};
  return std::nullopt;
}

std::string terrainName(const std::string& glyph) {
  if (glyph == "#") return "wall";
  if (glyph == ".") return "floor";
  if (glyph == "+") return "door";
  if (glyph == "'") return "open door";
  if (glyph == ">") return "downstairs";
  if (glyph == "<") return "upstairs";
  if (glyph == "~") return "water";
  if (glyph == "≈") return "deep water";
  return "unknown";
}

std::string adjacentName(const std::string& glyph) {
  if (glyph == "#") return "wall";
  if (glyph == "+") return "door";
  if (glyph == ">") return "down";
  if (glyph == "<") return "up";
  if (glyph == ".") return "floor";
  if (glyph == " ") return "unseen";
  return "";
}

std::string toLowerCopy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

int chebyshev(int dx, int dy) {
  return std::max(std::abs(dx), std::abs(dy));
}

std::string statWithMod(const char* name, int base, int mod) {
  std::ostringstream out;
  out << name << ": " << base;
  if (mod > 0) {
    out << " (+" << mod << ")";
  } else if (mod < 0) {
    out << " (" << mod << ")";
  }
  return out.str();
}

std::string joined(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}
}  // namespace

std::string directionLabel(int dx, int dy) {
  std::string dir;
  if (dy < 0) {
    dir += "N";
  } else if (dy > 0) {
    dir += "S";
  }
  if (dx > 0) {
    dir += "E";
  } else if (dx < 0) {
    dir += "W";
  }
  return dir.empty() ? "here" : dir;
}

const char* threatLabel(int threat) {
  switch (threat) {
    case 0:
      return "trivial";
    case 1:
      return "easy";
    case 2:
      return "dangerous";
    case 3:
      return "extremely dangerous";
    default:
      return "unknown";
  }
}

void StateMirror::apply(const ServerMessage& msg) {
  std::visit(Overloaded{
                 [this](const PlayerMsg& m) { applyPlayer(m.diff); },
                 [this](const MapMsg& m) { applyMap(m); },
                 [this](const MessagesMsg& m) { applyMessages(m); },
                 [](const auto&) {},
             },
             msg);
}

void StateMirror::applyPlayer(const PlayerDiff& diff) {
  for (const auto& field : kIntFields) {
    if (const auto& value = diff.*field.from) {
      player_.*field.to = *value;
    }
  }
  for (const auto& field : kStringFields) {
    if (const auto& value = diff.*field.from) {
      player_.*field.to = *value;
    }
  }
  for (const auto& field : kBoolFields) {
    if (const auto& value = diff.*field.from) {
      player_.*field.to = *value;
    }
  }
  if (diff.pos) {
    player_.pos = *diff.pos;
  }
  if (diff.status) {
    player_.status = *diff.status;
  }

  for (const auto& [slot, entry] : diff.inventory) {
    if (!entry) {
      inventory_.erase(slot);
      continue;
    }
    auto [it, inserted] = inventory_.try_emplace(slot);
    InventoryItem& item = it->second;
    if (inserted) {
      item.slot = slot;
    }
    if (entry->name) item.name = *entry->name;
    if (entry->quantity) item.quantity = *entry->quantity;
    if (entry->useless) item.useless = *entry->useless;
    if (entry->inscription) item.inscription = *entry->inscription;
  }
}

void StateMirror::applyMap(const MapMsg& map) {
  // Resolve the implicit cursor once so both passes see the same coordinates.
  std::vector<std::pair<Position, const CellDiff*>> resolved;
  resolved.reserve(map.cells.size());
  std::optional<int> curX;
  std::optional<int> curY;
  for (const auto& cell : map.cells) {
    if (cell.x) curX = cell.x;
    if (cell.y) curY = cell.y;
    if (!curX || !curY) {
      continue;
    }
    resolved.emplace_back(Position{*curX, *curY}, &cell);
    *curX += 1;
  }

  // Re-sent monsters only carry changed fields; the rest comes from the
  // previous record, found by id or by the cell it stood on.
  std::unordered_map<int, Monster> previousById;
  std::map<Position, Monster> previousAt;
  for (const auto& [pos, mon] : monsters_) {
    if (mon.id) {
      previousById[*mon.id] = mon;
    }
  }

  // The batch is authoritative for monsters at every coordinate it mentions.
  for (const auto& entry : resolved) {
    auto it = monsters_.find(entry.first);
    if (it != monsters_.end()) {
      previousAt.insert(*it);
      monsters_.erase(it);
    }
  }

  for (const auto& [pos, cell] : resolved) {
    MapCell& target = cells_[pos];
    if (cell->glyph) target.glyph = *cell->glyph;
    if (cell->feature) target.feature = *cell->feature;
    if (cell->fg) target.fg = *cell->fg;
    target.overlays = cell->overlays;
    target.orbGlow = cell->orbGlow;

    if (cell->monsterField != CellDiff::MonsterField::Present) {
      continue;
    }
    const MonsterDiff& diff = cell->monster;
    Monster mon;
    if (diff.id) {
      if (auto prev = previousById.find(*diff.id); prev != previousById.end()) {
        mon = prev->second;
      }
    } else if (auto prev = previousAt.find(pos); prev != previousAt.end()) {
      mon = prev->second;
    }
    if (diff.id) {
      mon.id = diff.id;
    }
    if (diff.name) {
      mon.name = *diff.name;
      if (diff.id) {
        monsterNames_[*diff.id] = *diff.name;
      }
    } else if (mon.name.empty() && diff.id) {
      if (auto named = monsterNames_.find(*diff.id); named != monsterNames_.end()) {
        mon.name = named->second;
      }
    }
    if (diff.threat) {
      mon.threat = *diff.threat;
    }
    monsters_[pos] = std::move(mon);
  }
}

void StateMirror::applyMessages(const MessagesMsg& msgs) {
  for (const auto& raw : msgs.texts) {
    std::string clean = stripFormatting(raw);
    if (clean.empty()) {
      continue;
    }
    messages_.push_back({nextSequence_++, std::move(clean)});
  }
  if (messages_.size() > kMessageCap) {
    messages_.erase(messages_.begin(), messages_.end() - static_cast<std::ptrdiff_t>(kMessageKeep));
  }
}

void StateMirror::reset() {
  player_ = PlayerState{};
  inventory_.clear();
  cells_.clear();
  monsters_.clear();
  monsterNames_.clear();
  messages_.clear();
}

const MapCell* StateMirror::cellAt(const Position& pos) const {
  auto it = cells_.find(pos);
  return it == cells_.end() ? nullptr : &it->second;
}

const Monster* StateMirror::monsterAt(const Position& pos) const {
  auto it = monsters_.find(pos);
  return it == monsters_.end() ? nullptr : &it->second;
}

std::vector<std::string> StateMirror::messagesSince(std::uint64_t sequence) const {
  std::vector<std::string> out;
  for (const auto& msg : messages_) {
    if (msg.sequence >= sequence) {
      out.push_back(msg.text);
    }
  }
  return out;
}

std::vector<std::string> StateMirror::recentMessages(std::size_t n) const {
  std::vector<std::string> out;
  const std::size_t start = messages_.size() > n ? messages_.size() - n : 0;
  for (std::size_t i = start; i < messages_.size(); ++i) {
    out.push_back(messages_[i].text);
  }
  return out;
}

std::vector<InventoryEntry> StateMirror::inventory() const {
  std::vector<InventoryEntry> out;
  for (const auto& [slot, item] : inventory_) {
    if (item.name.empty() || item.name == "?") {
      continue;
    }
    InventoryEntry entry;
    entry.letter = slotToLetter(slot);
    entry.name = item.name;
    entry.quantity = item.quantity;
    entry.useless = item.useless;
    entry.inscription = item.inscription;
    if (slot == player_.weaponIndex) {
      entry.equipped = "weapon";
    } else if (slot == player_.offhandIndex) {
      entry.equipped = "offhand";
    }
    out.push_back(std::move(entry));
  }
  return out;
}

std::string StateMirror::monsterStatus(const Position& pos) const {
  const MapCell* cell = cellAt(pos);
  const std::uint64_t fg = cell ? cell->fg : 0;
  std::vector<std::string> parts;

  switch (fg & kBehaviorMask) {
    case kBehaviorSleeping:
      parts.emplace_back("sleeping");
      break;
    case kBehaviorUnaware:
      parts.emplace_back("unaware");
      break;
    case kBehaviorFleeing:
      parts.emplace_back("fleeing");
      break;
    case kBehaviorParalysed:
      parts.emplace_back("paralysed");
      break;
    default:
      break;
  }
  switch (fg & kWoundMask) {
    case kWoundLight:
      parts.emplace_back("lightly wounded");
      break;
    case kWoundModerate:
      parts.emplace_back("moderately wounded");
      break;
    case kWoundHeavy:
      parts.emplace_back("heavily wounded");
      break;
    case kWoundSevere:
      parts.emplace_back("severely wounded");
      break;
    case kWoundAlmostDead:
      parts.emplace_back("almost dead");
      break;
    default:
      break;
  }
  return joined(parts, ", ");
}

std::vector<EnemyInfo> StateMirror::nearbyEnemies() const {
  std::vector<EnemyInfo> enemies;
  for (const auto& [pos, mon] : monsters_) {
    const int dx = pos.x - player_.pos.x;
    const int dy = pos.y - player_.pos.y;
    const int dist = chebyshev(dx, dy);
    if (dist > kEnemyRadius) {
      continue;
    }
    const std::string name = mon.name.empty() ? "unknown" : mon.name;
    const std::string lowered = toLowerCopy(name);
    if (kIgnoredMonsters.count(lowered) > 0) {
      continue;
    }

    EnemyInfo info;
    info.name = name;
    info.offset = {dx, dy};
    info.direction = toLowerCopy(directionLabel(dx, dy));
    info.distance = dist;
    info.threat = mon.threat;
    if (kKnownDangerous.count(lowered) > 0 && info.threat < 2) {
      info.threat = 2;
    }
    info.threatLabel = threatLabel(info.threat);
    info.status = monsterStatus(pos);
    enemies.push_back(std::move(info));
  }
  std::stable_sort(enemies.begin(), enemies.end(),
                   [](const EnemyInfo& a, const EnemyInfo& b) { return a.distance < b.distance; });
  return enemies;
}

std::uint16_t StateMirror::overlaysAt(const Position& pos) const {
  const MapCell* cell = cellAt(pos);
  return cell ? cell->overlays : 0;
}

std::string StateMirror::statsLine() const {
  const PlayerState& p = player_;
  std::string character = "Unknown";
  if (!p.species.empty()) {
    character = p.title.empty() ? p.species : p.species + " " + p.title;
  }
  if (p.form > 0 && p.form < static_cast<int>(kFormNames.size())) {
    character += std::string(" (") + kFormNames[p.form] + " Form)";
  }

  std::ostringstream out;
  out << "Character: " << character << " | HP: " << p.hp << "/" << p.maxHp;
  if (p.poisonSurvival > 0 && p.poisonSurvival < p.hp) {
    out << " (→" << p.poisonSurvival << " after poison)";
  }
  out << " | MP: " << p.mp << "/" << p.maxMp << " | " << statWithMod("AC", p.ac, p.acMod) << " "
      << statWithMod("EV", p.ev, p.evMod) << " " << statWithMod("SH", p.sh, p.shMod) << " | Str: " << p.str
      << " Int: " << p.intel << " Dex: " << p.dex << " | XL: " << p.xl << " (" << p.xlProgress
      << "%) | Gold: " << p.gold << " | Place: " << p.place << ":" << p.depth << " | God: ";

  if (p.god.empty()) {
    out << "None";
  } else {
    out << p.god;
    if (p.pietyRank > 0) {
      out << " [";
      for (int i = 0; i < 6; ++i) {
        out << (i < p.pietyRank ? "★" : "☆");
      }
      out << "]";
    }
    if (p.penance) {
      out << " (PENANCE!)";
    }
  }

  if (p.contam > 0) {
    static const std::array<const char*, 5> kContam{{"", "glow", "glow+", "GLOW!", "GLOW!!"}};
    out << " | Contam: " << kContam[std::min(p.contam, 4)];
  }
  if (p.noise >= 0) {
    out << " | Noise: " << p.noise;
  }
  if (p.doom != 0) {
    out << " | Doom: " << p.doom;
  }
  if (p.lives != 0) {
    out << " | Lives: " << p.lives;
  }

  std::vector<std::string> lights;
  for (const auto& s : p.status) {
    const std::string& label = s.light.empty() ? s.text : s.light;
    if (!label.empty()) {
      lights.push_back(label);
    }
  }
  if (!lights.empty()) {
    out << " | Status: " << joined(lights, ", ");
  }
  out << " | Turn: " << p.turn;
  return out.str();
}

std::string StateMirror::mapText(int radius) const {
  if (cells_.empty()) {
    return "No map data available";
  }
  const Position& p = player_.pos;
  std::vector<std::string> lines;
  for (int y = p.y - radius; y <= p.y + radius; ++y) {
    std::string line;
    for (int x = p.x - radius; x <= p.x + radius; ++x) {
      if (x == p.x && y == p.y) {
        line += "@";
        continue;
      }
      const MapCell* cell = cellAt({x, y});
      line += cell && !cell->glyph.empty() ? cell->glyph : " ";
    }
    lines.push_back(std::move(line));
  }
  return joined(lines, "\n");
}

std::string StateMirror::landmarksText() const {
  struct Found {
    Landmark landmark;
    std::string glyph;
    int dx;
    int dy;
    int distance;
  };
  std::vector<Found> found;
  for (const auto& [pos, cell] : cells_) {
    if (auto landmark = landmarkFor(cell.glyph)) {
      const int dx = pos.x - player_.pos.x;
      const int dy = pos.y - player_.pos.y;
      found.push_back({*landmark, cell.glyph, dx, dy, chebyshev(dx, dy)});
    }
  }
  if (found.empty()) {
    return "No landmarks discovered yet.";
  }
  std::stable_sort(found.begin(), found.end(), [](const Found& a, const Found& b) {
    if (a.landmark.order != b.landmark.order) {
      return a.landmark.order < b.landmark.order;
    }
    return a.distance < b.distance;
  });

  std::vector<Found> shown;
  for (const auto& f : found) {
    if (f.landmark.order != 3) {
      shown.push_back(f);
    }
  }
  if (shown.empty()) {
    shown.assign(found.begin(), found.begin() + std::min<std::size_t>(found.size(), 10));
  }

  std::vector<std::string> lines;
  for (const auto& f : shown) {
    std::ostringstream line;
    line << f.landmark.type << " (" << f.glyph << ") — " << directionLabel(f.dx, f.dy) << ", " << f.distance
         << " tiles away (dx=" << f.dx << ", dy=" << f.dy << ")";
    lines.push_back(line.str());
  }
  return joined(lines, "\n");
}

std::string StateMirror::tacticalText() const {
  if (cells_.empty()) {
    return "No map data available";
  }
  const Position& p = player_.pos;
  std::vector<std::string> parts;

  const MapCell* here = cellAt(p);
  std::ostringstream position;
  position << "Position: " << (player_.place.empty() ? "Unknown" : player_.place) << ":";
  if (player_.depth != 0) {
    position << player_.depth;
  } else {
    position << "?";
  }
  position << " (" << terrainName(here ? here->glyph : ".") << ")";
  parts.push_back(position.str());

  std::vector<std::string> adjacent;
  for (int dy = -1; dy <= 1; ++dy) {
    for (int dx = -1; dx <= 1; ++dx) {
      if (dx == 0 && dy == 0) {
        continue;
      }
      const MapCell* cell = cellAt({p.x + dx, p.y + dy});
      const std::string name = adjacentName(cell ? cell->glyph : " ");
      if (!name.empty()) {
        adjacent.push_back(directionLabel(dx, dy) + ":" + name);
      }
    }
  }
  parts.push_back("Adjacent: " + joined(adjacent, ", "));

  std::optional<std::pair<std::string, int>> upstairs;
  for (const auto& [pos, cell] : cells_) {
    if (cell.glyph != "<") {
      continue;
    }
    const int dx = pos.x - p.x;
    const int dy = pos.y - p.y;
    const int dist = chebyshev(dx, dy);
    if (!upstairs || dist < upstairs->second) {
      upstairs = std::make_pair(directionLabel(dx, dy), dist);
    }
  }
  if (upstairs) {
    parts.push_back("Nearest upstairs: " + upstairs->first + ", " + std::to_string(upstairs->second) + " tiles");
  } else {
    parts.emplace_back("Nearest upstairs: none visible");
  }
  return joined(parts, " | ");
}

std::string StateMirror::inventoryText() const {
  const auto items = inventory();
  if (items.empty()) {
    return "Inventory is empty.";
  }
  std::vector<std::string> lines;
  for (const auto& item : items) {
    std::string line = std::string(1, item.letter) + ") " + item.name;
    if (item.quantity > 1) {
      line += " (x" + std::to_string(item.quantity) + ")";
    }
    if (item.equipped == "weapon") {
      line += " (wielded)";
    } else if (item.equipped == "offhand") {
      line += " (offhand)";
    }
    if (item.useless) {
      line += " [useless]";
    }
    if (!item.inscription.empty()) {
      line += " {" + item.inscription + "}";
    }
    lines.push_back(std::move(line));
  }
  return joined(lines, "\n");
}

std::string StateMirror::enemiesText() const {
  const auto enemies = nearbyEnemies();
  if (enemies.empty()) {
    return "No enemies in sight.";
  }
  std::vector<std::string> lines;
  for (const auto& e : enemies) {
    std::ostringstream line;
    line << e.name << " (" << e.direction << ", dist " << e.distance << ", threat " << e.threatLabel;
    if (!e.status.empty()) {
      line << ", " << e.status;
    }
    line << ")";
    lines.push_back(line.str());
  }
  return joined(lines, "\n");
}

std::string StateMirror::messagesText(std::size_t n) const {
  const auto recent = recentMessages(n);
  if (recent.empty()) {
    return "No messages.";
  }
  return joined(recent, "\n");
}

std::string StateMirror::stateText() const {
  std::vector<std::string> parts{"=== DCSS State ===", statsLine(), "", "--- Messages ---"};
  for (const auto& msg : recentMessages(5)) {
    parts.push_back("  " + msg);
  }

  const auto items = inventory();
  if (!items.empty()) {
    parts.emplace_back("");
    parts.emplace_back("--- Inventory ---");
    std::istringstream lines(inventoryText());
    for (std::string line; std::getline(lines, line);) {
      parts.push_back("  " + line);
    }
  }

  if (!nearbyEnemies().empty()) {
    parts.emplace_back("");
    parts.emplace_back("--- Enemies ---");
    std::istringstream lines(enemiesText());
    for (std::string line; std::getline(lines, line);) {
      parts.push_back("  " + line);
    }
  }

  const MapCell* here = cellAt(player_.pos);
  if (here && here->overlays != 0) {
    std::vector<std::string> effects;
    if (here->overlays & kOverlaySilenced) effects.emplace_back("SILENCED (no spells!)");
    if (here->overlays & kOverlaySanctuary) effects.emplace_back("Sanctuary (no combat)");
    if (here->overlays & kOverlayHalo) effects.emplace_back("Halo");
    if (here->overlays & kOverlayLiquefied) effects.emplace_back("Liquefied ground");
    if (here->overlays & kOverlayOrbGlow) effects.push_back("Orb glow (" + std::to_string(here->orbGlow) + ")");
    if (here->overlays & kOverlayDisjunct) effects.emplace_back("Disjunction");
    if (!effects.empty()) {
      parts.emplace_back("");
      parts.push_back("--- Environment: " + joined(effects, ", ") + " ---");
    }
  }

  parts.emplace_back("");
  parts.emplace_back("--- Tactical ---");
  parts.push_back(tacticalText());
  if (player_.dead) {
    parts.emplace_back("\n*** GAME OVER — YOU ARE DEAD ***");
  }
  return joined(parts, "\n");
}
