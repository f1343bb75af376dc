#include "Protocol.hpp"

#include <cmath>
#include <regex>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

struct KindName {
  MessageKind kind;
  const char* name;
};

constexpr KindName kKindNames[] = {
    {MessageKind::Player, "player"},
    {MessageKind::Map, "map"},
    {MessageKind::Messages, "msgs"},
    {MessageKind::InputMode, "input_mode"},
    {MessageKind::Menu, "menu"},
    {MessageKind::UpdateMenu, "update_menu"},
    {MessageKind::UpdateMenuItems, "update_menu_items"},
    {MessageKind::CloseMenu, "close_menu"},
    {MessageKind::CloseAllMenus, "close_all_menus"},
    {MessageKind::UiPush, "ui-push"},
    {MessageKind::UiState, "ui-state"},
    {MessageKind::UiPop, "ui-pop"},
    {MessageKind::Close, "close"},
    {MessageKind::GameLinks, "set_game_links"},
    {MessageKind::LoginSuccess, "login_success"},
    {MessageKind::GoLobby, "go_lobby"},
    {MessageKind::Ping, "ping"},
};

MessageKind kindFromName(const std::string& name) {
  for (const auto& entry : kKindNames) {
    if (name == entry.name) {
      return entry.kind;
    }
  }
  return MessageKind::Other;
}

struct IntField {
  const char* key;
  std::optional<int> PlayerDiff::*member;
};

struct StringField {
  const char* key;
  std::optional<std::string> PlayerDiff::*member;
};

const IntField kPlayerIntFields[] = {
    {"hp", &PlayerDiff::hp},
    {"hp_max", &PlayerDiff::hpMax},
    {"mp", &PlayerDiff::mp},
    {"mp_max", &PlayerDiff::mpMax},
    {"ac", &PlayerDiff::ac},
    {"ev", &PlayerDiff::ev},
    {"sh", &PlayerDiff::sh},
    {"ac_mod", &PlayerDiff::acMod},
    {"ev_mod", &PlayerDiff::evMod},
    {"sh_mod", &PlayerDiff::shMod},
    {"str", &PlayerDiff::str},
    {"int", &PlayerDiff::intel},
    {"dex", &PlayerDiff::dex},
    {"xl", &PlayerDiff::xl},
    {"progress", &PlayerDiff::progress},
    {"depth", &PlayerDiff::depth},
    {"gold", &PlayerDiff::gold},
    {"turn", &PlayerDiff::turn},
    {"time", &PlayerDiff::time},
    {"piety_rank", &PlayerDiff::pietyRank},
    {"contam", &PlayerDiff::contam},
    {"adjusted_noise", &PlayerDiff::noise},
    {"form", &PlayerDiff::form},
    {"poison_survival", &PlayerDiff::poisonSurvival},
    {"real_hp_max", &PlayerDiff::realHpMax},
    {"weapon_index", &PlayerDiff::weaponIndex},
    {"offhand_index", &PlayerDiff::offhandIndex},
    {"doom", &PlayerDiff::doom},
    {"lives", &PlayerDiff::lives},
    {"deaths", &PlayerDiff::deaths},
};

const StringField kPlayerStringFields[] = {
    {"place", &PlayerDiff::place},
    {"god", &PlayerDiff::god},
    {"species", &PlayerDiff::species},
    {"title", &PlayerDiff::title},
    {"quiver_desc", &PlayerDiff::quiverDesc},
};

struct OverlayKey {
  const char* key;
  std::uint16_t flag;
};

constexpr OverlayKey kOverlayKeys[] = {
    {"silenced", kOverlaySilenced},
    {"sanctuary", kOverlaySanctuary},
    {"halo", kOverlayHalo},
    {"liquefied", kOverlayLiquefied},
    {"orb_glow", kOverlayOrbGlow},
    {"quad_glow", kOverlayQuadGlow},
    {"disjunct", kOverlayDisjunct},
    {"awakened_forest", kOverlayAwakenedForest},
    {"blasphemy", kOverlayBlasphemy},
    {"highlighted_summoner", kOverlayHighlightedSummoner},
};

bool truthy(const json& v) {
  if (v.is_boolean()) {
    return v.get<bool>();
  }
  if (v.is_number()) {
    return v.get<double>() != 0.0;
  }
  if (v.is_string()) {
    return !v.get<std::string>().empty();
  }
  return !v.is_null() && !v.empty();
}

std::optional<InventoryItemDiff> parseItem(const json& j) {
  if (!j.is_object() || j.empty()) {
    return std::nullopt;
  }
  InventoryItemDiff item;
  item.name = getStringField(j, {"name"});
  item.quantity = getIntField(j, {"quantity"});
  if (j.contains("useless")) {
    item.useless = truthy(j["useless"]);
  }
  item.inscription = getStringField(j, {"inscription"});
  return item;
}

PlayerDiff parsePlayer(const json& j) {
  PlayerDiff diff;
  for (const auto& field : kPlayerIntFields) {
    diff.*field.member = getIntField(j, {field.key});
  }
  for (const auto& field : kPlayerStringFields) {
    diff.*field.member = getStringField(j, {field.key});
  }
  if (j.contains("penance")) {
    diff.penance = truthy(j["penance"]);
  }
  if (j.contains("pos") && j["pos"].is_object()) {
    const auto& p = j["pos"];
    diff.pos = Position{getIntField(p, {"x"}).value_or(0), getIntField(p, {"y"}).value_or(0)};
  }
  if (j.contains("status") && j["status"].is_array()) {
    std::vector<StatusEffect> effects;
    for (const auto& s : j["status"]) {
      if (!s.is_object()) {
        continue;
      }
      StatusEffect effect;
      effect.light = getStringField(s, {"light"}).value_or("");
      effect.text = getStringField(s, {"text"}).value_or("");
      effect.desc = getStringField(s, {"desc"}).value_or("");
      if (!effect.light.empty() || !effect.text.empty() || !effect.desc.empty()) {
        effects.push_back(std::move(effect));
      }
    }
    diff.status = std::move(effects);
  }
  if (j.contains("inv") && j["inv"].is_object()) {
    for (const auto& entry : j["inv"].items()) {
      const std::string& slotText = entry.key();
      int slot = 0;
      try {
        slot = std::stoi(slotText);
      } catch (const std::logic_error&) {
        spdlog::debug("Ignoring inventory entry with slot key '{}'", slotText);
        continue;
      }
      diff.inventory[slot] = parseItem(entry.value());
    }
  }
  return diff;
}

std::optional<std::uint64_t> parseFg(const json& v) {
  if (v.is_array() && v.size() >= 2 && v[0].is_number_integer() && v[1].is_number_integer()) {
    const auto lo = static_cast<std::uint64_t>(v[0].get<std::int64_t>()) & 0xFFFFFFFFull;
    const auto hi = static_cast<std::uint64_t>(v[1].get<std::int64_t>()) & 0xFFFFFFFFull;
    return (hi << 32) | lo;
  }
  if (v.is_number_unsigned()) {
    return v.get<std::uint64_t>();
  }
  if (v.is_number_integer()) {
    return static_cast<std::uint64_t>(v.get<std::int64_t>());
  }
  return std::nullopt;
}

CellDiff parseCell(const json& j) {
  CellDiff cell;
  cell.x = getIntField(j, {"x"});
  cell.y = getIntField(j, {"y"});
  cell.glyph = getStringField(j, {"g"});
  cell.feature = getIntField(j, {"f"});
  if (j.contains("fg")) {
    cell.fg = parseFg(j["fg"]);
  }
  for (const auto& overlay : kOverlayKeys) {
    if (j.contains(overlay.key) && truthy(j[overlay.key])) {
      cell.overlays |= overlay.flag;
    }
  }
  if (cell.overlays & kOverlayOrbGlow) {
    cell.orbGlow = getIntField(j, {"orb_glow"}).value_or(1);
  }
  if (j.contains("mon")) {
    const auto& mon = j["mon"];
    if (mon.is_object() && !mon.empty()) {
      cell.monsterField = CellDiff::MonsterField::Present;
      cell.monster.id = getIntField(mon, {"id"});
      cell.monster.name = getStringField(mon, {"name"});
      cell.monster.threat = getIntField(mon, {"threat"});
    } else {
      cell.monsterField = CellDiff::MonsterField::Null;
    }
  }
  return cell;
}

ServerMessage parseKnown(MessageKind kind, const json& j) {
  switch (kind) {
    case MessageKind::Player:
      return PlayerMsg{parsePlayer(j)};
    case MessageKind::Map: {
      MapMsg map;
      if (j.contains("cells") && j["cells"].is_array()) {
        map.cells.reserve(j["cells"].size());
        for (const auto& cell : j["cells"]) {
          if (cell.is_object()) {
            map.cells.push_back(parseCell(cell));
          }
        }
      }
      return map;
    }
    case MessageKind::Messages: {
      MessagesMsg msgs;
      if (j.contains("messages") && j["messages"].is_array()) {
        for (const auto& m : j["messages"]) {
          if (m.is_object()) {
            if (auto text = getStringField(m, {"text"}); text && !text->empty()) {
              msgs.texts.push_back(*text);
            }
          }
        }
      }
      return msgs;
    }
    case MessageKind::InputMode:
      return InputModeMsg{getIntField(j, {"mode"}).value_or(-1)};
    case MessageKind::Menu:
    case MessageKind::UpdateMenu:
    case MessageKind::UpdateMenuItems:
    case MessageKind::CloseMenu:
    case MessageKind::CloseAllMenus:
      return MenuMsg{kind, j};
    case MessageKind::UiPush:
    case MessageKind::UiState:
    case MessageKind::UiPop:
      return UiMsg{kind, j};
    case MessageKind::Close:
      return CloseMsg{};
    case MessageKind::GameLinks:
      return GameLinksMsg{getStringField(j, {"content"}).value_or("")};
    case MessageKind::LoginSuccess:
      return LoginSuccessMsg{getStringField(j, {"username"}).value_or("")};
    case MessageKind::GoLobby:
      return GoLobbyMsg{};
    case MessageKind::Ping:
      return PingMsg{};
    case MessageKind::Other:
      break;
  }
  return OtherMsg{getStringField(j, {"msg"}).value_or(""), j};
}
}  // namespace

MessageKind messageKind(const ServerMessage& msg) {
  return std::visit(Overloaded{
                        [](const PlayerMsg&) { return MessageKind::Player; },
                        [](const MapMsg&) { return MessageKind::Map; },
                        [](const MessagesMsg&) { return MessageKind::Messages; },
                        [](const InputModeMsg&) { return MessageKind::InputMode; },
                        [](const MenuMsg& m) { return m.kind; },
                        [](const UiMsg& m) { return m.kind; },
                        [](const CloseMsg&) { return MessageKind::Close; },
                        [](const GameLinksMsg&) { return MessageKind::GameLinks; },
                        [](const LoginSuccessMsg&) { return MessageKind::LoginSuccess; },
                        [](const GoLobbyMsg&) { return MessageKind::GoLobby; },
                        [](const PingMsg&) { return MessageKind::Ping; },
                        [](const OtherMsg&) { return MessageKind::Other; },
                    },
                    msg);
}

const char* messageKindName(MessageKind kind) {
  for (const auto& entry : kKindNames) {
    if (entry.kind == kind) {
      return entry.name;
    }
  }
  return "other";
}

ServerMessage parseServerMessage(const json& j) {
  if (!j.is_object()) {
    return OtherMsg{"", j};
  }
  const std::string name = getStringField(j, {"msg"}).value_or("");
  try {
    return parseKnown(kindFromName(name), j);
  } catch (const json::exception& ex) {
    spdlog::debug("Malformed '{}' message: {}", name, ex.what());
    return OtherMsg{name, j};
  }
}

std::vector<ServerMessage> parseEnvelope(const std::string& text) {
  std::vector<ServerMessage> out;
  const json envelope = json::parse(text, nullptr, false);
  if (envelope.is_discarded() || !envelope.is_object()) {
    spdlog::debug("Discarding undecodable frame ({} bytes)", text.size());
    return out;
  }
  if (!envelope.contains("msgs") || !envelope["msgs"].is_array()) {
    // A bare message without the envelope is still accepted.
    if (envelope.contains("msg")) {
      out.push_back(parseServerMessage(envelope));
    }
    return out;
  }
  out.reserve(envelope["msgs"].size());
  for (const auto& node : envelope["msgs"]) {
    out.push_back(parseServerMessage(node));
  }
  return out;
}

std::optional<std::string> getStringField(const json& j, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (j.contains(key) && j[key].is_string()) {
      return j[key].get<std::string>();
    }
  }
  return std::nullopt;
}

std::optional<int> getIntField(const json& j, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (!j.contains(key)) {
      continue;
    }
    const auto& v = j[key];
    if (v.is_boolean()) {
      return v.get<bool>() ? 1 : 0;
    }
    if (v.is_number_integer()) {
      return static_cast<int>(v.get<std::int64_t>());
    }
    if (v.is_number_float()) {
      return static_cast<int>(std::round(v.get<double>()));
    }
    if (v.is_string()) {
      try {
        return std::stoi(v.get<std::string>());
      } catch (const std::logic_error&) {
        continue;
      }
    }
  }
  return std::nullopt;
}

std::string stripFormatting(const std::string& text) {
  static const std::regex kTag("<[^>]+>");
  const std::string stripped = std::regex_replace(text, kTag, "");
  const auto begin = stripped.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = stripped.find_last_not_of(" \t\r\n");
  return stripped.substr(begin, end - begin + 1);
}

char slotToLetter(int slot) {
  if (slot >= 0 && slot < 26) {
    return static_cast<char>('a' + slot);
  }
  if (slot >= 26 && slot < 52) {
    return static_cast<char>('A' + slot - 26);
  }
  return '?';
}

std::optional<int> letterToSlot(char letter) {
  if (letter >= 'a' && letter <= 'z') {
    return letter - 'a';
  }
  if (letter >= 'A' && letter <= 'Z') {
    return 26 + (letter - 'A');
  }
  return std::nullopt;
}
