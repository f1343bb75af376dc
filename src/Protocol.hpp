#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

enum class MessageKind {
  Player,
  Map,
  Messages,
  InputMode,
  Menu,
  UpdateMenu,
  UpdateMenuItems,
  CloseMenu,
  CloseAllMenus,
  UiPush,
  UiState,
  UiPop,
  Close,
  GameLinks,
  LoginSuccess,
  GoLobby,
  Ping,
  Other,
};

// Values of the server's mouse_mode enum as sent in input_mode.
enum class InputMode : int {
  Normal = 0,
  Command = 1,
  Target = 2,
  TargetDir = 3,
  TargetPath = 4,
  More = 5,
  Macro = 6,
  Prompt = 7,
  YesNo = 8,
};

struct Position {
  int x = 0;
  int y = 0;

  bool operator==(const Position& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Position& o) const { return !(*this == o); }
  bool operator<(const Position& o) const { return y != o.y ? y < o.y : x < o.x; }
};

struct StatusEffect {
  std::string light;
  std::string text;
  std::string desc;
};

struct InventoryItemDiff {
  std::optional<std::string> name;
  std::optional<int> quantity;
  std::optional<bool> useless;
  std::optional<std::string> inscription;
};

struct PlayerDiff {
  std::optional<int> hp;
  std::optional<int> hpMax;
  std::optional<int> mp;
  std::optional<int> mpMax;
  std::optional<int> ac;
  std::optional<int> ev;
  std::optional<int> sh;
  std::optional<int> acMod;
  std::optional<int> evMod;
  std::optional<int> shMod;
  std::optional<int> str;
  std::optional<int> intel;
  std::optional<int> dex;
  std::optional<int> xl;
  std::optional<int> progress;
  std::optional<int> depth;
  std::optional<int> gold;
  std::optional<int> turn;
  std::optional<int> time;
  std::optional<int> pietyRank;
  std::optional<int> contam;
  std::optional<int> noise;
  std::optional<int> form;
  std::optional<int> poisonSurvival;
  std::optional<int> realHpMax;
  std::optional<int> weaponIndex;
  std::optional<int> offhandIndex;
  std::optional<int> doom;
  std::optional<int> lives;
  std::optional<int> deaths;
  std::optional<std::string> place;
  std::optional<std::string> god;
  std::optional<std::string> species;
  std::optional<std::string> title;
  std::optional<std::string> quiverDesc;
  std::optional<bool> penance;
  std::optional<Position> pos;
  std::optional<std::vector<StatusEffect>> status;
  // nullopt value = slot emptied
  std::map<int, std::optional<InventoryItemDiff>> inventory;
};

struct MonsterDiff {
  std::optional<int> id;
  std::optional<std::string> name;
  std::optional<int> threat;
};

enum CellOverlay : std::uint16_t {
  kOverlaySilenced = 1u << 0,
  kOverlaySanctuary = 1u << 1,
  kOverlayHalo = 1u << 2,
  kOverlayLiquefied = 1u << 3,
  kOverlayOrbGlow = 1u << 4,
  kOverlayQuadGlow = 1u << 5,
  kOverlayDisjunct = 1u << 6,
  kOverlayAwakenedForest = 1u << 7,
  kOverlayBlasphemy = 1u << 8,
  kOverlayHighlightedSummoner = 1u << 9,
};

struct CellDiff {
  enum class MonsterField { Absent, Null, Present };

  std::optional<int> x;
  std::optional<int> y;
  std::optional<std::string> glyph;
  std::optional<int> feature;
  std::optional<std::uint64_t> fg;
  std::uint16_t overlays = 0;
  int orbGlow = 0;
  MonsterField monsterField = MonsterField::Absent;
  MonsterDiff monster;
};

struct PlayerMsg {
  PlayerDiff diff;
};

struct MapMsg {
  std::vector<CellDiff> cells;
};

struct MessagesMsg {
  std::vector<std::string> texts;
};

struct InputModeMsg {
  int mode = 0;
};

// Menus and popups have heterogeneous shapes; the payload keeps the raw object.
struct MenuMsg {
  MessageKind kind = MessageKind::Menu;
  nlohmann::json payload;
};

struct UiMsg {
  MessageKind kind = MessageKind::UiPush;
  nlohmann::json payload;
};

struct CloseMsg {};

struct GameLinksMsg {
  std::string content;
};

struct LoginSuccessMsg {
  std::string username;
};

struct GoLobbyMsg {};

struct PingMsg {};

struct OtherMsg {
  std::string kind;
  nlohmann::json payload;
};

using ServerMessage = std::variant<PlayerMsg, MapMsg, MessagesMsg, InputModeMsg, MenuMsg, UiMsg, CloseMsg,
                                   GameLinksMsg, LoginSuccessMsg, GoLobbyMsg, PingMsg, OtherMsg>;

MessageKind messageKind(const ServerMessage& msg);
const char* messageKindName(MessageKind kind);

// Decodes one element of the {"msgs": [...]} envelope.
ServerMessage parseServerMessage(const nlohmann::json& j);

// Decodes a whole envelope; malformed input yields an empty list.
std::vector<ServerMessage> parseEnvelope(const std::string& text);

std::optional<int> getIntField(const nlohmann::json& j, std::initializer_list<const char*> keys);
std::optional<std::string> getStringField(const nlohmann::json& j, std::initializer_list<const char*> keys);

// Strips <tag> markup and surrounding whitespace.
std::string stripFormatting(const std::string& text);

// Inventory slots 0-25 map to a-z and 26-51 to A-Z; anything else is '?'.
char slotToLetter(int slot);
std::optional<int> letterToSlot(char letter);
