#include "CommandShell.hpp"

#include <iostream>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "Errors.hpp"

namespace {
std::string joinFrom(const std::vector<std::string>& words, std::size_t first) {
  std::string out;
  for (std::size_t i = first; i < words.size(); ++i) {
    if (!out.empty()) {
      out += " ";
    }
    out += words[i];
  }
  return out;
}

std::string argOr(const std::vector<std::string>& args, std::size_t index, const std::string& fallback) {
  return index < args.size() ? args[index] : fallback;
}

int intArgOr(const std::vector<std::string>& args, std::size_t index, int fallback) {
  if (index >= args.size()) {
    return fallback;
  }
  try {
    return std::stoi(args[index]);
  } catch (const std::logic_error&) {
    return fallback;
  }
}
}  // namespace

std::vector<std::string> splitWords(const std::string& line) {
  std::vector<std::string> words;
  std::istringstream in(line);
  for (std::string word; in >> word;) {
    words.push_back(word);
  }
  return words;
}

CommandShell::CommandShell(GameClient& client, ClientConfig config, std::ostream& out)
    : client_(client), config_(std::move(config)), out_(out) {
  registerCommands();
}

void CommandShell::add(const char* name, const char* usage, std::size_t minArgs,
                       std::function<void(const Args&)> handler) {
  commands_.push_back({name, usage, minArgs, std::move(handler)});
}

void CommandShell::registerCommands() {
  GameClient& c = client_;
  ActionCommands& act = c.commands();

  add("connect", "connect [URL USER PASSWORD]", 0, [this, &c](const Args& a) {
    c.connect(argOr(a, 0, config_.serverUrl), argOr(a, 1, config_.username), argOr(a, 2, config_.password));
    print("Connected. " + c.status());
  });
  add("start_game", "start_game [SPECIES BACKGROUND WEAPON [GAME_ID]]", 0, [this, &c](const Args& a) {
    print(c.startGame(argOr(a, 0, config_.species), argOr(a, 1, config_.background), argOr(a, 2, config_.weapon),
                      argOr(a, 3, config_.gameId)));
  });
  add("quit_game", "quit_game", 0, [this, &c](const Args&) {
    c.quitGame();
    print("Game abandoned.");
  });
  add("save_game", "save_game", 0, [this, &c](const Args&) {
    c.saveGame();
    print("Game saved.");
  });
  add("disconnect", "disconnect", 0, [this, &c](const Args&) {
    c.disconnect();
    print("Disconnected.");
  });
  add("status", "status", 0, [this, &c](const Args&) { print(c.status()); });
  add("narrate", "narrate TEXT", 1, [this, &c](const Args& a) { print(c.narrate(joinFrom(a, 0))); });
  add("record_death", "record_death CAUSE", 1, [this, &c](const Args& a) { print(c.recordDeath(joinFrom(a, 0))); });
  add("record_win", "record_win", 0, [this, &c](const Args&) { print(c.recordWin()); });
  add("clear_session_ended", "clear_session_ended", 0, [this, &c](const Args&) {
    c.clearSessionEnded();
    print("Session latch cleared.");
  });

  add("move", "move DIR", 1, [this, &act](const Args& a) { print(act.move(a[0])); });
  add("attack", "attack DIR", 1, [this, &act](const Args& a) { print(act.attack(a[0])); });
  add("auto_explore", "auto_explore", 0, [this, &act](const Args&) { print(act.autoExplore()); });
  add("auto_fight", "auto_fight", 0, [this, &act](const Args&) { print(act.autoFight()); });
  add("rest", "rest", 0, [this, &act](const Args&) { print(act.rest()); });
  add("wait", "wait", 0, [this, &act](const Args&) { print(act.waitTurn()); });
  add("go_upstairs", "go_upstairs", 0, [this, &act](const Args&) { print(act.upstairs()); });
  add("go_downstairs", "go_downstairs", 0, [this, &act](const Args&) { print(act.downstairs()); });
  add("pickup", "pickup", 0, [this, &act](const Args&) { print(act.pickUp()); });

  add("wield", "wield SLOT", 1, [this, &act](const Args& a) { print(act.wield(a[0])); });
  add("wear", "wear SLOT", 1, [this, &act](const Args& a) { print(act.wear(a[0])); });
  add("quaff", "quaff SLOT", 1, [this, &act](const Args& a) { print(act.quaff(a[0])); });
  add("read", "read SLOT", 1, [this, &act](const Args& a) { print(act.read(a[0])); });
  add("drop", "drop SLOT", 1, [this, &act](const Args& a) { print(act.drop(a[0])); });
  add("zap", "zap SLOT [DIR]", 1, [this, &act](const Args& a) { print(act.zap(a[0], argOr(a, 1, ""))); });
  add("evoke", "evoke SLOT", 1, [this, &act](const Args& a) { print(act.evoke(a[0])); });
  add("throw", "throw SLOT DIR", 2, [this, &act](const Args& a) { print(act.throwItem(a[0], a[1])); });
  add("put_on", "put_on SLOT", 1, [this, &act](const Args& a) { print(act.putOn(a[0])); });
  add("remove", "remove [SLOT]", 0, [this, &act](const Args& a) { print(act.remove(argOr(a, 0, ""))); });
  add("take_off", "take_off SLOT", 1, [this, &act](const Args& a) { print(act.takeOff(a[0])); });
  add("examine", "examine SLOT", 1, [this, &act](const Args& a) { print(act.examine(a[0])); });

  add("ability", "ability KEY", 1, [this, &act](const Args& a) { print(act.ability(a[0])); });
  add("cast", "cast KEY [DIR]", 1, [this, &act](const Args& a) { print(act.cast(a[0], argOr(a, 1, ""))); });
  add("pray", "pray", 0, [this, &act](const Args&) { print(act.pray()); });
  add("confirm", "confirm", 0, [this, &act](const Args&) { print(act.confirm()); });
  add("deny", "deny", 0, [this, &act](const Args&) { print(act.deny()); });
  add("respond", "respond yes|no|escape", 1, [this, &act](const Args& a) { print(act.respond(a[0])); });
  add("escape", "escape", 0, [this, &act](const Args&) { print(act.escape()); });
  add("choose_stat", "choose_stat S|I|D", 1, [this, &act](const Args& a) { print(act.chooseStat(a[0])); });
  add("send_keys", "send_keys KEYS...", 1, [this, &act](const Args& a) { print(act.sendKeys(joinFrom(a, 0))); });

  add("get_stats", "get_stats", 0, [this, &c](const Args&) { print(c.mirror().statsLine()); });
  add("get_state", "get_state", 0, [this, &c](const Args&) { print(c.mirror().stateText()); });
  add("get_map", "get_map [RADIUS]", 0, [this, &c](const Args& a) { print(c.mirror().mapText(intArgOr(a, 0, 7))); });
  add("get_landmarks", "get_landmarks", 0, [this, &c](const Args&) { print(c.mirror().landmarksText()); });
  add("get_tactical", "get_tactical", 0, [this, &c](const Args&) { print(c.mirror().tacticalText()); });
  add("get_inventory", "get_inventory", 0, [this, &c](const Args&) { print(c.mirror().inventoryText()); });
  add("get_nearby_enemies", "get_nearby_enemies", 0, [this, &c](const Args&) { print(c.mirror().enemiesText()); });
  add("get_messages", "get_messages [N]", 0, [this, &c](const Args& a) {
    const int n = intArgOr(a, 0, 10);
    print(c.mirror().messagesText(n > 0 ? static_cast<std::size_t>(n) : 10));
  });

  add("read_ui", "read_ui", 0, [this, &c](const Args&) { print(c.ui().text()); });
  add("select_menu_item", "select_menu_item KEY", 1,
      [this, &c](const Args& a) { print(c.dispatcher().selectMenuItem(a[0])); });
  add("dismiss", "dismiss", 0, [this, &c](const Args&) { print(c.dispatcher().dismiss()); });

  add("write_note", "write_note [@PAGE] TEXT", 1, [this, &c](const Args& a) {
    if (a[0].size() > 1 && a[0].front() == '@') {
      print(c.writeNote(joinFrom(a, 1), a[0].substr(1)));
    } else {
      print(c.writeNote(joinFrom(a, 0)));
    }
  });
  add("read_notes", "read_notes [PAGE]", 0, [this, &c](const Args& a) { print(c.readNotes(joinFrom(a, 0))); });
  add("rip_page", "rip_page PAGE", 1, [this, &c](const Args& a) { print(c.removeNotes(joinFrom(a, 0))); });

  add("auto_play", "auto_play [MAX_ACTIONS]", 0, [this, &c](const Args& a) {
    AutoPlayOptions options = config_.autoplay;
    options.maxActions = intArgOr(a, 0, options.maxActions);
    print(c.autoPlay(options, cancel_).summary());
  });
}

void CommandShell::run(std::istream& in, const std::atomic<bool>& cancel) {
  std::string line;
  while (!cancel.load() && std::getline(in, line)) {
    if (!execute(line, &cancel)) {
      break;
    }
  }
}

bool CommandShell::execute(const std::string& line, const std::atomic<bool>* cancel) {
  const Args words = splitWords(line);
  if (words.empty() || words.front().front() == '#') {
    return true;
  }
  const std::string& name = words.front();
  if (name == "quit" || name == "exit") {
    return false;
  }
  if (name == "help") {
    printHelp();
    return true;
  }

  for (const auto& command : commands_) {
    if (name != command.name) {
      continue;
    }
    const Args args(words.begin() + 1, words.end());
    if (args.size() < command.minArgs) {
      print(std::string("Usage: ") + command.usage);
      return true;
    }
    cancel_ = cancel;
    try {
      command.handler(args);
    } catch (const TransportError& e) {
      spdlog::error("{}: {}", name, e.what());
      print(std::string("Transport error: ") + e.what() + ". Reconnect with 'connect'.");
    } catch (const SessionError& e) {
      spdlog::error("{}: {}", name, e.what());
      print(std::string("Session error: ") + e.what());
    }
    cancel_ = nullptr;
    return true;
  }
  print("Unknown command '" + name + "'. Type 'help' for the list.");
  return true;
}

void CommandShell::print(const std::vector<std::string>& lines) {
  if (lines.empty()) {
    out_ << "(no new messages)\n";
  }
  for (const auto& line : lines) {
    out_ << line << "\n";
  }
  out_.flush();
}

void CommandShell::print(const std::string& text) {
  out_ << text << "\n";
  out_.flush();
}

void CommandShell::printHelp() {
  out_ << "Commands:\n";
  for (const auto& command : commands_) {
    out_ << "  " << command.usage << "\n";
  }
  out_ << "  help\n  quit\n";
  out_.flush();
}
