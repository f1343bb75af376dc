#include "Config.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "Protocol.hpp"

using json = nlohmann::json;

namespace {
std::optional<bool> getBoolField(const json& j, const char* key) {
  if (j.contains(key) && j[key].is_boolean()) {
    return j[key].get<bool>();
  }
  return std::nullopt;
}

void assignString(std::string& target, const json& j, const char* key) {
  if (auto value = getStringField(j, {key})) {
    target = *value;
  }
}

void assignInt(int& target, const json& j, const char* key) {
  if (auto value = getIntField(j, {key})) {
    target = *value;
  }
}

void assignBool(bool& target, const json& j, const char* key) {
  if (auto value = getBoolField(j, key)) {
    target = *value;
  }
}

int parseIntFlag(const std::string& flag, const std::string& value) {
  std::size_t used = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &used);
  } catch (const std::logic_error&) {
    throw ConfigError("Invalid value for " + flag + ": " + value);
  }
  if (used != value.size()) {
    throw ConfigError("Invalid value for " + flag + ": " + value);
  }
  return parsed;
}

// Matches "--name VALUE" and "--name=VALUE"; advances i past a separate value.
std::optional<std::string> flagValue(const std::string& name, int argc, char** argv, int& i) {
  const std::string arg = argv[i];
  if (arg == name) {
    if (i + 1 >= argc) {
      throw ConfigError("Missing value for " + name);
    }
    return std::string(argv[++i]);
  }
  const std::string prefix = name + "=";
  if (arg.rfind(prefix, 0) == 0) {
    return arg.substr(prefix.size());
  }
  return std::nullopt;
}
}  // namespace

void applyConfigJson(ClientConfig& config, const json& j) {
  if (!j.is_object()) {
    return;
  }
  assignString(config.serverUrl, j, "server_url");
  assignString(config.username, j, "username");
  assignString(config.password, j, "password");
  assignString(config.species, j, "species");
  assignString(config.background, j, "background");
  assignString(config.weapon, j, "weapon");
  assignString(config.gameId, j, "game_id");
  assignInt(config.narrateInterval, j, "narrate_interval");
  assignInt(config.dispatchTimeoutMs, j, "dispatch_timeout_ms");
  assignString(config.logLevel, j, "log_level");
  assignString(config.statsPath, j, "stats_path");

  if (j.contains("autoplay") && j["autoplay"].is_object()) {
    const auto& autoplay = j["autoplay"];
    assignInt(config.autoplay.hpStopPercent, autoplay, "hp_stop_percent");
    assignInt(config.autoplay.maxActions, autoplay, "max_actions");
    assignBool(config.autoplay.stopOnItemPickup, autoplay, "stop_on_item_pickup");
    assignBool(config.autoplay.stopOnAltar, autoplay, "stop_on_altar");
    assignBool(config.autoplay.autoDescend, autoplay, "auto_descend");
    assignInt(config.autoplay.enemyCountThreshold, autoplay, "enemy_threshold");
  }
}

bool loadConfigFile(ClientConfig& config, const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    spdlog::debug("No config file at {}", path);
    return false;
  }
  const json parsed = json::parse(in, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    spdlog::warn("Ignoring malformed config file {}", path);
    return false;
  }
  applyConfigJson(config, parsed);
  spdlog::debug("Loaded config from {}", path);
  return true;
}

void applyEnvironment(ClientConfig& config, const EnvLookup& lookup) {
  const auto apply = [&lookup](std::string& target, const char* name) {
    const char* value = lookup(name);
    if (value != nullptr && *value != '\0') {
      target = value;
    }
  };
  apply(config.serverUrl, "WEBTILES_URL");
  apply(config.username, "WEBTILES_USER");
  apply(config.password, "WEBTILES_PASSWORD");
  apply(config.statsPath, "WEBTILES_STATS");
}

void applyCommandLine(ClientConfig& config, int argc, char** argv, bool& wantsHelp) {
  wantsHelp = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      wantsHelp = true;
    } else if (flagValue("--config", argc, argv, i)) {
      // Consumed by configPathFromArgs before the file is loaded.
    } else if (auto url = flagValue("--url", argc, argv, i)) {
      config.serverUrl = *url;
    } else if (auto user = flagValue("--user", argc, argv, i)) {
      config.username = *user;
    } else if (auto password = flagValue("--password", argc, argv, i)) {
      config.password = *password;
    } else if (auto level = flagValue("--log-level", argc, argv, i)) {
      config.logLevel = *level;
    } else if (auto stats = flagValue("--stats", argc, argv, i)) {
      config.statsPath = *stats;
    } else if (auto interval = flagValue("--narrate-interval", argc, argv, i)) {
      config.narrateInterval = parseIntFlag("--narrate-interval", *interval);
    } else {
      throw ConfigError("Unknown argument: " + arg);
    }
  }
}

std::string configPathFromArgs(int argc, char** argv) {
  std::string path = kDefaultConfigFile;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      path = argv[++i];
    } else if (arg.rfind("--config=", 0) == 0) {
      path = arg.substr(std::string("--config=").size());
    }
  }
  return path;
}

json configToJson(const ClientConfig& config) {
  return json{
      {"server_url", config.serverUrl},
      {"username", config.username},
      {"species", config.species},
      {"background", config.background},
      {"weapon", config.weapon},
      {"game_id", config.gameId},
      {"narrate_interval", config.narrateInterval},
      {"dispatch_timeout_ms", config.dispatchTimeoutMs},
      {"log_level", config.logLevel},
      {"stats_path", config.statsPath},
      {"autoplay",
       {{"hp_stop_percent", config.autoplay.hpStopPercent},
        {"max_actions", config.autoplay.maxActions},
        {"stop_on_item_pickup", config.autoplay.stopOnItemPickup},
        {"stop_on_altar", config.autoplay.stopOnAltar},
        {"auto_descend", config.autoplay.autoDescend},
        {"enemy_threshold", config.autoplay.enemyCountThreshold}}},
  };
}

std::string usageText() {
  std::ostringstream out;
  out << "Usage: webtiles-client [--config PATH] [--url URL] [--user NAME] [--password PASS]\n"
      << "                       [--log-level LEVEL] [--narrate-interval N] [--stats PATH]\n"
      << "Config file (default: " << kDefaultConfigFile << ") is read first, then\n"
      << "environment overrides, then flags.\n"
      << "Environment:\n"
      << "  WEBTILES_URL       server websocket url\n"
      << "  WEBTILES_USER      account name\n"
      << "  WEBTILES_PASSWORD  account password\n"
      << "  WEBTILES_STATS     stats file path\n"
      << "Commands are read from stdin one per line; type 'help' for the list.\n";
  return out.str();
}
