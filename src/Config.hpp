#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "TacticalAutoPlay.hpp"

inline constexpr const char* kDefaultConfigFile = "webtiles-client.json";
inline constexpr const char* kDefaultStatsFile = "webtiles-stats.json";

struct ClientConfig {
  std::string serverUrl = "ws://localhost:8080/socket";
  std::string username = "dcssai";
  std::string password = "dcssai";
  std::string species = "b";
  std::string background = "f";
  std::string weapon = "b";
  std::string gameId;
  int narrateInterval = 5;
  int dispatchTimeoutMs = 5000;
  std::string logLevel = "info";
  // Empty disables the stats file.
  std::string statsPath = kDefaultStatsFile;
  AutoPlayOptions autoplay;
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

using EnvLookup = std::function<const char*(const char*)>;

// Keys present in j override config; unknown keys are ignored.
void applyConfigJson(ClientConfig& config, const nlohmann::json& j);

// Missing file leaves config untouched; an unreadable or malformed one is
// reported and skipped. Returns true when the file was applied.
bool loadConfigFile(ClientConfig& config, const std::string& path);

void applyEnvironment(ClientConfig& config, const EnvLookup& lookup);

// Applies --url/--user/--password/--log-level/--narrate-interval/--stats. Sets
// wantsHelp on --help. Throws ConfigError on unknown or malformed flags.
void applyCommandLine(ClientConfig& config, int argc, char** argv, bool& wantsHelp);

// The --config value, or the default file name.
std::string configPathFromArgs(int argc, char** argv);

nlohmann::json configToJson(const ClientConfig& config);
std::string usageText();
