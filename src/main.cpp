#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "CommandShell.hpp"
#include "Config.hpp"
#include "GameClient.hpp"
#include "Logging.hpp"
#include "WebSocketTransport.hpp"

namespace {
std::atomic<bool> gCancel{false};

void onSignal(int) {
  gCancel.store(true);
}
}  // namespace

int main(int argc, char** argv) {
  setupLogging("info");

  ClientConfig config;
  bool wantsHelp = false;
  try {
    loadConfigFile(config, configPathFromArgs(argc, argv));
    applyEnvironment(config, [](const char* name) { return std::getenv(name); });
    applyCommandLine(config, argc, argv, wantsHelp);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n";
    std::cerr << "Use --help for usage.\n";
    return 1;
  }
  if (wantsHelp) {
    std::cout << usageText();
    return 0;
  }
  setLogLevel(config.logLevel);
  std::signal(SIGINT, onSignal);

  DispatcherConfig dispatcherConfig;
  dispatcherConfig.narrateInterval = config.narrateInterval;
  dispatcherConfig.defaultTimeout = std::chrono::milliseconds(config.dispatchTimeoutMs);

  GameClient client(openWebSocketTransport, dispatcherConfig, SessionTiming{}, config.statsPath);
  CommandShell shell(client, config, std::cout);
  spdlog::info("webtiles-client ready, server {}", config.serverUrl);
  shell.run(std::cin, gCancel);
  client.disconnect();
  return 0;
}
