#pragma once

#include <atomic>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "Config.hpp"
#include "GameClient.hpp"

// Line-oriented front end: one command per line, results written as text.
class CommandShell {
 public:
  CommandShell(GameClient& client, ClientConfig config, std::ostream& out);

  // Reads commands until end of input, "quit" or a cancel request.
  void run(std::istream& in, const std::atomic<bool>& cancel);

  // Runs one line. Returns false when the shell should exit.
  bool execute(const std::string& line, const std::atomic<bool>* cancel = nullptr);

 private:
  using Args = std::vector<std::string>;

  struct Command {
    const char* name;
    const char* usage;
    std::size_t minArgs;
    std::function<void(const Args&)> handler;
  };

  void registerCommands();
  void add(const char* name, const char* usage, std::size_t minArgs, std::function<void(const Args&)> handler);
  void print(const std::vector<std::string>& lines);
  void print(const std::string& text);
  void printHelp();

  GameClient& client_;
  ClientConfig config_;
  std::ostream& out_;
  std::vector<Command> commands_;
  const std::atomic<bool>* cancel_ = nullptr;
};

std::vector<std::string> splitWords(const std::string& line);
