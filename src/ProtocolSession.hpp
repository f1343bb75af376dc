#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Transport.hpp"

// Waits used by the handshake and game lifecycle. Tests shrink them.
struct SessionTiming {
  std::chrono::milliseconds greetingDrain{500};
  std::chrono::milliseconds registerWait{2000};
  std::chrono::milliseconds reconnectPause{200};
  std::chrono::milliseconds loginWait{10000};
  std::chrono::milliseconds lobbyWait{10000};
  std::chrono::milliseconds startTimeout{30000};
  std::chrono::milliseconds startPoll{2000};
  std::chrono::milliseconds settleDrain{1000};
  std::chrono::milliseconds staleSavePause{500};
  std::chrono::milliseconds quitDrain{500};
  std::chrono::milliseconds keyPacing{100};
};

struct SessionRecord {
  int attempts = 0;
  int deaths = 0;
  int wins = 0;
  bool sessionEnded = false;
  std::string status = "Idle";
};

// Owns the connection: handshake, lobby, game start and quit.
class ProtocolSession {
 public:
  explicit ProtocolSession(TransportFactory factory, SessionTiming timing = {});
  ~ProtocolSession();

  ProtocolSession(const ProtocolSession&) = delete;
  ProtocolSession& operator=(const ProtocolSession&) = delete;

  // Registers (which also logs in) or, when the account exists, logs in on a
  // fresh connection. Throws TransportError or SessionError.
  void connect(const std::string& url, const std::string& username, const std::string& password);

  // Plays gameId (or the first advertised game), answering character
  // creation prompts in order. A resumed stale save is abandoned and the
  // start retried once. Returns every message of the successful attempt.
  std::vector<ServerMessage> startGame(const std::string& species, const std::string& background,
                                       const std::string& weapon, const std::string& gameId = "");

  void quitGame();
  void saveGame();
  void disconnect();

  bool isConnected() const;
  bool inGame() const { return inGame_; }
  void setInGame(bool inGame) { inGame_ = inGame; }

  // Throws NotConnectedError before connect().
  Transport& transport();
  void send(const nlohmann::json& payload);
  void sendKey(const std::string& key);
  std::vector<ServerMessage> recv(std::chrono::milliseconds timeout);

  const std::vector<std::string>& gameIds() const { return gameIds_; }
  const std::string& username() const { return username_; }
  const SessionTiming& timing() const { return timing_; }

  SessionRecord& record() { return record_; }
  const SessionRecord& record() const { return record_; }
  void setStatus(const std::string& status);

 private:
  std::vector<ServerMessage> playOnce(const std::string& gameId, const std::vector<std::string>& choices,
                                      bool& sawChoice);
  void enterLobby(std::vector<ServerMessage> seen);
  void pause(std::chrono::milliseconds delay) const;

  TransportFactory factory_;
  SessionTiming timing_;
  std::unique_ptr<Transport> transport_;
  bool inGame_ = false;
  std::string username_;
  std::vector<std::string> gameIds_;
  SessionRecord record_;
};

// Game ids from a set_game_links HTML fragment.
std::vector<std::string> scrapeGameIds(const std::string& content);
