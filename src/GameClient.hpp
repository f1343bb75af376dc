#pragma once

#include <atomic>
#include <string>

#include "ActionCommands.hpp"
#include "ActionDispatcher.hpp"
#include "Notepad.hpp"
#include "OverlayStats.hpp"
#include "ProtocolSession.hpp"
#include "StateMirror.hpp"
#include "TacticalAutoPlay.hpp"
#include "UiOverlayTracker.hpp"

// One webtiles client: connection, world mirror, command surface and the
// session record, composed by ownership.
class GameClient {
 public:
  // Counters are restored from statsPath when the file exists.
  explicit GameClient(TransportFactory factory, DispatcherConfig dispatcherConfig = {},
                      SessionTiming timing = {}, const std::string& statsPath = "");

  GameClient(const GameClient&) = delete;
  GameClient& operator=(const GameClient&) = delete;

  void connect(const std::string& url, const std::string& username, const std::string& password);
  // Returns the initial state text, or a refusal while the session is ended.
  std::string startGame(const std::string& species, const std::string& background, const std::string& weapon,
                        const std::string& gameId = "");
  void quitGame();
  void saveGame();
  void disconnect();

  std::string recordDeath(const std::string& cause);
  std::string recordWin();
  void clearSessionEnded();
  bool sessionEnded() const { return session_.record().sessionEnded; }

  std::string narrate(const std::string& text);
  std::string status() const;

  std::string writeNote(const std::string& text, const std::string& page = "");
  std::string readNotes(const std::string& page = "") const;
  std::string removeNotes(const std::string& page);

  AutoPlayReport autoPlay(const AutoPlayOptions& options, const std::atomic<bool>* cancel = nullptr);

  ProtocolSession& session() { return session_; }
  StateMirror& mirror() { return mirror_; }
  const StateMirror& mirror() const { return mirror_; }
  UiOverlayTracker& ui() { return ui_; }
  ActionDispatcher& dispatcher() { return dispatcher_; }
  ActionCommands& commands() { return commands_; }
  const OverlayStats& stats() const { return stats_; }

 private:
  void updateStats(const std::string& thought);

  ProtocolSession session_;
  StateMirror mirror_;
  UiOverlayTracker ui_;
  ActionDispatcher dispatcher_;
  ActionCommands commands_;
  TacticalAutoPlay autoPlay_;
  Notepad notepad_;
  OverlayStats stats_;
};
