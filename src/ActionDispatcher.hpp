#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "ProtocolSession.hpp"
#include "StateMirror.hpp"
#include "UiOverlayTracker.hpp"

struct DispatcherConfig {
  // Ordinary actions allowed between narrations; 0 disables the cadence.
  int narrateInterval = 0;
  std::chrono::milliseconds defaultTimeout{5000};
  std::chrono::milliseconds pollSlice{500};
  std::chrono::milliseconds strayDrain{50};
  std::chrono::milliseconds settleDrain{100};
  std::chrono::milliseconds recoveryDrain{500};
  std::chrono::milliseconds menuWait{1000};
  std::chrono::milliseconds travelTimeout{15000};
  std::chrono::milliseconds keyPacing{100};
};

// Runs one logical command as a bounded exchange with the server's input
// mode state machine. Every message read is routed to the mirror and the
// overlay tracker before it is inspected.
class ActionDispatcher {
 public:
  static constexpr int kRecoveryThreshold = 3;
  static constexpr int kRecoveryDrains = 5;

  ActionDispatcher(ProtocolSession& session, StateMirror& mirror, UiOverlayTracker& ui,
                   DispatcherConfig config = {});

  // Sends keys and waits for the server to be ready again. Game-level
  // problems come back as text; only a missing connection throws.
  std::vector<std::string> dispatch(const std::vector<std::string>& keys,
                                    std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                    bool menuTraffic = false);

  std::string selectMenuItem(const std::string& key);
  std::string dismiss();
  std::vector<std::string> chooseStat(const std::string& stat);
  std::vector<std::string> escape();
  std::vector<std::string> respond(const std::string& action);

  // Interlevel travel through the G prompt. nullopt when no prompt opened.
  std::optional<std::vector<std::string>> interlevelTravel(const std::string& destination);

  // Reads for up to timeout and routes everything that arrives.
  std::vector<ServerMessage> drain(std::chrono::milliseconds timeout);
  void route(const ServerMessage& msg);
  void sendKey(const std::string& key);
  void pace(int steps = 1) const;

  void markNarrated() { actionsSinceNarration_ = 0; }
  int actionsSinceNarration() const { return actionsSinceNarration_; }
  bool statPromptPending() const { return statPromptPending_; }
  int consecutiveTimeouts() const { return consecutiveTimeouts_; }
  int recoveryCount() const { return recoveries_; }

  // Forget per-game exchange state.
  void reset();

  const DispatcherConfig& config() const { return config_; }
  ProtocolSession& session() { return session_; }
  StateMirror& mirror() { return mirror_; }
  UiOverlayTracker& ui() { return ui_; }

 private:
  std::optional<std::string> guard(bool menuTraffic);
  bool statPromptInRecentMessages() const;
  void recover();

  ProtocolSession& session_;
  StateMirror& mirror_;
  UiOverlayTracker& ui_;
  DispatcherConfig config_;

  int actionsSinceNarration_ = 0;
  int consecutiveTimeouts_ = 0;
  int recoveries_ = 0;
  bool statPromptPending_ = false;
};
