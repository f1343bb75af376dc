#include "ProtocolSession.hpp"

#include <algorithm>
#include <regex>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "KeyInput.hpp"

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {
bool isNewgameChoice(const ServerMessage& msg) {
  const auto* ui = std::get_if<UiMsg>(&msg);
  return ui && ui->kind == MessageKind::UiState &&
         getStringField(ui->payload, {"type"}).value_or("") == "newgame-choice";
}

void append(std::vector<ServerMessage>& into, std::vector<ServerMessage> from) {
  for (auto& msg : from) {
    into.push_back(std::move(msg));
  }
}
}  // namespace

std::vector<std::string> scrapeGameIds(const std::string& content) {
  static const std::regex kPlayLink("#play-([^\"]+)\"");
  std::vector<std::string> ids;
  for (auto it = std::sregex_iterator(content.begin(), content.end(), kPlayLink); it != std::sregex_iterator();
       ++it) {
    ids.push_back((*it)[1].str());
  }
  return ids;
}

ProtocolSession::ProtocolSession(TransportFactory factory, SessionTiming timing)
    : factory_(std::move(factory)), timing_(timing) {}

ProtocolSession::~ProtocolSession() {
  if (transport_) {
    transport_->close();
  }
}

void ProtocolSession::connect(const std::string& url, const std::string& username, const std::string& password) {
  if (transport_) {
    transport_->close();
    transport_.reset();
  }
  inGame_ = false;
  username_ = username;
  gameIds_.clear();
  setStatus("Connecting to " + url);

  transport_ = factory_(url);
  transport_->recvMessages(timing_.greetingDrain);

  transport_->send(json{{"msg", "register"}, {"username", username}, {"password", password}, {"email", ""}});
  WaitResult reg = waitFor(*transport_, MessageKind::LoginSuccess, timing_.registerWait);
  if (reg.found) {
    spdlog::info("Registered new account {}", username);
    enterLobby(std::move(reg.messages));
    return;
  }

  // A failed registration can leave the server-side session unusable.
  spdlog::info("Registration refused for {}, logging in on a fresh connection", username);
  transport_->close();
  transport_.reset();
  pause(timing_.reconnectPause);
  transport_ = factory_(url);
  transport_->recvMessages(timing_.greetingDrain);

  transport_->send(json{{"msg", "login"}, {"username", username}, {"password", password}});
  WaitResult login = waitFor(*transport_, MessageKind::LoginSuccess, timing_.loginWait);
  if (!login.found) {
    setStatus("Login failed");
    throw SessionError("Login failed");
  }
  spdlog::info("Logged in as {}", username);
  enterLobby(std::move(login.messages));
}

void ProtocolSession::enterLobby(std::vector<ServerMessage> seen) {
  transport_->send(json{{"msg", "go_lobby"}});
  WaitResult lobby = waitFor(*transport_, MessageKind::GoLobby, timing_.lobbyWait);
  append(seen, std::move(lobby.messages));

  for (const auto& msg : seen) {
    if (const auto* links = std::get_if<GameLinksMsg>(&msg)) {
      gameIds_ = scrapeGameIds(links->content);
      if (!gameIds_.empty()) {
        break;
      }
    }
  }
  if (gameIds_.empty()) {
    spdlog::warn("Lobby advertised no game ids");
  } else {
    spdlog::debug("Lobby games: {}", gameIds_.size());
  }
  setStatus("In lobby");
}

std::vector<ServerMessage> ProtocolSession::startGame(const std::string& species, const std::string& background,
                                                      const std::string& weapon, const std::string& gameId) {
  if (!isConnected()) {
    throw NotConnectedError();
  }
  if (inGame_) {
    quitGame();
  }
  if (gameId.empty() && gameIds_.empty()) {
    throw SessionError("No game ids available from the lobby");
  }
  const std::string gid = gameId.empty() ? gameIds_.front() : gameId;
  const std::vector<std::string> choices{species, background, weapon};

  bool sawChoice = false;
  std::vector<ServerMessage> startup = playOnce(gid, choices, sawChoice);
  if (!sawChoice) {
    spdlog::info("Stale save detected, abandoning");
    inGame_ = true;
    quitGame();
    ++record_.attempts;
    setStatus("Clearing stale save, restarting...");
    pause(timing_.staleSavePause);
    transport_->recvMessages(timing_.settleDrain);
    startup = playOnce(gid, choices, sawChoice);
  }

  inGame_ = true;
  ++record_.attempts;
  for (int i = 0; i < 5; ++i) {
    auto msgs = transport_->recvMessages(timing_.settleDrain);
    if (msgs.empty()) {
      break;
    }
    append(startup, std::move(msgs));
  }
  setStatus("Playing " + gid);
  spdlog::info("Game {} started (attempt {})", gid, record_.attempts);
  return startup;
}

std::vector<ServerMessage> ProtocolSession::playOnce(const std::string& gameId,
                                                     const std::vector<std::string>& choices, bool& sawChoice) {
  transport_->send(json{{"msg", "play"}, {"game_id", gameId}});

  std::size_t choiceIdx = 0;
  sawChoice = false;
  std::vector<ServerMessage> all;
  const auto deadline = Clock::now() + timing_.startTimeout;
  while (Clock::now() < deadline) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    auto msgs = transport_->recvMessages(std::min(remaining, timing_.startPoll));
    bool gotMap = false;
    for (const auto& msg : msgs) {
      if (messageKind(msg) == MessageKind::Map) {
        gotMap = true;
      } else if (isNewgameChoice(msg)) {
        sawChoice = true;
        if (choiceIdx < choices.size()) {
          spdlog::debug("Character creation choice {}: {}", choiceIdx, choices[choiceIdx]);
          sendKey(choices[choiceIdx]);
          ++choiceIdx;
        }
      }
    }
    append(all, std::move(msgs));
    if (gotMap) {
      return all;
    }
  }
  setStatus("Timeout starting game");
  throw SessionError("Timeout starting game");
}

void ProtocolSession::quitGame() {
  if (!inGame_ || !transport_) {
    return;
  }
  for (int i = 0; i < 3; ++i) {
    sendKey(kKeyEscape);
    pause(timing_.keyPacing);
  }
  transport_->recvMessages(timing_.quitDrain);

  sendKey(kKeyQuit);
  pause(timing_.quitDrain);
  transport_->recvMessages(timing_.quitDrain);

  for (const char ch : std::string("yes")) {
    sendKey(std::string(1, ch));
    pause(timing_.keyPacing / 2);
  }
  sendKey(kKeyEnter);
  pause(timing_.quitDrain);

  for (int i = 0; i < 10; ++i) {
    auto msgs = transport_->recvMessages(timing_.quitDrain);
    if (msgs.empty()) {
      break;
    }
    bool inLobby = false;
    for (const auto& msg : msgs) {
      inLobby = inLobby || messageKind(msg) == MessageKind::GoLobby;
    }
    if (inLobby) {
      break;
    }
  }
  inGame_ = false;
  setStatus("In lobby");
}

void ProtocolSession::saveGame() {
  if (!inGame_ || !transport_) {
    return;
  }
  sendKey(kKeySave);
  waitFor(*transport_, MessageKind::GoLobby, timing_.lobbyWait);
  inGame_ = false;
  setStatus("Game saved");
}

void ProtocolSession::disconnect() {
  if (!transport_) {
    return;
  }
  if (inGame_ && transport_->isConnected()) {
    try {
      quitGame();
    } catch (const TransportError& e) {
      spdlog::warn("Quit during disconnect failed: {}", e.what());
    }
  }
  transport_->close();
  transport_.reset();
  inGame_ = false;
  setStatus("Disconnected");
}

bool ProtocolSession::isConnected() const {
  return transport_ && transport_->isConnected();
}

Transport& ProtocolSession::transport() {
  if (!transport_) {
    throw NotConnectedError();
  }
  return *transport_;
}

void ProtocolSession::send(const json& payload) {
  transport().send(payload);
}

void ProtocolSession::sendKey(const std::string& key) {
  ::sendKey(transport(), key);
}

std::vector<ServerMessage> ProtocolSession::recv(std::chrono::milliseconds timeout) {
  return transport().recvMessages(timeout);
}

void ProtocolSession::setStatus(const std::string& status) {
  record_.status = status;
  spdlog::debug("Session status: {}", status);
}

void ProtocolSession::pause(std::chrono::milliseconds delay) const {
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}
