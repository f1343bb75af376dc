#include "GameClient.hpp"

#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

GameClient::GameClient(TransportFactory factory, DispatcherConfig dispatcherConfig, SessionTiming timing,
                       const std::string& statsPath)
    : session_(std::move(factory), timing),
      dispatcher_(session_, mirror_, ui_, dispatcherConfig),
      commands_(dispatcher_),
      autoPlay_(commands_, dispatcher_),
      stats_(statsPath) {
  stats_.load(session_.record());
}

void GameClient::connect(const std::string& url, const std::string& username, const std::string& password) {
  session_.connect(url, username, password);
}

std::string GameClient::startGame(const std::string& species, const std::string& background,
                                  const std::string& weapon, const std::string& gameId) {
  if (session_.record().sessionEnded) {
    return "Session has ended (death/win recorded). Clear the session before starting another game.";
  }

  mirror_.reset();
  ui_.clear();
  dispatcher_.reset();
  commands_.reset();

  for (const auto& msg : session_.startGame(species, background, weapon, gameId)) {
    dispatcher_.route(msg);
  }
  updateStats("Starting new game...");
  return mirror_.stateText();
}

void GameClient::quitGame() {
  session_.quitGame();
}

void GameClient::saveGame() {
  session_.saveGame();
}

void GameClient::disconnect() {
  session_.disconnect();
}

std::string GameClient::recordDeath(const std::string& cause) {
  if (!mirror_.player().dead) {
    return "The character is not dead; nothing recorded.";
  }
  SessionRecord& record = session_.record();
  record.sessionEnded = true;
  session_.setStatus("Died: " + cause);
  spdlog::info("Death recorded: {}", cause);
  updateStats(cause.empty() ? "Died." : "Died: " + cause);
  return "Death recorded (" + cause + "). Session ended after " + std::to_string(record.deaths) + " death(s).";
}

std::string GameClient::recordWin() {
  SessionRecord& record = session_.record();
  ++record.wins;
  record.sessionEnded = true;
  session_.setStatus("Won!");
  spdlog::info("Win recorded ({} total)", record.wins);
  updateStats("Won!");
  return "Win recorded. Session ended with " + std::to_string(record.wins) + " win(s).";
}

void GameClient::clearSessionEnded() {
  session_.record().sessionEnded = false;
}

std::string GameClient::narrate(const std::string& text) {
  dispatcher_.markNarrated();
  spdlog::info("Narration: {}", text);
  updateStats(text);
  return "Narration noted.";
}

std::string GameClient::status() const {
  const SessionRecord& record = session_.record();
  std::ostringstream out;
  out << "Status: " << record.status << " | Attempts: " << record.attempts << " | Deaths: " << record.deaths
      << " | Wins: " << record.wins << " | Connected: " << (session_.isConnected() ? "yes" : "no")
      << " | In game: " << (session_.inGame() ? "yes" : "no")
      << " | Session ended: " << (record.sessionEnded ? "yes" : "no");
  return out.str();
}

std::string GameClient::writeNote(const std::string& text, const std::string& page) {
  return notepad_.write(text, page, mirror_.player());
}

std::string GameClient::readNotes(const std::string& page) const {
  return notepad_.read(page);
}

std::string GameClient::removeNotes(const std::string& page) {
  return notepad_.remove(page);
}

AutoPlayReport GameClient::autoPlay(const AutoPlayOptions& options, const std::atomic<bool>* cancel) {
  return autoPlay_.run(options, cancel);
}

void GameClient::updateStats(const std::string& thought) {
  if (stats_.enabled() && !stats_.write(session_.record(), mirror_.player(), thought)) {
    spdlog::warn("Stats file {} not updated", stats_.path());
  }
}
