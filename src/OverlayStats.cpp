#include "OverlayStats.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
constexpr const char* kUnknown = "—";
}  // namespace

OverlayStats::OverlayStats(std::string path) : path_(std::move(path)) {}

bool OverlayStats::load(SessionRecord& record) const {
  if (!enabled()) {
    return false;
  }
  std::ifstream in(path_);
  if (!in.is_open()) {
    spdlog::debug("No stats file at {}", path_);
    return false;
  }
  const json stats = json::parse(in, nullptr, false);
  if (stats.is_discarded() || !stats.is_object()) {
    spdlog::warn("Ignoring malformed stats file {}", path_);
    return false;
  }
  record.attempts = getIntField(stats, {"attempt"}).value_or(0);
  record.wins = getIntField(stats, {"wins"}).value_or(0);
  record.deaths = getIntField(stats, {"deaths"}).value_or(0);
  spdlog::info("Loaded stats from {}: attempt {}, wins {}, deaths {}", path_, record.attempts, record.wins,
               record.deaths);
  return true;
}

bool OverlayStats::write(const SessionRecord& record, const PlayerState& player, const std::string& thought) const {
  if (!enabled()) {
    return false;
  }
  const std::filesystem::path file(path_);
  if (file.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
      spdlog::warn("Cannot create directory for {}: {}", path_, ec.message());
      return false;
    }
  }
  std::ofstream out(file, std::ios::trunc);
  if (!out.is_open()) {
    spdlog::warn("Cannot write stats file {}", path_);
    return false;
  }
  out << overlayStatsJson(record, player, thought).dump() << '\n';
  return static_cast<bool>(out);
}

json overlayStatsJson(const SessionRecord& record, const PlayerState& player, const std::string& thought) {
  std::string character = kUnknown;
  if (!player.species.empty()) {
    character = player.title.empty() ? player.species : player.species + " " + player.title;
  }
  const std::string place = player.place.empty() ? kUnknown : player.place + ":" + std::to_string(player.depth);
  return json{
      {"attempt", record.attempts},
      {"wins", record.wins},
      {"deaths", record.deaths},
      {"character", character},
      {"xl", player.xl},
      {"place", place},
      {"turn", player.turn},
      {"thought", thought},
      {"status", player.dead ? "Dead" : "Playing"},
  };
}
