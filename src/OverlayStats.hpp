#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "ProtocolSession.hpp"
#include "StateMirror.hpp"

// Session counters and a character snapshot kept in a small JSON file that
// outlives the process, for external status displays. An empty path turns
// the file off.
class OverlayStats {
 public:
  explicit OverlayStats(std::string path = "");

  const std::string& path() const { return path_; }
  bool enabled() const { return !path_.empty(); }

  // Copies attempt, wins and deaths into record. Returns false when there is
  // no readable file.
  bool load(SessionRecord& record) const;

  // Rewrites the file. Returns false when it could not be written.
  bool write(const SessionRecord& record, const PlayerState& player, const std::string& thought) const;

 private:
  std::string path_;
};

nlohmann::json overlayStatsJson(const SessionRecord& record, const PlayerState& player,
                                const std::string& thought);
