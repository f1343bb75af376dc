#pragma once

#include <string>
#include <utility>
#include <vector>

struct PlayerState;

// Free-text notes grouped by page, kept in page creation order.
class Notepad {
 public:
  // An empty page goes to defaultPage(player).
  std::string write(const std::string& text, const std::string& page, const PlayerState& player);
  std::string read(const std::string& page = "") const;
  std::string remove(const std::string& page);

  std::size_t totalNotes() const;

  static std::string defaultPage(const PlayerState& player);

 private:
  using Page = std::pair<std::string, std::vector<std::string>>;

  Page* find(const std::string& name);
  const Page* find(const std::string& name) const;

  std::vector<Page> pages_;
};
