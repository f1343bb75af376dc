#include "Notepad.hpp"

#include <algorithm>
#include <sstream>

#include "StateMirror.hpp"

std::string Notepad::defaultPage(const PlayerState& player) {
  if (player.place.empty()) {
    return "general";
  }
  return player.place + ":" + std::to_string(player.depth);
}

std::string Notepad::write(const std::string& text, const std::string& page, const PlayerState& player) {
  const std::string name = page.empty() ? defaultPage(player) : page;
  Page* target = find(name);
  if (!target) {
    pages_.emplace_back(name, std::vector<std::string>{});
    target = &pages_.back();
  }
  target->second.push_back(text);

  std::ostringstream out;
  out << "Note saved to [" << name << "] (" << target->second.size() << " notes on this page, " << totalNotes()
      << " total).";
  return out.str();
}

std::string Notepad::read(const std::string& page) const {
  if (pages_.empty()) {
    return "Notepad is empty.";
  }
  std::ostringstream out;
  if (!page.empty()) {
    const Page* found = find(page);
    if (!found || found->second.empty()) {
      return "No notes on page [" + page + "].";
    }
    out << "[" << page << "]";
    for (const auto& note : found->second) {
      out << "\n- " << note;
    }
    return out.str();
  }

  bool first = true;
  for (const auto& [name, notes] : pages_) {
    if (!first) {
      out << "\n";
    }
    first = false;
    out << "[" << name << "]";
    for (const auto& note : notes) {
      out << "\n  - " << note;
    }
  }
  return out.str();
}

std::string Notepad::remove(const std::string& page) {
  auto it = std::find_if(pages_.begin(), pages_.end(), [&](const Page& p) { return p.first == page; });
  if (it == pages_.end()) {
    return "No page [" + page + "] to rip out.";
  }
  const std::size_t count = it->second.size();
  pages_.erase(it);
  return "Ripped out [" + page + "] (" + std::to_string(count) + " notes removed).";
}

std::size_t Notepad::totalNotes() const {
  std::size_t total = 0;
  for (const auto& page : pages_) {
    total += page.second.size();
  }
  return total;
}

Notepad::Page* Notepad::find(const std::string& name) {
  for (auto& page : pages_) {
    if (page.first == name) {
      return &page;
    }
  }
  return nullptr;
}

const Notepad::Page* Notepad::find(const std::string& name) const {
  for (const auto& page : pages_) {
    if (page.first == name) {
      return &page;
    }
  }
  return nullptr;
}
