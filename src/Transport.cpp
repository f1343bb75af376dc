#include "Transport.hpp"

#include <algorithm>

#include "KeyInput.hpp"

using Clock = std::chrono::steady_clock;

WaitResult waitFor(Transport& transport, MessageKind kind, std::chrono::milliseconds timeout,
                   const MessageMatcher& match) {
  WaitResult result;
  const auto deadline = Clock::now() + timeout;
  while (Clock::now() < deadline) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    auto msgs = transport.recvMessages(std::min(remaining, std::chrono::milliseconds(1000)));
    for (auto& msg : msgs) {
      const bool hit = messageKind(msg) == kind && (!match || match(msg));
      result.messages.push_back(std::move(msg));
      if (hit) {
        result.found = true;
      }
    }
    if (result.found) {
      return result;
    }
  }
  return result;
}

void sendKey(Transport& transport, const std::string& key) {
  transport.send(encodeKey(key));
}
