#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "Protocol.hpp"

// Message-level connection to a webtiles server.
class Transport {
 public:
  virtual ~Transport() = default;

  // Throws NotConnectedError when the connection is gone.
  virtual void send(const nlohmann::json& payload) = 0;

  // Everything available within timeout: queued messages first, then a
  // bounded wait for new traffic. Never blocks past timeout.
  virtual std::vector<ServerMessage> recvMessages(std::chrono::milliseconds timeout) = 0;

  virtual bool isConnected() const = 0;
  virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const std::string& url)>;
using MessageMatcher = std::function<bool(const ServerMessage&)>;

struct WaitResult {
  bool found = false;
  std::vector<ServerMessage> messages;
};

// Reads until a message of the given kind (and accepted by match, when set)
// arrives or timeout elapses. Returns every message seen meanwhile.
WaitResult waitFor(Transport& transport, MessageKind kind, std::chrono::milliseconds timeout,
                   const MessageMatcher& match = {});

void sendKey(Transport& transport, const std::string& key);
