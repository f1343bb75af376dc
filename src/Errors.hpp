#pragma once

#include <stdexcept>
#include <string>

// Connection-level failure. The session has to be reconnected explicitly.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

class NotConnectedError : public TransportError {
 public:
  NotConnectedError() : TransportError("Not connected to server") {}
};

// Handshake or game lifecycle failure (login rejected, game failed to start).
class SessionError : public std::runtime_error {
 public:
  explicit SessionError(const std::string& what) : std::runtime_error(what) {}
};
