#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "FrameDecoder.hpp"
#include "MessageQueue.hpp"
#include "Transport.hpp"

// websocketpp client running its io loop on a background thread. That thread
// decodes frames, answers server pings, keeps an idle connection alive and
// queues everything else for the caller; it never touches game state.
class WebSocketTransport : public Transport {
 public:
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::chrono::seconds kKeepaliveCheck{10};
  static constexpr std::chrono::seconds kIdleBeforePing{30};

  WebSocketTransport();
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport&) = delete;
  WebSocketTransport& operator=(const WebSocketTransport&) = delete;

  // Throws TransportError when the socket does not open within timeout.
  void connect(const std::string& url, std::chrono::milliseconds timeout);

  void send(const nlohmann::json& payload) override;
  std::vector<ServerMessage> recvMessages(std::chrono::milliseconds timeout) override;
  bool isConnected() const override { return connected_.load(); }
  void close() override;

  std::string lastStatus() const;

 private:
  using Client = websocketpp::client<websocketpp::config::asio_client>;

  enum class OpenState { Idle, Connecting, Open, Failed };

  void onMessage(Client::message_ptr msg);
  void scheduleKeepalive();
  bool sendRaw(const std::string& text);
  void touch();
  void setStatus(const std::string& s);
  void setOpenState(OpenState state);

  Client client_;
  websocketpp::connection_hdl hdl_;
  Client::timer_ptr keepaliveTimer_;
  std::thread thread_;

  FrameDecoder decoder_;
  MessageQueue<ServerMessage> inbound_{kQueueCapacity};

  std::atomic<bool> connected_{false};
  std::atomic<std::int64_t> lastActivityMs_{0};

  std::mutex openMutex_;
  std::condition_variable openCv_;
  OpenState openState_ = OpenState::Idle;

  mutable std::mutex statusMutex_;
  std::string status_ = "Disconnected";
};

// TransportFactory backed by WebSocketTransport.
std::unique_ptr<Transport> openWebSocketTransport(const std::string& url);
