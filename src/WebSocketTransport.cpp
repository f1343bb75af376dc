#include "WebSocketTransport.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "Errors.hpp"

namespace {
constexpr std::chrono::seconds kConnectTimeout{10};

std::int64_t nowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}
}  // namespace

WebSocketTransport::WebSocketTransport() {
  client_.clear_access_channels(websocketpp::log::alevel::all);
  client_.clear_error_channels(websocketpp::log::elevel::all);
  client_.init_asio();
  client_.start_perpetual();

  client_.set_open_handler([this](websocketpp::connection_hdl hdl) {
    hdl_ = hdl;
    connected_.store(true);
    touch();
    setStatus("Connected");
    setOpenState(OpenState::Open);
    scheduleKeepalive();
  });

  client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
    connected_.store(false);
    auto con = client_.get_con_from_hdl(hdl);
    setStatus("Socket closed: " + con->get_remote_reason());
    spdlog::info("WebSocket closed by server (code {})", static_cast<int>(con->get_remote_close_code()));
  });

  client_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
    connected_.store(false);
    auto con = client_.get_con_from_hdl(hdl);
    setStatus(std::string("WebSocket fail: ") + con->get_ec().message());
    setOpenState(OpenState::Failed);
  });

  client_.set_message_handler([this](websocketpp::connection_hdl, Client::message_ptr msg) { onMessage(msg); });
}

WebSocketTransport::~WebSocketTransport() {
  close();
}

void WebSocketTransport::connect(const std::string& url, std::chrono::milliseconds timeout) {
  close();
  decoder_.reset();
  inbound_.reopen();
  setOpenState(OpenState::Connecting);

  websocketpp::lib::error_code ec;
  auto con = client_.get_connection(url, ec);
  if (ec) {
    setStatus(std::string("Connection build failed: ") + ec.message());
    throw TransportError(lastStatus());
  }
  client_.connect(con);

  thread_ = std::thread([this]() {
    try {
      client_.run();
    } catch (const std::exception& e) {
      connected_.store(false);
      setStatus(std::string("WebSocket exception: ") + e.what());
      setOpenState(OpenState::Failed);
    }
  });

  std::unique_lock<std::mutex> lock(openMutex_);
  const bool settled =
      openCv_.wait_for(lock, timeout, [this]() { return openState_ != OpenState::Connecting; });
  const OpenState state = openState_;
  lock.unlock();

  if (!settled || state != OpenState::Open) {
    const std::string reason = settled ? lastStatus() : "Timed out connecting to " + url;
    close();
    throw TransportError(reason);
  }
  spdlog::info("Connected to {}", url);
}

void WebSocketTransport::close() {
  connected_.store(false);

  if (thread_.joinable()) {
    websocketpp::lib::error_code ec;
    client_.close(hdl_, websocketpp::close::status::normal, "bye", ec);
    client_.stop_perpetual();
    client_.stop();
    thread_.join();
    keepaliveTimer_.reset();

    client_.reset();
    client_.start_perpetual();
  }

  inbound_.close();
  setOpenState(OpenState::Idle);
  setStatus("Disconnected");
}

void WebSocketTransport::send(const nlohmann::json& payload) {
  if (!connected_.load()) {
    throw NotConnectedError();
  }
  if (!sendRaw(payload.dump())) {
    throw TransportError(lastStatus());
  }
}

std::vector<ServerMessage> WebSocketTransport::recvMessages(std::chrono::milliseconds timeout) {
  std::vector<ServerMessage> out = inbound_.drain();
  if (out.empty()) {
    if (!connected_.load()) {
      throw TransportError(lastStatus());
    }
    out = inbound_.waitAndDrain(timeout);
  }
  // Frames of one server response arrive back to back; pick up stragglers.
  for (auto& msg : inbound_.drain()) {
    out.push_back(std::move(msg));
  }
  return out;
}

void WebSocketTransport::onMessage(Client::message_ptr msg) {
  std::vector<ServerMessage> decoded = msg->get_opcode() == websocketpp::frame::opcode::binary
                                           ? decoder_.decodeBinary(msg->get_payload())
                                           : decoder_.decodeText(msg->get_payload());
  for (auto& m : decoded) {
    if (messageKind(m) == MessageKind::Ping) {
      sendRaw(nlohmann::json{{"msg", "pong"}}.dump());
      continue;
    }
    if (!inbound_.push(std::move(m))) {
      spdlog::warn("Inbound queue full, dropped oldest message");
    }
  }
}

void WebSocketTransport::scheduleKeepalive() {
  const auto delayMs = std::chrono::duration_cast<std::chrono::milliseconds>(kKeepaliveCheck).count();
  keepaliveTimer_ = client_.set_timer(delayMs, [this](const websocketpp::lib::error_code& ec) {
    if (ec || !connected_.load()) {
      return;
    }
    const auto idleMs = nowMs() - lastActivityMs_.load();
    if (idleMs > std::chrono::duration_cast<std::chrono::milliseconds>(kIdleBeforePing).count()) {
      spdlog::debug("Idle for {} ms, sending keepalive", idleMs);
      sendRaw(nlohmann::json{{"msg", "pong"}}.dump());
    }
    scheduleKeepalive();
  });
}

bool WebSocketTransport::sendRaw(const std::string& text) {
  websocketpp::lib::error_code ec;
  client_.send(hdl_, text, websocketpp::frame::opcode::text, ec);
  if (ec) {
    setStatus(std::string("Send failed: ") + ec.message());
    spdlog::warn("{}", lastStatus());
    return false;
  }
  touch();
  return true;
}

void WebSocketTransport::touch() {
  lastActivityMs_.store(nowMs());
}

void WebSocketTransport::setStatus(const std::string& s) {
  std::lock_guard<std::mutex> lock(statusMutex_);
  status_ = s;
}

std::string WebSocketTransport::lastStatus() const {
  std::lock_guard<std::mutex> lock(statusMutex_);
  return status_;
}

void WebSocketTransport::setOpenState(OpenState state) {
  {
    std::lock_guard<std::mutex> lock(openMutex_);
    openState_ = state;
  }
  openCv_.notify_all();
}

std::unique_ptr<Transport> openWebSocketTransport(const std::string& url) {
  auto transport = std::make_unique<WebSocketTransport>();
  transport->connect(url, kConnectTimeout);
  return transport;
}
