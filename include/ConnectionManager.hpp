#pragma once

#include "MessageChannel.hpp"
#include "Metrics.hpp"
#include "Protocol.hpp"
#include "SyncError.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace filesync {

enum class ConnectionState {
  Disconnected,
  Connecting,
  Connected,
  ReconnectScheduled,
  Failed
};

std::string toString(ConnectionState state);

struct ConnectionOptions {
  std::chrono::milliseconds heartbeatInterval = std::chrono::seconds(30);
  int maxAttempts = 10;
  std::chrono::milliseconds baseDelay = std::chrono::seconds(1);
  std::chrono::milliseconds maxDelay = std::chrono::seconds(60);
  double jitter = 0.1; // Fraction of the delay added at most
};

struct ConnectionStatus {
  ConnectionState state = ConnectionState::Disconnected;
  int attempts = 0;
  int maxAttempts = 0;
  bool shouldReconnect = true;
  std::string clientId;
};

/**
 * ConnectionManager owns the client's persistent channel.
 *
 * A supervisor thread connects, sends the handshake, heartbeats while
 * connected and schedules reconnects with exponential backoff after the
 * channel drops. A reader thread per channel delivers parsed messages to the
 * message handler. After maxAttempts consecutive failed reconnects the state
 * is Failed until forceReconnect().
 */
class ConnectionManager {
public:
  using Connector = std::function<Result<std::unique_ptr<MessageChannel>>()>;
  using MessageHandler = std::function<void(const ChannelMessage &)>;

  ConnectionManager(ConnectMessage hello, Connector connector,
                    ConnectionOptions options = {},
                    MetricsSink &metrics = defaultMetrics());
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  // Called on the reader thread.
  void setMessageHandler(MessageHandler handler);

  void start();
  void stop();
  void forceReconnect();

  Result<void> send(const ChannelMessage &message);

  ConnectionStatus status() const;
  bool waitForConnection(std::chrono::milliseconds timeout);
  bool waitForState(ConnectionState state, std::chrono::milliseconds timeout);

  // Delay before reconnect attempt n (1-based), without jitter.
  static std::chrono::milliseconds baseBackoff(int attempt,
                                               const ConnectionOptions &options);
  std::chrono::milliseconds computeBackoff(int attempt);

private:
  void supervise();
  void readLoop(std::shared_ptr<MessageChannel> channel);
  bool connectOnce(std::unique_lock<std::mutex> &lock);
  void setState(ConnectionState state);

  ConnectMessage m_hello;
  Connector m_connector;
  ConnectionOptions m_options;
  MetricsSink &m_metrics;
  MessageHandler m_handler;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  ConnectionState m_state = ConnectionState::Disconnected;
  int m_attempts = 0;
  bool m_shouldReconnect = true;
  bool m_running = false;
  bool m_forced = false;
  std::shared_ptr<MessageChannel> m_channel;

  std::thread m_supervisor;
  std::thread m_reader;
  std::mt19937 m_rng;
};

} // namespace filesync
