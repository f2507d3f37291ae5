#include "ConnectionManager.hpp"
#include "PathUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace filesync {

std::string toString(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "disconnected";
  case ConnectionState::Connecting:
    return "connecting";
  case ConnectionState::Connected:
    return "connected";
  case ConnectionState::ReconnectScheduled:
    return "reconnect_scheduled";
  case ConnectionState::Failed:
    return "failed";
  }
  return "disconnected";
}

ConnectionManager::ConnectionManager(ConnectMessage hello, Connector connector,
                                     ConnectionOptions options,
                                     MetricsSink &metrics)
    : m_hello(std::move(hello)), m_connector(std::move(connector)),
      m_options(options), m_metrics(metrics),
      m_rng(std::random_device{}()) {}

ConnectionManager::~ConnectionManager() { stop(); }

void ConnectionManager::setMessageHandler(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_handler = std::move(handler);
}

std::chrono::milliseconds
ConnectionManager::baseBackoff(int attempt, const ConnectionOptions &options) {
  if (attempt < 1)
    attempt = 1;
  double delay = static_cast<double>(options.baseDelay.count()) *
                 std::pow(2.0, std::min(attempt - 1, 30));
  double cap = static_cast<double>(options.maxDelay.count());
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::min(delay, cap)));
}

std::chrono::milliseconds ConnectionManager::computeBackoff(int attempt) {
  auto delay = baseBackoff(attempt, m_options);
  std::uniform_real_distribution<double> dist(0.0, m_options.jitter);
  auto extra = static_cast<int64_t>(static_cast<double>(delay.count()) *
                                    dist(m_rng));
  return delay + std::chrono::milliseconds(extra);
}

void ConnectionManager::setState(ConnectionState state) {
  if (m_state == state)
    return;
  m_state = state;
  m_cv.notify_all();
}

void ConnectionManager::start() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_running)
    return;
  m_running = true;
  m_shouldReconnect = true;
  m_attempts = 0;
  m_state = ConnectionState::Disconnected;
  m_supervisor = std::thread(&ConnectionManager::supervise, this);
}

void ConnectionManager::stop() {
  std::shared_ptr<MessageChannel> channel;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shouldReconnect = false;
    if (!m_running && !m_supervisor.joinable() && !m_reader.joinable())
      return;
    m_running = false;
    channel = m_channel;
  }
  m_cv.notify_all();

  if (m_supervisor.joinable())
    m_supervisor.join();

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!channel)
      channel = m_channel;
    m_channel.reset();
  }
  if (channel)
    channel->close();
  if (m_reader.joinable())
    m_reader.join();

  std::lock_guard<std::mutex> lock(m_mutex);
  setState(ConnectionState::Disconnected);
  std::cout << "[Connection] Stopped" << std::endl;
}

void ConnectionManager::forceReconnect() {
  std::shared_ptr<MessageChannel> channel;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running)
      return;
    std::cout << "[Connection] Forced reconnect requested" << std::endl;
    m_attempts = 0;
    m_shouldReconnect = true;
    m_forced = true;
    if (m_state == ConnectionState::Failed)
      m_state = ConnectionState::Disconnected;
    channel = m_channel;
  }
  // The reader notices the close and moves the state to Disconnected.
  if (channel)
    channel->close();
  m_cv.notify_all();
}

Result<void> ConnectionManager::send(const ChannelMessage &message) {
  std::shared_ptr<MessageChannel> channel;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    channel = m_channel;
  }
  if (!channel || !channel->isOpen())
    return Result<void>::Error(SyncError::webSocket(
        "not connected", "dropping " + messageType(message.payload)));
  return channel->send(serializeMessage(message));
}

ConnectionStatus ConnectionManager::status() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  ConnectionStatus s;
  s.state = m_state;
  s.attempts = m_attempts;
  s.maxAttempts = m_options.maxAttempts;
  s.shouldReconnect = m_shouldReconnect;
  s.clientId = m_hello.client_id;
  return s;
}

bool ConnectionManager::waitForConnection(std::chrono::milliseconds timeout) {
  return waitForState(ConnectionState::Connected, timeout);
}

bool ConnectionManager::waitForState(ConnectionState state,
                                     std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_cv.wait_for(lock, timeout, [&]() { return m_state == state; });
}

// Runs with the lock held on entry and exit; released around the connector.
bool ConnectionManager::connectOnce(std::unique_lock<std::mutex> &lock) {
  setState(ConnectionState::Connecting);
  lock.unlock();

  auto result = m_connector();
  std::shared_ptr<MessageChannel> channel;
  if (result) {
    channel = std::shared_ptr<MessageChannel>(std::move(result.value()));
    auto hello = channel->send(serializeMessage(makeMessage(m_hello, m_hello.client_id)));
    if (!hello) {
      std::cerr << "[Connection] Handshake failed: " << hello.error().describe()
                << std::endl;
      channel->close();
      channel.reset();
    }
  } else {
    std::cerr << "[Connection] Connect failed: " << result.error().describe()
              << std::endl;
  }

  // Previous reader has already seen its channel close.
  if (channel && m_reader.joinable())
    m_reader.join();

  lock.lock();
  if (!channel) {
    m_metrics.incrementCounter("connection.failures");
    setState(ConnectionState::Disconnected);
    return false;
  }
  if (!m_running) {
    channel->close();
    return false;
  }

  m_channel = channel;
  m_attempts = 0;
  setState(ConnectionState::Connected);
  m_reader = std::thread(&ConnectionManager::readLoop, this, channel);
  m_metrics.incrementCounter("connection.established");
  std::cout << "[Connection] Connected as " << m_hello.client_id << std::endl;
  return true;
}

void ConnectionManager::supervise() {
  std::unique_lock<std::mutex> lock(m_mutex);
  bool initial = true;

  while (m_running) {
    switch (m_state) {
    case ConnectionState::Connected: {
      auto channel = m_channel;
      bool changed = m_cv.wait_for(lock, m_options.heartbeatInterval, [&]() {
        return !m_running || m_state != ConnectionState::Connected;
      });
      if (changed || !channel)
        break;
      lock.unlock();
      auto beat = channel->send(serializeMessage(makeMessage(
          HeartbeatMessage{formatTimestamp(nowMillis())}, m_hello.client_id)));
      if (!beat)
        std::cerr << "[Connection] Heartbeat failed: " << beat.error().describe()
                  << std::endl;
      lock.lock();
      break;
    }

    case ConnectionState::Failed:
      m_cv.wait(lock, [&]() {
        return !m_running || m_state != ConnectionState::Failed;
      });
      break;

    default: {
      if (initial || m_forced) {
        initial = false;
        m_forced = false;
        connectOnce(lock);
        break;
      }
      if (!m_shouldReconnect) {
        m_cv.wait(lock, [&]() { return !m_running || m_shouldReconnect; });
        break;
      }
      if (m_attempts >= m_options.maxAttempts) {
        std::cerr << "[Connection] Giving up after " << m_attempts
                  << " reconnect attempts" << std::endl;
        m_metrics.incrementCounter("connection.exhausted");
        setState(ConnectionState::Failed);
        break;
      }

      ++m_attempts;
      auto delay = computeBackoff(m_attempts);
      std::cout << "[Connection] Reconnecting in " << delay.count()
                << " ms (attempt " << m_attempts << "/" << m_options.maxAttempts
                << ")" << std::endl;
      setState(ConnectionState::ReconnectScheduled);
      m_metrics.incrementCounter("connection.reconnects");
      m_cv.wait_for(lock, delay, [&]() { return !m_running || m_forced; });
      if (!m_running)
        break;
      if (m_forced) {
        m_forced = false;
        m_attempts = 0;
      }
      connectOnce(lock);
      break;
    }
    }
  }
}

void ConnectionManager::readLoop(std::shared_ptr<MessageChannel> channel) {
  while (auto text = channel->receive()) {
    auto parsed = parseMessage(*text);
    if (!parsed) {
      std::cerr << "[Connection] Dropping message: " << parsed.error().describe()
                << std::endl;
      continue;
    }
    MessageHandler handler;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      handler = m_handler;
    }
    if (handler)
      handler(parsed.value());
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_channel == channel) {
    m_channel.reset();
    if (m_running) {
      std::cout << "[Connection] Channel closed" << std::endl;
      setState(ConnectionState::Disconnected);
    }
  }
  m_cv.notify_all();
}

} // namespace filesync
