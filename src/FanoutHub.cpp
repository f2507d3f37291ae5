#include "FanoutHub.hpp"
#include "PathUtils.hpp"
#include <algorithm>
#include <future>
#include <iostream>

namespace filesync {

FanoutHub::FanoutHub(MetricsSink &metrics, std::chrono::milliseconds sendTimeout)
    : m_metrics(metrics), m_sendTimeout(sendTimeout) {}

void FanoutHub::registerClient(const std::string &clientId,
                               std::shared_ptr<MessageChannel> channel,
                               ClientInfo info) {
  std::shared_ptr<MessageChannel> previous;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (info.client_id.empty())
      info.client_id = clientId;
    info.is_online = true;
    info.last_seen = nowMillis();

    auto it = m_clients.find(clientId);
    if (it != m_clients.end())
      previous = it->second.channel;
    m_clients[clientId] = {std::move(channel), std::move(info)};
  }
  if (previous) {
    std::cout << "[Fanout] Replacing channel for " << clientId << std::endl;
    previous->close();
  }
  m_metrics.incrementCounter("fanout.registered");
}

bool FanoutHub::unregisterClient(
    const std::string &clientId,
    const std::shared_ptr<MessageChannel> &channel) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_clients.find(clientId);
  if (it == m_clients.end())
    return false;
  if (channel && it->second.channel != channel)
    return false;
  m_clients.erase(it);
  return true;
}

bool FanoutHub::sendTo(const std::string &clientId,
                       const ChannelMessage &message) {
  std::vector<Target> targets;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_clients.find(clientId);
    if (it == m_clients.end())
      return false;
    targets.emplace_back(clientId, it->second.channel);
  }
  return fanOut(targets, message) == 1;
}

size_t FanoutHub::broadcastToOthers(const std::string &originId,
                                    const ChannelMessage &message) {
  std::vector<Target> targets;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &[id, entry] : m_clients) {
      if (id != originId)
        targets.emplace_back(id, entry.channel);
    }
  }
  return fanOut(targets, message);
}

size_t FanoutHub::broadcastToAll(const ChannelMessage &message) {
  std::vector<Target> targets;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &[id, entry] : m_clients)
      targets.emplace_back(id, entry.channel);
  }
  return fanOut(targets, message);
}

size_t FanoutHub::broadcastToGroup(const std::vector<std::string> &clientIds,
                                   const ChannelMessage &message) {
  std::vector<Target> targets;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &id : clientIds) {
      auto it = m_clients.find(id);
      if (it != m_clients.end())
        targets.emplace_back(id, it->second.channel);
    }
  }
  return fanOut(targets, message);
}

size_t FanoutHub::fanOut(const std::vector<Target> &targets,
                         const ChannelMessage &message) {
  if (targets.empty())
    return 0;

  auto text = serializeMessage(message);
  std::vector<std::future<Result<void>>> sends;
  sends.reserve(targets.size());
  for (const auto &target : targets) {
    auto channel = target.second;
    sends.push_back(std::async(std::launch::async, [channel, &text]() {
      return channel->send(text);
    }));
  }

  // One deadline for the whole broadcast. Closing a late target unblocks
  // its send, so the futures can be released afterwards.
  auto deadline = std::chrono::steady_clock::now() + m_sendTimeout;
  size_t delivered = 0;
  for (size_t i = 0; i < sends.size(); ++i) {
    if (sends[i].wait_until(deadline) != std::future_status::ready) {
      std::cerr << "[Fanout] Send to " << targets[i].first
                << " timed out, dropping client" << std::endl;
      m_metrics.incrementCounter("fanout.send_timeout");
      unregisterClient(targets[i].first, targets[i].second);
      targets[i].second->close();
      continue;
    }
    auto result = sends[i].get();
    if (result) {
      ++delivered;
      continue;
    }
    std::cerr << "[Fanout] Send to " << targets[i].first
              << " failed, dropping client: " << result.error().describe()
              << std::endl;
    m_metrics.incrementCounter("fanout.send_failed");
    unregisterClient(targets[i].first, targets[i].second);
    targets[i].second->close();
  }
  m_metrics.incrementCounter("fanout.messages_sent",
                             static_cast<int64_t>(delivered),
                             {{"type", messageType(message.payload)}});
  return delivered;
}

void FanoutHub::updateInfo(const std::string &clientId, const ClientInfo &info) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_clients.find(clientId);
  if (it == m_clients.end())
    return;
  it->second.info = info;
  it->second.info.client_id = clientId;
  it->second.info.is_online = true;
  it->second.info.last_seen = nowMillis();
}

void FanoutHub::touch(const std::string &clientId) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_clients.find(clientId);
  if (it != m_clients.end())
    it->second.info.last_seen = nowMillis();
}

bool FanoutHub::isConnected(const std::string &clientId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_clients.count(clientId) > 0;
}

size_t FanoutHub::connectionCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_clients.size();
}

std::vector<ClientInfo> FanoutHub::connectedClients() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<ClientInfo> clients;
  clients.reserve(m_clients.size());
  for (const auto &[id, entry] : m_clients)
    clients.push_back(entry.info);
  return clients;
}

} // namespace filesync
