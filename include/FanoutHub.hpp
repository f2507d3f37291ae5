#pragma once

#include "MessageChannel.hpp"
#include "Metrics.hpp"
#include "Protocol.hpp"
#include "types.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace filesync {

/**
 * FanoutHub is the server's registry of connected channels. Broadcasts take
 * a snapshot of the registry and send to every target concurrently; a target
 * whose send fails, or does not finish within the send timeout, is
 * unregistered and closed.
 */
class FanoutHub {
public:
  static constexpr std::chrono::seconds kDefaultSendTimeout{5};

  explicit FanoutHub(MetricsSink &metrics = defaultMetrics(),
                     std::chrono::milliseconds sendTimeout = kDefaultSendTimeout);

  // Replaces (and closes) an existing channel registered under the same id.
  void registerClient(const std::string &clientId,
                      std::shared_ptr<MessageChannel> channel,
                      ClientInfo info = {});
  // Only removes the entry if it still holds channel (when given).
  bool unregisterClient(const std::string &clientId,
                        const std::shared_ptr<MessageChannel> &channel = nullptr);

  bool sendTo(const std::string &clientId, const ChannelMessage &message);
  size_t broadcastToOthers(const std::string &originId,
                           const ChannelMessage &message);
  size_t broadcastToAll(const ChannelMessage &message);
  size_t broadcastToGroup(const std::vector<std::string> &clientIds,
                          const ChannelMessage &message);

  void updateInfo(const std::string &clientId, const ClientInfo &info);
  void touch(const std::string &clientId);

  bool isConnected(const std::string &clientId) const;
  size_t connectionCount() const;
  std::vector<ClientInfo> connectedClients() const;

private:
  struct Entry {
    std::shared_ptr<MessageChannel> channel;
    ClientInfo info;
  };
  using Target = std::pair<std::string, std::shared_ptr<MessageChannel>>;

  size_t fanOut(const std::vector<Target> &targets,
                const ChannelMessage &message);

  MetricsSink &m_metrics;
  std::chrono::milliseconds m_sendTimeout;
  mutable std::mutex m_mutex;
  std::map<std::string, Entry> m_clients;
};

} // namespace filesync
