#pragma once

#include "Config.hpp"
#include "FanoutHub.hpp"
#include "MessageChannel.hpp"
#include "MetadataStore.hpp"
#include "Metrics.hpp"
#include "SyncError.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace filesync {

/**
 * SyncServer hosts the authoritative tree: the HTTP API (cpp-httplib), the
 * persistent channel (ChannelListener) and the metadata store. Changes
 * received over HTTP are announced to the other connected clients.
 */
class SyncServer {
public:
  // config is expected to be validated already.
  explicit SyncServer(ServerConfig config,
                      MetricsSink &metrics = defaultMetrics());
  ~SyncServer();

  SyncServer(const SyncServer &) = delete;
  SyncServer &operator=(const SyncServer &) = delete;

  // Opens the store and binds both ports. Port 0 in the config picks an
  // ephemeral port; see httpPort() / channelPort().
  Result<void> start();
  void stop();
  bool isRunning() const;

  int httpPort() const;
  int channelPort() const;

  MetadataStore &store();
  FanoutHub &hub();
  std::vector<ClientInfo> clients() const;

  // Channel events, normally driven by the listener's session threads.
  void onChannelOpen(const std::string &clientId,
                     const std::shared_ptr<MessageChannel> &channel);
  void onChannelMessage(const std::string &clientId,
                        const std::shared_ptr<MessageChannel> &channel,
                        const std::string &text);
  void onChannelClose(const std::string &clientId,
                      const std::shared_ptr<MessageChannel> &channel);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace filesync
