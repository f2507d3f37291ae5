#pragma once

#include "MessageChannel.hpp"
#include "SyncError.hpp"
#include <functional>
#include <memory>
#include <string>

namespace filesync {

/**
 * ChannelListener accepts WebSocket connections on /ws/<client_id> and runs
 * one session thread per connection. Handlers are called on the session
 * thread.
 */
class ChannelListener {
public:
  using Channel = std::shared_ptr<MessageChannel>;

  struct Handlers {
    std::function<void(const std::string &clientId, const Channel &channel)>
        onOpen;
    std::function<void(const std::string &clientId, const Channel &channel,
                       const std::string &text)>
        onMessage;
    std::function<void(const std::string &clientId, const Channel &channel)>
        onClose;
  };

  ChannelListener(std::string host, int port, Handlers handlers);
  ~ChannelListener();

  ChannelListener(const ChannelListener &) = delete;
  ChannelListener &operator=(const ChannelListener &) = delete;

  // Port 0 binds an ephemeral port; see port().
  Result<void> start();
  void stop();

  int port() const;

  // "/ws/abc" -> "abc"; empty when the target does not name a client.
  static std::string clientIdFromTarget(const std::string &target);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace filesync
