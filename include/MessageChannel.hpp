#pragma once

#include "SyncError.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace filesync {

/**
 * MessageChannel is a bidirectional, message oriented transport. One thread
 * may block in receive() while others send(); sends are serialized by the
 * implementation. close() wakes a blocked receive(), which then returns
 * nullopt.
 */
class MessageChannel {
public:
  virtual ~MessageChannel() = default;

  virtual Result<void> send(const std::string &text) = 0;
  virtual std::optional<std::string> receive() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

/**
 * WebSocket transport over Boost.Beast. The handshake is synchronous; after
 * it the stream is driven by a private io thread on one strand, so reads and
 * writes never touch the stream concurrently. send() waits for its frame to
 * be written and gives up (closing the channel) after the send timeout.
 */
class WebSocketChannel : public MessageChannel {
public:
  static constexpr std::chrono::seconds kDefaultSendTimeout{10};

  ~WebSocketChannel() override;

  // Client side: TCP connect plus WebSocket handshake on target ("/ws/<id>").
  static Result<std::unique_ptr<WebSocketChannel>>
  connect(const std::string &host, int port, const std::string &target);

  // Server side: takes ownership of an accepted socket descriptor, reads the
  // upgrade request and completes the handshake. The request target is
  // returned through target.
  static Result<std::unique_ptr<WebSocketChannel>>
  adopt(int nativeSocket, bool ipv6, std::string &target);

  Result<void> send(const std::string &text) override;
  std::optional<std::string> receive() override;
  void close() override;
  bool isOpen() const override;

  void setSendTimeout(std::chrono::milliseconds timeout);

private:
  struct Impl;
  explicit WebSocketChannel(std::unique_ptr<Impl> impl);
  std::unique_ptr<Impl> m_impl;
};

} // namespace filesync
