#include "ConnectionManager.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace filesync;
using namespace std::chrono_literals;
using test::FakeChannel;

class ConnectionManagerTest : public ::testing::Test {
protected:
  ConnectionManagerTest() {
    hello.client_id = "laptop_20240101_120000";
    hello.client_name = "laptop";
    hello.sync_root = "/home/me/sync";

    options.baseDelay = 10ms;
    options.maxDelay = 100ms;
    options.maxAttempts = 3;
    options.heartbeatInterval = 50ms;
  }

  // Each successful connect hands out a fresh FakeChannel.
  ConnectionManager::Connector connector() {
    return [this]() -> Result<std::unique_ptr<MessageChannel>> {
      std::lock_guard<std::mutex> lock(mutex);
      ++connectCalls;
      if (refuse)
        return Result<std::unique_ptr<MessageChannel>>::Error(
            SyncError::connection("refused", "localhost", 8001));
      auto channel = std::make_shared<FakeChannel>();
      channels.push_back(channel);
      return Result<std::unique_ptr<MessageChannel>>::Ok(
          std::make_unique<test::SharedChannel>(channel));
    };
  }

  std::shared_ptr<FakeChannel> channel(size_t index) {
    std::lock_guard<std::mutex> lock(mutex);
    return index < channels.size() ? channels[index] : nullptr;
  }

  size_t channelCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return channels.size();
  }

  ConnectMessage hello;
  ConnectionOptions options;
  InMemoryMetrics metrics;

  std::mutex mutex;
  bool refuse = false;
  int connectCalls = 0;
  std::vector<std::shared_ptr<FakeChannel>> channels;
};

TEST_F(ConnectionManagerTest, BackoffDoublesUpToTheCap) {
  ConnectionOptions defaults;
  EXPECT_EQ(ConnectionManager::baseBackoff(1, defaults), 1000ms);
  EXPECT_EQ(ConnectionManager::baseBackoff(2, defaults), 2000ms);
  EXPECT_EQ(ConnectionManager::baseBackoff(4, defaults), 8000ms);
  EXPECT_EQ(ConnectionManager::baseBackoff(7, defaults), 60000ms);
  EXPECT_EQ(ConnectionManager::baseBackoff(40, defaults), 60000ms);

  std::chrono::milliseconds previous{0};
  for (int n = 1; n <= 12; ++n) {
    auto delay = ConnectionManager::baseBackoff(n, defaults);
    EXPECT_GE(delay, previous);
    previous = delay;
  }
}

TEST_F(ConnectionManagerTest, JitterStaysWithinTenPercent) {
  ConnectionManager manager(hello, connector(), ConnectionOptions{}, metrics);
  for (int n = 1; n <= 8; ++n) {
    auto base = ConnectionManager::baseBackoff(n, ConnectionOptions{});
    for (int i = 0; i < 20; ++i) {
      auto delay = manager.computeBackoff(n);
      EXPECT_GE(delay, base);
      EXPECT_LE(delay.count(), base.count() + base.count() / 10);
    }
  }
}

TEST_F(ConnectionManagerTest, ConnectsAndSendsHandshake) {
  ConnectionManager manager(hello, connector(), options, metrics);
  manager.start();
  ASSERT_TRUE(manager.waitForConnection(2s));

  auto first = channel(0);
  ASSERT_NE(first, nullptr);
  ASSERT_TRUE(first->waitForSent(1));
  auto handshake = parseMessage(first->sent()[0]);
  ASSERT_TRUE(handshake.ok());
  auto *connect = std::get_if<ConnectMessage>(&handshake.value().payload);
  ASSERT_NE(connect, nullptr);
  EXPECT_EQ(connect->client_id, hello.client_id);
  EXPECT_EQ(connect->client_name, "laptop");

  auto status = manager.status();
  EXPECT_EQ(status.state, ConnectionState::Connected);
  EXPECT_EQ(status.attempts, 0);
  EXPECT_EQ(status.clientId, hello.client_id);
  manager.stop();
  EXPECT_EQ(manager.status().state, ConnectionState::Disconnected);
}

TEST_F(ConnectionManagerTest, HeartbeatsWhileConnected) {
  ConnectionManager manager(hello, connector(), options, metrics);
  manager.start();
  ASSERT_TRUE(manager.waitForConnection(2s));

  auto first = channel(0);
  ASSERT_TRUE(first->waitForSent(2, 2s));
  auto beat = parseMessage(first->sent()[1]);
  ASSERT_TRUE(beat.ok());
  EXPECT_TRUE(std::holds_alternative<HeartbeatMessage>(beat.value().payload));
  manager.stop();
}

TEST_F(ConnectionManagerTest, DeliversParsedMessagesAndSkipsGarbage) {
  ConnectionManager manager(hello, connector(), options, metrics);
  std::mutex seenMutex;
  std::vector<std::string> seen;
  manager.setMessageHandler([&](const ChannelMessage &message) {
    std::lock_guard<std::mutex> lock(seenMutex);
    seen.push_back(messageType(message.payload));
  });
  manager.start();
  ASSERT_TRUE(manager.waitForConnection(2s));

  auto first = channel(0);
  first->deliver("{broken");
  first->deliver(serializeMessage(makeMessage(
      FileDeletedMessage{"a.txt", "desktop_20240101_120000"}, "server")));

  EXPECT_TRUE(test::waitUntil([&]() {
    std::lock_guard<std::mutex> lock(seenMutex);
    return seen.size() == 1;
  }));
  manager.stop();
  EXPECT_EQ(seen[0], "file_deleted");
}

TEST_F(ConnectionManagerTest, ReconnectsAfterChannelCloses) {
  ConnectionManager manager(hello, connector(), options, metrics);
  manager.start();
  ASSERT_TRUE(manager.waitForConnection(2s));

  channel(0)->close();
  EXPECT_TRUE(test::waitUntil([this]() { return channelCount() == 2; }));
  ASSERT_TRUE(manager.waitForConnection(2s));
  EXPECT_TRUE(channel(1)->waitForSent(1));
  EXPECT_GE(metrics.counter("connection.reconnects"), 1);
  manager.stop();
}

TEST_F(ConnectionManagerTest, FailsAfterMaxAttemptsUntilForced) {
  refuse = true;
  ConnectionManager manager(hello, connector(), options, metrics);
  manager.start();

  ASSERT_TRUE(manager.waitForState(ConnectionState::Failed, 3s));
  auto status = manager.status();
  EXPECT_EQ(status.attempts, options.maxAttempts);
  {
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(connectCalls, options.maxAttempts + 1);
    refuse = false;
  }
  EXPECT_EQ(metrics.counter("connection.exhausted"), 1);

  manager.forceReconnect();
  ASSERT_TRUE(manager.waitForConnection(2s));
  EXPECT_EQ(manager.status().attempts, 0);
  manager.stop();
}

TEST_F(ConnectionManagerTest, ForceReconnectReplacesLiveChannel) {
  ConnectionManager manager(hello, connector(), options, metrics);
  manager.start();
  ASSERT_TRUE(manager.waitForConnection(2s));

  manager.forceReconnect();
  EXPECT_TRUE(test::waitUntil([this]() { return channelCount() == 2; }));
  EXPECT_FALSE(channel(0)->isOpen());
  ASSERT_TRUE(manager.waitForConnection(2s));
  manager.stop();
}

TEST_F(ConnectionManagerTest, SendWithoutChannelFails) {
  ConnectionManager manager(hello, connector(), options, metrics);
  auto sent = manager.send(makeMessage(HeartbeatMessage{"now"}));
  ASSERT_FALSE(sent.ok());
  EXPECT_EQ(sent.error().kind, ErrorKind::WebSocket);
}

TEST_F(ConnectionManagerTest, StopInterruptsLongBackoff) {
  refuse = true;
  options.baseDelay = 10s;
  options.maxDelay = 60s;
  ConnectionManager manager(hello, connector(), options, metrics);
  manager.start();
  ASSERT_TRUE(manager.waitForState(ConnectionState::ReconnectScheduled, 2s));

  auto started = std::chrono::steady_clock::now();
  manager.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
  EXPECT_EQ(manager.status().state, ConnectionState::Disconnected);

  int calls = 0;
  {
    std::lock_guard<std::mutex> lock(mutex);
    calls = connectCalls;
  }
  std::this_thread::sleep_for(100ms);
  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(connectCalls, calls);
}
