#include "FanoutHub.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace filesync;
using test::FakeChannel;

class FanoutHubTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeChannel> connect(const std::string &id) {
    auto channel = std::make_shared<FakeChannel>();
    ClientInfo info;
    info.name = id + "-name";
    hub.registerClient(id, channel, info);
    return channel;
  }

  ChannelMessage update(const std::string &origin) {
    FileUpdatedMessage m;
    m.file_path = "docs/a.txt";
    m.client_id = origin;
    m.checksum = "abc";
    return makeMessage(m);
  }

  InMemoryMetrics metrics;
  FanoutHub hub{metrics};
};

TEST_F(FanoutHubTest, BroadcastToOthersSkipsOrigin) {
  auto a = connect("a");
  auto b = connect("b");
  auto c = connect("c");

  EXPECT_EQ(hub.broadcastToOthers("a", update("a")), 2u);
  EXPECT_TRUE(a->sent().empty());
  ASSERT_EQ(b->sent().size(), 1u);
  ASSERT_EQ(c->sent().size(), 1u);

  auto parsed = parseMessage(b->sent()[0]);
  ASSERT_TRUE(parsed.ok());
  auto *m = std::get_if<FileUpdatedMessage>(&parsed.value().payload);
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(m->file_path, "docs/a.txt");
  EXPECT_EQ(m->client_id, "a");
}

TEST_F(FanoutHubTest, FailedSendDropsOnlyThatClient) {
  auto a = connect("a");
  auto b = connect("b");
  auto c = connect("c");
  c->failSends = true;

  EXPECT_EQ(hub.broadcastToAll(update("server")), 2u);
  EXPECT_TRUE(hub.isConnected("a"));
  EXPECT_TRUE(hub.isConnected("b"));
  EXPECT_FALSE(hub.isConnected("c"));
  EXPECT_FALSE(c->isOpen());
  EXPECT_EQ(hub.connectionCount(), 2u);
  EXPECT_EQ(metrics.counter("fanout.send_failed"), 1);
}

TEST_F(FanoutHubTest, ReRegisteringReplacesAndClosesOldChannel) {
  auto first = connect("a");
  auto second = connect("a");

  EXPECT_FALSE(first->isOpen());
  EXPECT_EQ(hub.connectionCount(), 1u);

  // The stale session's close must not evict the new channel.
  EXPECT_FALSE(hub.unregisterClient("a", first));
  EXPECT_TRUE(hub.isConnected("a"));
  EXPECT_TRUE(hub.sendTo("a", update("b")));
  EXPECT_EQ(second->sent().size(), 1u);

  EXPECT_TRUE(hub.unregisterClient("a", second));
  EXPECT_FALSE(hub.sendTo("a", update("b")));
}

TEST_F(FanoutHubTest, GroupBroadcastIgnoresUnknownIds) {
  auto a = connect("a");
  auto b = connect("b");
  EXPECT_EQ(hub.broadcastToGroup({"b", "ghost"}, update("a")), 1u);
  EXPECT_TRUE(a->sent().empty());
  EXPECT_EQ(b->sent().size(), 1u);
}

TEST_F(FanoutHubTest, EmptyHubBroadcastsNothing) {
  EXPECT_EQ(hub.broadcastToAll(update("a")), 0u);
}

TEST_F(FanoutHubTest, ConnectedClientsCarryInfo) {
  connect("a");
  ClientInfo info;
  info.name = "renamed";
  info.sync_root = "/data";
  hub.updateInfo("a", info);
  hub.updateInfo("ghost", info);

  auto clients = hub.connectedClients();
  ASSERT_EQ(clients.size(), 1u);
  EXPECT_EQ(clients[0].client_id, "a");
  EXPECT_EQ(clients[0].name, "renamed");
  EXPECT_EQ(clients[0].sync_root, "/data");
  EXPECT_TRUE(clients[0].is_online);
  EXPECT_GT(clients[0].last_seen, 0);
}

TEST(FanoutHubTimeoutTest, StalledClientIsDroppedAfterTheDeadline) {
  InMemoryMetrics metrics;
  FanoutHub hub(metrics, std::chrono::milliseconds(100));
  auto a = std::make_shared<FakeChannel>();
  auto b = std::make_shared<FakeChannel>();
  hub.registerClient("a", a);
  hub.registerClient("b", b);
  b->setBlockSends(true);

  auto started = std::chrono::steady_clock::now();
  EXPECT_EQ(hub.broadcastToAll(makeMessage(FileDeletedMessage{"x.txt", "server"})),
            1u);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));

  EXPECT_EQ(a->sent().size(), 1u);
  EXPECT_TRUE(b->sent().empty());
  EXPECT_FALSE(b->isOpen());
  EXPECT_TRUE(hub.isConnected("a"));
  EXPECT_FALSE(hub.isConnected("b"));
  EXPECT_EQ(metrics.counter("fanout.send_timeout"), 1);

  // Later broadcasts no longer wait on the dropped client.
  EXPECT_EQ(hub.broadcastToAll(makeMessage(FileDeletedMessage{"y.txt", "server"})),
            1u);
}
