#include "MessageChannel.hpp"
#include "TestHelpers.hpp"
#include <algorithm>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <set>
#include <thread>

using namespace filesync;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// A plain Beast peer: accepts one WebSocket client and hands the stream to
// the test's session function on its own thread.
class PeerServer {
public:
  using Session = std::function<void(websocket::stream<tcp::socket> &)>;

  explicit PeerServer(Session session)
      : m_acceptor(m_ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    m_thread = std::thread([this, session]() {
      beast::error_code ec;
      tcp::socket socket(m_ioc);
      m_acceptor.accept(socket, ec);
      if (ec)
        return;
      websocket::stream<tcp::socket> ws(std::move(socket));
      ws.accept(ec);
      if (ec)
        return;
      session(ws);
    });
  }

  ~PeerServer() {
    if (m_thread.joinable())
      m_thread.join();
  }

  int port() const { return m_acceptor.local_endpoint().port(); }

private:
  net::io_context m_ioc;
  tcp::acceptor m_acceptor;
  std::thread m_thread;
};

} // namespace

TEST(MessageChannelTest, ConcurrentSendsArriveWholeWhileReceiving) {
  std::promise<std::vector<std::string>> seen;
  PeerServer peer([&seen](websocket::stream<tcp::socket> &ws) {
    beast::error_code ec;
    ws.text(true);
    ws.write(net::buffer(std::string("welcome")), ec);
    std::vector<std::string> messages;
    while (messages.size() < 100) {
      beast::flat_buffer buffer;
      ws.read(buffer, ec);
      if (ec)
        break;
      messages.push_back(beast::buffers_to_string(buffer.data()));
    }
    seen.set_value(messages);
    ws.close(websocket::close_code::normal, ec);
  });

  auto connected = WebSocketChannel::connect("127.0.0.1", peer.port(), "/ws/t");
  ASSERT_TRUE(connected.ok()) << connected.error().describe();
  auto channel = std::move(connected.value());

  auto first = channel->receive();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, "welcome");

  std::vector<std::thread> senders;
  for (int t = 0; t < 4; ++t) {
    senders.emplace_back([&channel, t]() {
      for (int i = 0; i < 25; ++i) {
        auto text = "sender " + std::to_string(t) + " message " +
                    std::to_string(i) + " " + std::string(2000, 'x');
        EXPECT_TRUE(channel->send(text).ok());
      }
    });
  }
  for (auto &s : senders)
    s.join();

  auto future = seen.get_future();
  ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
  auto messages = future.get();
  ASSERT_EQ(messages.size(), 100u);
  std::set<std::string> distinct(messages.begin(), messages.end());
  EXPECT_EQ(distinct.size(), 100u);
  for (const auto &m : messages)
    EXPECT_EQ(std::count(m.begin(), m.end(), 'x'), 2000) << m.substr(0, 30);

  // The peer's close ends the receive loop.
  EXPECT_FALSE(channel->receive().has_value());
  EXPECT_FALSE(channel->isOpen());
}

TEST(MessageChannelTest, SendToStalledPeerTimesOut) {
  std::promise<void> release;
  auto released = release.get_future().share();
  PeerServer peer([released](websocket::stream<tcp::socket> &) {
    // Never reads, so the client's socket buffers fill up.
    released.wait_for(30s);
  });

  auto connected = WebSocketChannel::connect("127.0.0.1", peer.port(), "/ws/t");
  ASSERT_TRUE(connected.ok()) << connected.error().describe();
  auto channel = std::move(connected.value());
  channel->setSendTimeout(200ms);

  const std::string block(1024 * 1024, 'z');
  Result<void> sent = Result<void>::Ok();
  auto started = std::chrono::steady_clock::now();
  for (int i = 0; i < 256 && sent.ok(); ++i)
    sent = channel->send(block);

  ASSERT_FALSE(sent.ok());
  EXPECT_EQ(sent.error().kind, ErrorKind::WebSocket);
  EXPECT_FALSE(channel->isOpen());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 60s);
  EXPECT_FALSE(channel->send("after").ok());

  // close() also wakes a reader.
  EXPECT_FALSE(channel->receive().has_value());
  release.set_value();
}

TEST(MessageChannelTest, CloseWakesBlockedReceive) {
  std::promise<void> release;
  auto released = release.get_future().share();
  PeerServer peer(
      [released](websocket::stream<tcp::socket> &) { released.wait_for(30s); });

  auto connected = WebSocketChannel::connect("127.0.0.1", peer.port(), "/ws/t");
  ASSERT_TRUE(connected.ok()) << connected.error().describe();
  auto channel = std::move(connected.value());

  auto reader = std::async(std::launch::async, [&channel]() { return channel->receive(); });
  std::this_thread::sleep_for(50ms);
  channel->close();
  ASSERT_EQ(reader.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE(reader.get().has_value());
  release.set_value();
}

TEST(MessageChannelTest, ConnectToClosedPortFails) {
  net::io_context ioc;
  tcp::acceptor unused(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  int port = unused.local_endpoint().port();
  unused.close();

  auto connected = WebSocketChannel::connect("127.0.0.1", port, "/ws/t");
  ASSERT_FALSE(connected.ok());
  EXPECT_EQ(connected.error().kind, ErrorKind::Connection);
  EXPECT_EQ(connected.error().port, port);
}
