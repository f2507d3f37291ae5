#include "ChannelListener.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <iostream>
#include <list>
#include <mutex>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace filesync {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string percentDecode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      int hi = hexValue(value[i + 1]);
      int lo = hexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

} // namespace

struct ChannelListener::Impl {
  struct Session {
    std::thread thread;
    int wakeFd = -1; // dup of the connection, used only for shutdown()
    bool done = false;
  };

  std::string host;
  int port;
  Handlers handlers;

  net::io_context ioc;
  tcp::acceptor acceptor{ioc};
  std::thread ioThread;
  bool running = false;

  std::mutex sessionMutex;
  std::list<Session> sessions;
  bool stopping = false;

  Impl(std::string h, int p, Handlers hs)
      : host(std::move(h)), port(p), handlers(std::move(hs)) {}

  void doAccept() {
    acceptor.async_accept([this](boost::system::error_code ec,
                                 tcp::socket socket) {
      if (ec) {
        if (ec != net::error::operation_aborted)
          std::cerr << "[Listener] Accept failed: " << ec.message()
                    << std::endl;
      } else {
        spawnSession(std::move(socket));
      }
      if (acceptor.is_open())
        doAccept();
    });
  }

  void reapFinished() {
    for (auto it = sessions.begin(); it != sessions.end();) {
      if (it->done) {
        if (it->thread.joinable())
          it->thread.join();
        it = sessions.erase(it);
      } else {
        ++it;
      }
    }
  }

  void spawnSession(tcp::socket socket) {
    boost::system::error_code ec;
    bool ipv6 = socket.local_endpoint(ec).address().is_v6();
    int fd = ::dup(socket.native_handle());
    socket.close(ec);
    if (fd < 0) {
      std::cerr << "[Listener] Cannot take over accepted socket" << std::endl;
      return;
    }

    std::lock_guard<std::mutex> lock(sessionMutex);
    reapFinished();
    if (stopping) {
      ::close(fd);
      return;
    }
    sessions.emplace_back();
    Session &session = sessions.back();
    session.wakeFd = ::dup(fd);
    session.thread = std::thread([this, &session, fd, ipv6]() {
      runSession(session, fd, ipv6);
    });
  }

  void runSession(Session &session, int fd, bool ipv6) {
    std::string target;
    auto adopted = WebSocketChannel::adopt(fd, ipv6, target);
    if (!adopted) {
      std::cerr << "[Listener] Rejected connection: "
                << adopted.error().describe() << std::endl;
    } else {
      Channel channel(std::move(adopted.value()));
      auto clientId = ChannelListener::clientIdFromTarget(target);
      if (clientId.empty()) {
        std::cerr << "[Listener] Rejected target " << target << std::endl;
        channel->close();
      } else {
        serve(clientId, channel);
      }
    }

    std::lock_guard<std::mutex> lock(sessionMutex);
    if (session.wakeFd >= 0)
      ::close(session.wakeFd);
    session.wakeFd = -1;
    session.done = true;
  }

  void serve(const std::string &clientId, const Channel &channel) {
    std::cout << "[Listener] Client connected: " << clientId << std::endl;
    if (handlers.onOpen)
      handlers.onOpen(clientId, channel);
    while (auto text = channel->receive()) {
      if (handlers.onMessage)
        handlers.onMessage(clientId, channel, *text);
    }
    channel->close();
    std::cout << "[Listener] Client disconnected: " << clientId << std::endl;
    if (handlers.onClose)
      handlers.onClose(clientId, channel);
  }
};

ChannelListener::ChannelListener(std::string host, int port, Handlers handlers)
    : m_impl(std::make_unique<Impl>(std::move(host), port, std::move(handlers))) {}

ChannelListener::~ChannelListener() { stop(); }

Result<void> ChannelListener::start() {
  if (m_impl->running)
    return Result<void>::Ok();

  boost::system::error_code ec;
  auto address = net::ip::make_address(m_impl->host, ec);
  if (ec) {
    tcp::resolver resolver(m_impl->ioc);
    auto results = resolver.resolve(m_impl->host, std::to_string(m_impl->port), ec);
    if (ec || results.empty())
      return Result<void>::Error(SyncError::connection(
          "cannot resolve listen address", m_impl->host, m_impl->port,
          ec.message()));
    address = results.begin()->endpoint().address();
  }

  tcp::endpoint endpoint(address, static_cast<unsigned short>(m_impl->port));
  m_impl->acceptor.open(endpoint.protocol(), ec);
  if (!ec)
    m_impl->acceptor.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    m_impl->acceptor.bind(endpoint, ec);
  if (!ec)
    m_impl->acceptor.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    boost::system::error_code ignored;
    m_impl->acceptor.close(ignored);
    return Result<void>::Error(SyncError::connection(
        "cannot listen for channel connections", m_impl->host, m_impl->port,
        ec.message()));
  }

  m_impl->port = m_impl->acceptor.local_endpoint().port();
  m_impl->doAccept();
  m_impl->running = true;
  m_impl->ioThread = std::thread([this]() { m_impl->ioc.run(); });
  std::cout << "[Listener] Accepting channel connections on " << m_impl->host
            << ":" << m_impl->port << std::endl;
  return Result<void>::Ok();
}

void ChannelListener::stop() {
  if (!m_impl->running)
    return;
  m_impl->running = false;

  net::post(m_impl->ioc, [this]() {
    boost::system::error_code ec;
    m_impl->acceptor.close(ec);
  });
  if (m_impl->ioThread.joinable())
    m_impl->ioThread.join();

  {
    std::lock_guard<std::mutex> lock(m_impl->sessionMutex);
    m_impl->stopping = true;
    for (auto &session : m_impl->sessions) {
      if (!session.done && session.wakeFd >= 0)
        ::shutdown(session.wakeFd, SHUT_RDWR);
    }
  }

  // Sessions finish on their own once their socket is shut down.
  for (auto &session : m_impl->sessions) {
    if (session.thread.joinable())
      session.thread.join();
  }
  m_impl->sessions.clear();
  std::cout << "[Listener] Stopped" << std::endl;
}

int ChannelListener::port() const { return m_impl->port; }

std::string ChannelListener::clientIdFromTarget(const std::string &target) {
  const std::string prefix = "/ws/";
  if (target.compare(0, prefix.size(), prefix) != 0)
    return "";
  auto id = target.substr(prefix.size());
  auto query = id.find('?');
  if (query != std::string::npos)
    id.erase(query);
  if (id.find('/') != std::string::npos)
    return "";
  return percentDecode(id);
}

} // namespace filesync
