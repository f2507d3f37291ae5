#include "MessageChannel.hpp"
#include <atomic>
#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <condition_variable>
#include <deque>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace filesync {

struct WebSocketChannel::Impl {
  using Strand = net::strand<net::io_context::executor_type>;
  using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

  struct PendingWrite {
    std::string text;
    std::shared_ptr<std::promise<beast::error_code>> done;
  };

  net::io_context ioc;
  Strand strand;
  websocket::stream<tcp::socket> ws;
  std::optional<WorkGuard> work;
  std::thread ioThread;

  // Strand only.
  std::deque<PendingWrite> writes;
  beast::flat_buffer readBuffer;

  std::mutex inboxMutex;
  std::condition_variable inboxCv;
  std::deque<std::string> inbox;
  bool readDone = false;

  std::atomic<bool> open{false};
  std::atomic<int64_t> sendTimeoutMs{
      std::chrono::milliseconds(kDefaultSendTimeout).count()};

  Impl() : strand(net::make_strand(ioc)), ws(strand) {}

  // Starts the io thread once the handshake is done.
  void run() {
    ws.text(true);
    open = true;
    work.emplace(ioc.get_executor());
    ioThread = std::thread([this]() { ioc.run(); });
    net::post(strand, [this]() { doRead(); });
  }

  void doRead() {
    ws.async_read(readBuffer, [this](beast::error_code ec, std::size_t) {
      if (ec) {
        if (ec != websocket::error::closed &&
            ec != net::error::operation_aborted && open)
          std::cerr << "[Channel] Read failed: " << ec.message() << std::endl;
        open = false;
        shutdown();
        {
          std::lock_guard<std::mutex> lock(inboxMutex);
          readDone = true;
        }
        inboxCv.notify_all();
        return;
      }
      {
        std::lock_guard<std::mutex> lock(inboxMutex);
        inbox.push_back(beast::buffers_to_string(readBuffer.data()));
      }
      readBuffer.consume(readBuffer.size());
      inboxCv.notify_one();
      doRead();
    });
  }

  void doWrite() {
    ws.async_write(net::buffer(writes.front().text),
                   [this](beast::error_code ec, std::size_t) {
                     writes.front().done->set_value(ec);
                     writes.pop_front();
                     if (ec) {
                       open = false;
                       shutdown();
                       for (auto &pending : writes)
                         pending.done->set_value(ec);
                       writes.clear();
                       return;
                     }
                     if (!writes.empty())
                       doWrite();
                   });
  }

  // Cancels outstanding reads and writes. Strand only, or before run().
  void shutdown() {
    beast::error_code ec;
    ws.next_layer().shutdown(tcp::socket::shutdown_both, ec);
    ws.next_layer().close(ec);
  }
};

WebSocketChannel::WebSocketChannel(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl)) {}

WebSocketChannel::~WebSocketChannel() {
  close();
  if (!m_impl)
    return;
  m_impl->work.reset();
  if (m_impl->ioThread.joinable())
    m_impl->ioThread.join();
}

Result<std::unique_ptr<WebSocketChannel>>
WebSocketChannel::connect(const std::string &host, int port,
                          const std::string &target) {
  using R = Result<std::unique_ptr<WebSocketChannel>>;
  auto impl = std::make_unique<Impl>();
  beast::error_code ec;

  tcp::resolver resolver(impl->ioc);
  auto results = resolver.resolve(host, std::to_string(port), ec);
  if (ec)
    return R::Error(SyncError::connection("resolve failed", host, port,
                                          ec.message()));

  net::connect(impl->ws.next_layer(), results, ec);
  if (ec)
    return R::Error(SyncError::connection("connect failed", host, port,
                                          ec.message()));

  impl->ws.set_option(
      websocket::stream_base::decorator([](websocket::request_type &req) {
        req.set(http::field::user_agent, "filesync-client");
      }));
  impl->ws.handshake(host + ":" + std::to_string(port), target, ec);
  if (ec) {
    auto err = SyncError::webSocket("handshake failed", ec.message());
    err.host = host;
    err.port = port;
    return R::Error(err);
  }

  impl->run();
  return R::Ok(std::unique_ptr<WebSocketChannel>(
      new WebSocketChannel(std::move(impl))));
}

Result<std::unique_ptr<WebSocketChannel>>
WebSocketChannel::adopt(int nativeSocket, bool ipv6, std::string &target) {
  using R = Result<std::unique_ptr<WebSocketChannel>>;
  auto impl = std::make_unique<Impl>();
  beast::error_code ec;

  impl->ws.next_layer().assign(ipv6 ? tcp::v6() : tcp::v4(), nativeSocket, ec);
  if (ec)
    return R::Error(SyncError::webSocket("cannot adopt socket", ec.message()));

  beast::flat_buffer buffer;
  http::request<http::string_body> request;
  http::read(impl->ws.next_layer(), buffer, request, ec);
  if (ec)
    return R::Error(
        SyncError::webSocket("failed to read upgrade request", ec.message()));

  if (!websocket::is_upgrade(request))
    return R::Error(SyncError::protocol("not a websocket upgrade request",
                                        std::string(request.target())));

  target = std::string(request.target());
  impl->ws.set_option(
      websocket::stream_base::decorator([](websocket::response_type &res) {
        res.set(http::field::server, "filesync-server");
      }));
  impl->ws.accept(request, ec);
  if (ec)
    return R::Error(SyncError::webSocket("handshake failed", ec.message()));

  impl->run();
  return R::Ok(std::unique_ptr<WebSocketChannel>(
      new WebSocketChannel(std::move(impl))));
}

Result<void> WebSocketChannel::send(const std::string &text) {
  if (!m_impl->open)
    return Result<void>::Error(SyncError::webSocket("channel is closed"));

  auto done = std::make_shared<std::promise<beast::error_code>>();
  auto written = done->get_future();
  Impl *impl = m_impl.get();
  net::post(impl->strand, [impl, text, done]() {
    if (!impl->open) {
      done->set_value(beast::error_code(net::error::not_connected));
      return;
    }
    impl->writes.push_back({text, done});
    if (impl->writes.size() == 1)
      impl->doWrite();
  });

  std::chrono::milliseconds timeout(impl->sendTimeoutMs.load());
  if (written.wait_for(timeout) != std::future_status::ready) {
    std::cerr << "[Channel] Send timed out after " << timeout.count() << "ms"
              << std::endl;
    close();
    return Result<void>::Error(SyncError::webSocket("send timed out"));
  }
  auto ec = written.get();
  if (ec)
    return Result<void>::Error(SyncError::webSocket("send failed", ec.message()));
  return Result<void>::Ok();
}

std::optional<std::string> WebSocketChannel::receive() {
  std::unique_lock<std::mutex> lock(m_impl->inboxMutex);
  m_impl->inboxCv.wait(lock, [this]() {
    return !m_impl->inbox.empty() || m_impl->readDone || !m_impl->open;
  });
  if (m_impl->inbox.empty())
    return std::nullopt;
  auto text = std::move(m_impl->inbox.front());
  m_impl->inbox.pop_front();
  return text;
}

void WebSocketChannel::close() {
  if (!m_impl)
    return;
  m_impl->open = false;
  Impl *impl = m_impl.get();
  if (impl->ioThread.joinable())
    net::post(impl->strand, [impl]() { impl->shutdown(); });
  {
    std::lock_guard<std::mutex> lock(impl->inboxMutex);
  }
  impl->inboxCv.notify_all();
}

bool WebSocketChannel::isOpen() const { return m_impl->open; }

void WebSocketChannel::setSendTimeout(std::chrono::milliseconds timeout) {
  m_impl->sendTimeoutMs = timeout.count();
}

} // namespace filesync
