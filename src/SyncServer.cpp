#include "SyncServer.hpp"
#include "ChannelListener.hpp"
#include "Compressor.hpp"
#include "DeltaEngine.hpp"
#include "FileSystemScanner.hpp"
#include "PathUtils.hpp"
#include "Protocol.hpp"
#include "ReconciliationPlanner.hpp"
#include "httplib.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

namespace filesync {

namespace {

// Allowance on top of max_file_size for the multipart envelope.
constexpr size_t kFormOverhead = 1024 * 1024;
constexpr size_t kReadBlock = 64 * 1024;

void sendError(httplib::Response &res, int status, const std::string &detail) {
  res.status = status;
  res.set_content(json{{"detail", detail}}.dump(), "application/json");
}

void sendJson(httplib::Response &res, const json &body) {
  res.status = 200;
  res.set_content(body.dump(), "application/json");
}

// HTTP status for a failed write or delete.
int statusForErrno(int err) {
  switch (err) {
  case EACCES:
  case EPERM:
  case EROFS:
    return 403;
  case ENOSPC:
#ifdef EDQUOT
  case EDQUOT:
#endif
    return 507;
  default:
    return 500;
  }
}

std::string describeErrno(int err) {
  return std::error_code(err, std::generic_category()).message();
}

} // namespace

struct SyncServer::Impl {
  ServerConfig config;
  MetricsSink &metrics;
  MetadataStore store;
  FanoutHub hub;
  FileSystemScanner scanner;
  DeltaEngine delta;

  httplib::Server http;
  std::unique_ptr<ChannelListener> listener;
  std::thread httpThread;
  int httpPort = 0;
  bool running = false;

  mutable std::mutex clientsMutex;
  std::map<std::string, ClientInfo> clients;

  // Serializes renames and removals with their metadata rows.
  std::mutex publishMutex;
  std::atomic<uint64_t> stagingCounter{0};

  Impl(ServerConfig cfg, MetricsSink &m)
      : config(std::move(cfg)), metrics(m),
        store(config.sync_directory, storeOptions(config), m), hub(m),
        scanner(config.sync_directory) {}

  static MetadataStoreOptions storeOptions(const ServerConfig &config) {
    MetadataStoreOptions options;
    options.dbPath = config.db_path;
    options.poolSize = config.db_pool_size;
    options.cacheTtl = std::chrono::seconds(config.cache_ttl_seconds);
    options.scanWorkers = config.scan_workers;
    options.ignorePatterns = config.ignore_patterns;
    return options;
  }

  fs::path fullPath(const std::string &rel) const {
    return fs::path(config.sync_directory) / rel;
  }

  bool extensionAllowed(const std::string &rel) const {
    if (config.allowed_extensions.empty())
      return true;
    auto ext = fileExtension(rel);
    for (const auto &allowed : config.allowed_extensions) {
      if (fileExtension("x" + allowed) == ext)
        return true;
    }
    return false;
  }

  // Names clients may not write, read or delete: the store's own database
  // files (and any directory holding them) and in-progress staging files.
  bool reservedPath(const std::string &rel) const {
    if (hasPartialSuffix(rel))
      return true;
    for (const auto &name : store.databaseFileNames()) {
      if (name == rel || (name.size() > rel.size() &&
                          name.compare(0, rel.size(), rel) == 0 &&
                          name[rel.size()] == '/'))
        return true;
    }
    return false;
  }

  // Rejects unsafe and reserved paths. Returns false after answering.
  bool acceptPath(const std::string &rel, httplib::Response &res) const {
    if (!isSafeRelativePath(rel)) {
      sendError(res, 400, "invalid path: " + rel);
      return false;
    }
    if (reservedPath(rel)) {
      sendError(res, 400, "reserved path: " + rel);
      return false;
    }
    return true;
  }

  // One staging file per request, beside the target.
  std::string stagingPath(const fs::path &target) {
    return target.string() + "." + std::to_string(++stagingCounter) +
           kPartialSuffix;
  }

  void rememberClient(const ClientInfo &info) {
    std::lock_guard<std::mutex> lock(clientsMutex);
    clients[info.client_id] = info;
  }

  void forgetClient(const std::string &clientId) {
    std::lock_guard<std::mutex> lock(clientsMutex);
    clients.erase(clientId);
  }

  void touchClient(const std::string &clientId) {
    std::lock_guard<std::mutex> lock(clientsMutex);
    auto it = clients.find(clientId);
    if (it != clients.end())
      it->second.last_seen = nowMillis();
  }

  // Records a file that now exists on disk. Caller holds publishMutex.
  std::optional<FileUpdatedMessage> recordWrite(const std::string &rel,
                                                const std::string &clientId,
                                                SyncOperation op) {
    auto info = scanner.statFile(fullPath(rel));
    if (!info) {
      std::cerr << "[Server] Cannot stat " << rel << " after write" << std::endl;
      return std::nullopt;
    }
    info->path = rel;
    auto stored = store.upsert(*info);
    if (!stored)
      std::cerr << "[Server] " << stored.error().describe() << std::endl;
    auto logged = store.logOperation(rel, op, clientId, info->checksum,
                                     static_cast<int64_t>(info->size));
    if (!logged)
      std::cerr << "[Server] " << logged.error().describe() << std::endl;
    return FileUpdatedMessage{op, rel, clientId, info->checksum};
  }

  // Renames a staged body over rel, records it and tells everybody but the
  // origin. Without op the operation is Create or Update depending on whether
  // rel existed at rename time. Returns 0 or the errno of the rename.
  int publish(const std::string &staging, const std::string &rel,
              const std::string &clientId, std::optional<SyncOperation> op) {
    std::optional<FileUpdatedMessage> update;
    {
      std::lock_guard<std::mutex> lock(publishMutex);
      auto target = fullPath(rel);
      std::error_code ec;
      if (!op)
        op = fs::exists(target, ec) ? SyncOperation::Update
                                    : SyncOperation::Create;
      fs::rename(staging, target, ec);
      if (ec)
        return ec.value();
      update = recordWrite(rel, clientId, *op);
    }
    if (update)
      hub.broadcastToOthers(clientId, makeMessage(*update, clientId));
    return 0;
  }

  void setupRoutes();
  void handleUpload(const httplib::Request &req, httplib::Response &res);
  void handleDownload(const httplib::Request &req, httplib::Response &res);
  void handleDelete(const httplib::Request &req, httplib::Response &res);
  void handleSync(const httplib::Request &req, httplib::Response &res);
  void handleDelta(const httplib::Request &req, httplib::Response &res);
};

void SyncServer::Impl::setupRoutes() {
  http.set_payload_max_length(config.max_file_size + kFormOverhead);

  http.Get("/health", [](const httplib::Request &, httplib::Response &res) {
    sendJson(res, {{"status", "healthy"},
                   {"timestamp", formatTimestamp(nowMillis())}});
  });

  http.Post("/register", [this](const httplib::Request &req,
                                httplib::Response &res) {
    ClientInfo info;
    try {
      info = json::parse(req.body).get<ClientInfo>();
    } catch (const json::exception &e) {
      sendError(res, 400, std::string("invalid client info: ") + e.what());
      return;
    }
    info.last_seen = nowMillis();
    info.is_online = true;
    rememberClient(info);
    std::cout << "[Server] Registered client " << info.client_id << std::endl;
    hub.broadcastToOthers(info.client_id,
                          makeMessage(ClientJoinedMessage{info.client_id,
                                                          info.name}));
    sendJson(res, {{"success", true},
                   {"message", "Client registered successfully"}});
  });

  http.Post("/sync", [this](const httplib::Request &req,
                            httplib::Response &res) { handleSync(req, res); });
  http.Post("/upload", [this](const httplib::Request &req,
                              httplib::Response &res) { handleUpload(req, res); });
  http.Get(R"(/download/(.+))", [this](const httplib::Request &req,
                                       httplib::Response &res) {
    handleDownload(req, res);
  });
  http.Delete(R"(/files/(.+))", [this](const httplib::Request &req,
                                       httplib::Response &res) {
    handleDelete(req, res);
  });

  http.Get(R"(/signature/(.+))", [this](const httplib::Request &req,
                                        httplib::Response &res) {
    auto rel = normalizePath(req.matches[1].str());
    if (!acceptPath(rel, res))
      return;
    std::error_code ec;
    if (!fs::is_regular_file(fullPath(rel), ec)) {
      sendError(res, 404, "File not found");
      return;
    }
    auto chunks = delta.createSignature(fullPath(rel).string());
    sendJson(res, {{"path", rel},
                   {"chunk_size", delta.chunkSize()},
                   {"chunks", chunks}});
  });

  http.Post("/delta", [this](const httplib::Request &req,
                             httplib::Response &res) { handleDelta(req, res); });

  http.Get("/history", [this](const httplib::Request &req,
                              httplib::Response &res) {
    size_t limit = 100;
    if (req.has_param("limit")) {
      try {
        limit = std::stoul(req.get_param_value("limit"));
      } catch (const std::exception &) {
        sendError(res, 400, "invalid limit");
        return;
      }
    }
    auto records = store.history(req.get_param_value("path"), limit);
    if (!records) {
      sendError(res, 500, records.error().describe());
      return;
    }
    sendJson(res, {{"history", records.value()}});
  });

  http.Get("/conflicts", [this](const httplib::Request &,
                                httplib::Response &res) {
    auto reports = store.conflicts();
    if (!reports) {
      sendError(res, 500, reports.error().describe());
      return;
    }
    sendJson(res, {{"conflicts", reports.value()}});
  });

  http.Get("/clients", [this](const httplib::Request &,
                              httplib::Response &res) {
    std::vector<ClientInfo> list;
    {
      std::lock_guard<std::mutex> lock(clientsMutex);
      for (const auto &[id, info] : clients)
        list.push_back(info);
    }
    for (auto &info : list)
      info.is_online = hub.isConnected(info.client_id);
    sendJson(res, {{"clients", list}});
  });
}

void SyncServer::Impl::handleSync(const httplib::Request &req,
                                  httplib::Response &res) {
  SyncRequest request;
  try {
    request = json::parse(req.body).get<SyncRequest>();
  } catch (const json::exception &e) {
    sendError(res, 400, std::string("invalid sync request: ") + e.what());
    return;
  }

  // The manifest is always the server's own tree; sync_root is a client path.
  auto serverFiles = store.list();
  if (!serverFiles) {
    std::cerr << "[Server] Sync failed: " << serverFiles.error().describe()
              << std::endl;
    sendError(res, 500, "Database error: " + serverFiles.error().describe());
    return;
  }

  auto plan = ReconciliationPlanner::plan(request.files, serverFiles.value());
  for (const auto &path : plan.conflicts)
    std::cout << "[Server] Conflict on " << path << " for client "
              << request.client_id << std::endl;

  SyncResponse response;
  response.success = true;
  response.message = "Sync analysis complete";
  response.files_to_push = std::move(plan.files_to_push);
  response.files_to_pull = std::move(plan.files_to_pull);
  response.conflicts = std::move(plan.conflicts);
  metrics.incrementCounter("server.sync_requests");
  sendJson(res, response);
}

void SyncServer::Impl::handleUpload(const httplib::Request &req,
                                    httplib::Response &res) {
  ScopedTimer timer(metrics, "server.upload");
  if (!req.form.has_file("file") || !req.form.has_field("relative_path")) {
    sendError(res, 400, "file and relative_path are required");
    return;
  }

  auto rel = normalizePath(req.form.get_field("relative_path"));
  auto clientId = req.form.get_field("client_id");
  if (!acceptPath(rel, res))
    return;
  if (!extensionAllowed(rel)) {
    sendError(res, 413, "file extension not allowed: " + rel);
    return;
  }

  auto compression = CompressionType::None;
  if (req.form.has_field("compression_type")) {
    auto parsed = parseCompressionType(req.form.get_field("compression_type"));
    if (!parsed) {
      sendError(res, 400, "unknown compression type");
      return;
    }
    compression = *parsed;
  }

  auto file = req.form.get_file("file");
  std::string content;
  if (compression == CompressionType::None) {
    content = std::move(file.content);
  } else {
    auto decompressed = Compressor::decompress(file.content, compression);
    if (!decompressed) {
      std::cerr << "[Server] Decompression of " << rel << " failed" << std::endl;
      sendError(res, 400, "Decompression failed");
      return;
    }
    content = std::move(*decompressed);
  }
  if (content.size() > config.max_file_size) {
    sendError(res, 413, "file too large");
    return;
  }

  auto target = fullPath(rel);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    sendError(res, statusForErrno(ec.value()),
              "File system error: " + ec.message());
    return;
  }

  // Written beside the target so readers never see a partial body.
  auto staging = stagingPath(target);
  int err = writeFileBytes(staging, content);
  if (err == 0)
    err = publish(staging, rel, clientId, std::nullopt);
  if (err != 0) {
    fs::remove(staging, ec);
    auto status = statusForErrno(err);
    std::cerr << "[Server] Upload of " << rel << " failed: "
              << describeErrno(err) << std::endl;
    const char *prefix = status == 403   ? "Permission denied: "
                         : status == 507 ? "Insufficient storage: "
                                         : "File system error: ";
    sendError(res, status, prefix + describeErrno(err));
    return;
  }

  metrics.incrementCounter("server.uploads",
                           1, {{"compression", toString(compression)}});
  std::cout << "[Server] Stored " << rel << " (" << content.size()
            << " bytes) from " << clientId << std::endl;
  sendJson(res, {{"success", true}, {"message", "File uploaded successfully"}});
}

void SyncServer::Impl::handleDownload(const httplib::Request &req,
                                      httplib::Response &res) {
  auto rel = normalizePath(req.matches[1].str());
  if (!acceptPath(rel, res))
    return;
  auto path = fullPath(rel);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    sendError(res, 404, "File not found");
    return;
  }
  auto size = fs::file_size(path, ec);
  if (ec) {
    sendError(res, 500, "File system error: " + ec.message());
    return;
  }

  metrics.incrementCounter("server.downloads",
                           1, {{"ranged", req.ranges.empty() ? "no" : "yes"}});
  res.set_header("Accept-Ranges", "bytes");
  if (size == 0) {
    res.set_content("", "application/octet-stream");
    return;
  }

  // Status is left unset so httplib answers Range requests itself: 206 with
  // Content-Range, or 416 when the range is not satisfiable.
  auto file = std::make_shared<std::ifstream>(path, std::ios::binary);
  if (!*file) {
    sendError(res, 500, "cannot open " + rel);
    return;
  }
  res.set_content_provider(
      static_cast<size_t>(size), "application/octet-stream",
      [file](size_t offset, size_t length, httplib::DataSink &sink) {
        std::vector<char> buf(std::min(length, kReadBlock));
        file->clear();
        file->seekg(static_cast<std::streamoff>(offset));
        file->read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = file->gcount();
        if (got <= 0)
          return false;
        return sink.write(buf.data(), static_cast<size_t>(got));
      });
}

void SyncServer::Impl::handleDelete(const httplib::Request &req,
                                    httplib::Response &res) {
  auto rel = normalizePath(req.matches[1].str());
  auto clientId = req.get_param_value("client_id");
  if (!acceptPath(rel, res))
    return;

  auto path = fullPath(rel);
  bool existed = false;
  {
    std::lock_guard<std::mutex> lock(publishMutex);
    std::error_code ec;
    existed = fs::exists(fs::symlink_status(path, ec));
    bool wasDirectory = existed && fs::is_directory(path, ec);
    if (existed) {
      if (wasDirectory)
        fs::remove_all(path, ec);
      else
        fs::remove(path, ec);
      if (ec && ec != std::errc::no_such_file_or_directory) {
        auto status = statusForErrno(ec.value());
        std::cerr << "[Server] Delete of " << rel << " failed: " << ec.message()
                  << std::endl;
        sendError(res, status,
                  (status == 403 ? "Permission denied: "
                                 : "File system error: ") +
                      ec.message());
        return;
      }
    }

    if (wasDirectory) {
      auto below = store.list(rel);
      if (below) {
        for (const auto &info : below.value()) {
          auto removed = store.remove(info.path);
          if (!removed)
            std::cerr << "[Server] " << removed.error().describe() << std::endl;
        }
      }
    }
    auto removed = store.remove(rel);
    if (!removed) {
      sendError(res, 500, removed.error().describe());
      return;
    }
    auto logged = store.logOperation(rel, SyncOperation::Delete, clientId);
    if (!logged)
      std::cerr << "[Server] " << logged.error().describe() << std::endl;
  }

  hub.broadcastToOthers(clientId,
                        makeMessage(FileDeletedMessage{rel, clientId}, clientId));
  metrics.incrementCounter("server.deletes");
  sendJson(res, {{"success", true},
                 {"message", existed ? "File deleted successfully"
                                     : "File already deleted"}});
}

void SyncServer::Impl::handleDelta(const httplib::Request &req,
                                   httplib::Response &res) {
  auto rel = normalizePath(req.get_param_value("path"));
  auto clientId = req.get_param_value("client_id");
  auto expected = req.get_param_value("checksum");
  if (!acceptPath(rel, res))
    return;
  if (!extensionAllowed(rel)) {
    sendError(res, 413, "file extension not allowed: " + rel);
    return;
  }

  auto decoded = decodeDelta(req.body);
  if (!decoded) {
    sendError(res, 400, decoded.error().describe());
    return;
  }
  const auto &fileDelta = decoded.value();
  if (fileDelta.total_size > config.max_file_size) {
    sendError(res, 413, "file too large");
    return;
  }

  auto target = fullPath(rel);
  std::error_code ec;
  if (!fs::is_regular_file(target, ec)) {
    sendError(res, 404, "File not found");
    return;
  }

  auto staging = stagingPath(target);
  if (!delta.applyDelta(staging, fileDelta, target.string())) {
    fs::remove(staging, ec);
    sendError(res, 500, "cannot rebuild " + rel);
    return;
  }
  if (!expected.empty() && calculateHash(staging) != expected) {
    fs::remove(staging, ec);
    std::cerr << "[Server] Delta for " << rel << " does not match its checksum"
              << std::endl;
    sendError(res, 409, "checksum mismatch after applying delta");
    return;
  }
  int err = publish(staging, rel, clientId, SyncOperation::Update);
  if (err != 0) {
    fs::remove(staging, ec);
    sendError(res, statusForErrno(err), "File system error: " + describeErrno(err));
    return;
  }

  auto savings = DeltaEngine::calculateTransferSavings(fileDelta);
  metrics.recordHistogram("server.delta_savings_percent",
                          savings.savings_percent);
  std::cout << "[Server] Applied delta to " << rel << " ("
            << fileDelta.changed_chunks.size() << " changed chunks)"
            << std::endl;
  sendJson(res, {{"success", true}, {"savings", savings}});
}

SyncServer::SyncServer(ServerConfig config, MetricsSink &metrics)
    : m_impl(std::make_unique<Impl>(std::move(config), metrics)) {}

SyncServer::~SyncServer() { stop(); }

Result<void> SyncServer::start() {
  if (m_impl->running)
    return Result<void>::Ok();

  auto opened = m_impl->store.open();
  if (!opened)
    return opened;

  m_impl->setupRoutes();
  const auto &config = m_impl->config;
  if (config.port == 0) {
    m_impl->httpPort = m_impl->http.bind_to_any_port(config.host);
  } else if (m_impl->http.bind_to_port(config.host, config.port)) {
    m_impl->httpPort = config.port;
  } else {
    m_impl->httpPort = -1;
  }
  if (m_impl->httpPort <= 0)
    return Result<void>::Error(SyncError::connection(
        "cannot bind HTTP port", config.host, config.port));

  // With an ephemeral HTTP port the channel port is ephemeral too unless set.
  int channelPort = config.channel_port != 0 ? config.channel_port
                    : config.port == 0      ? 0
                                            : config.port + 1;
  ChannelListener::Handlers handlers;
  handlers.onOpen = [this](const std::string &id,
                           const ChannelListener::Channel &channel) {
    onChannelOpen(id, channel);
  };
  handlers.onMessage = [this](const std::string &id,
                              const ChannelListener::Channel &channel,
                              const std::string &text) {
    onChannelMessage(id, channel, text);
  };
  handlers.onClose = [this](const std::string &id,
                            const ChannelListener::Channel &channel) {
    onChannelClose(id, channel);
  };
  m_impl->listener = std::make_unique<ChannelListener>(config.host, channelPort,
                                                       std::move(handlers));
  auto listening = m_impl->listener->start();
  if (!listening) {
    m_impl->http.stop();
    return listening;
  }

  m_impl->httpThread = std::thread([this]() {
    if (!m_impl->http.listen_after_bind())
      std::cerr << "[Server] HTTP server stopped with an error" << std::endl;
  });
  m_impl->http.wait_until_ready();
  m_impl->running = true;
  std::cout << "[Server] Serving " << config.sync_directory << " on "
            << config.host << ":" << m_impl->httpPort << " (channel "
            << m_impl->listener->port() << ")" << std::endl;
  return Result<void>::Ok();
}

void SyncServer::stop() {
  if (!m_impl->running)
    return;
  m_impl->running = false;

  m_impl->http.stop();
  if (m_impl->httpThread.joinable())
    m_impl->httpThread.join();
  if (m_impl->listener)
    m_impl->listener->stop();
  std::cout << "[Server] Stopped" << std::endl;
}

bool SyncServer::isRunning() const { return m_impl->running; }

int SyncServer::httpPort() const { return m_impl->httpPort; }

int SyncServer::channelPort() const {
  return m_impl->listener ? m_impl->listener->port() : 0;
}

MetadataStore &SyncServer::store() { return m_impl->store; }

FanoutHub &SyncServer::hub() { return m_impl->hub; }

std::vector<ClientInfo> SyncServer::clients() const {
  std::lock_guard<std::mutex> lock(m_impl->clientsMutex);
  std::vector<ClientInfo> list;
  for (const auto &[id, info] : m_impl->clients)
    list.push_back(info);
  return list;
}

void SyncServer::onChannelOpen(const std::string &clientId,
                               const std::shared_ptr<MessageChannel> &channel) {
  ClientInfo info;
  info.client_id = clientId;
  m_impl->hub.registerClient(clientId, channel, info);
}

void SyncServer::onChannelMessage(const std::string &clientId,
                                  const std::shared_ptr<MessageChannel> &channel,
                                  const std::string &text) {
  auto parsed = parseMessage(text);
  if (!parsed) {
    std::cerr << "[Server] Dropping message from " << clientId << ": "
              << parsed.error().describe() << std::endl;
    m_impl->metrics.incrementCounter("server.malformed_messages");
    return;
  }
  auto &message = parsed.value();
  m_impl->hub.touch(clientId);
  m_impl->touchClient(clientId);

  auto reply = [&](MessagePayload payload) {
    auto sent = channel->send(serializeMessage(makeMessage(std::move(payload))));
    if (!sent)
      std::cerr << "[Server] Reply to " << clientId << " failed: "
                << sent.error().describe() << std::endl;
  };

  if (auto *hello = std::get_if<ConnectMessage>(&message.payload)) {
    ClientInfo info;
    info.client_id = clientId;
    info.name = hello->client_name;
    info.sync_root = hello->sync_root;
    info.last_seen = nowMillis();
    m_impl->rememberClient(info);
    m_impl->hub.updateInfo(clientId, info);
    reply(ConnectAck{true, "Connected", formatTimestamp(nowMillis())});
    m_impl->hub.broadcastToOthers(
        clientId, makeMessage(ClientJoinedMessage{clientId, info.name}));
  } else if (std::holds_alternative<HeartbeatMessage>(message.payload)) {
    reply(HeartbeatMessage{formatTimestamp(nowMillis())});
  } else if (std::holds_alternative<FileChangedMessage>(message.payload)) {
    message.client_id = clientId;
    m_impl->hub.broadcastToOthers(clientId, message);
  } else {
    auto type = messageType(message.payload);
    std::cerr << "[Server] Unexpected message type " << type << " from "
              << clientId << std::endl;
    reply(ErrorMessage{"Unknown message type", type});
  }
}

void SyncServer::onChannelClose(const std::string &clientId,
                                const std::shared_ptr<MessageChannel> &channel) {
  // A replaced channel closing must not drop its successor.
  if (!m_impl->hub.unregisterClient(clientId, channel))
    return;
  m_impl->forgetClient(clientId);
  m_impl->hub.broadcastToAll(makeMessage(ClientLeftMessage{clientId}));
}

} // namespace filesync
