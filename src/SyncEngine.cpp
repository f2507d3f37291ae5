#include "SyncEngine.hpp"
#include "ApiClient.hpp"
#include "FileSystemScanner.hpp"
#include "MessageChannel.hpp"
#include "PathUtils.hpp"
#include <filesystem>
#include <iostream>
#include <map>

namespace fs = std::filesystem;

namespace filesync {

namespace {

constexpr size_t kScanWorkers = 4;

std::chrono::milliseconds secondsToMillis(double seconds) {
  return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

ConnectionOptions connectionOptions(const ClientConfig &config) {
  ConnectionOptions options;
  options.heartbeatInterval =
      std::chrono::seconds(config.heartbeat_interval_seconds);
  options.maxAttempts = config.max_reconnect_attempts;
  options.baseDelay = secondsToMillis(config.reconnect_base_delay_seconds);
  options.maxDelay = secondsToMillis(config.reconnect_max_delay_seconds);
  return options;
}

TransferOptions transferOptions(const ClientConfig &config) {
  TransferOptions options;
  options.enableCompression = config.enable_compression;
  options.enableDifferential = config.enable_differential;
  options.maxConcurrentUploads = config.max_concurrent_uploads;
  options.maxConcurrentDownloads = config.max_concurrent_downloads;
  options.timeout = std::chrono::seconds(config.timeout_seconds);
  return options;
}

ConnectionManager::Connector webSocketConnector(const ClientConfig &config,
                                                const std::string &clientId) {
  auto host = config.server_host;
  auto port = config.effectiveChannelPort();
  auto target = "/ws/" + urlEncode(clientId);
  return [host, port, target]() -> Result<std::unique_ptr<MessageChannel>> {
    auto channel = WebSocketChannel::connect(host, port, target);
    if (!channel)
      return Result<std::unique_ptr<MessageChannel>>::Error(channel.error());
    return Result<std::unique_ptr<MessageChannel>>::Ok(
        std::move(channel.value()));
  };
}

} // namespace

// Handles every channel message kind a client can receive.
struct InboundVisitor {
  const std::string &self;

  void operator()(const FileUpdatedMessage &) const {}
  void operator()(const FileDeletedMessage &) const {}
  void operator()(const ConnectAck &ack) const {
    if (ack.success)
      std::cout << "[Engine] Channel accepted by server (" << ack.server_time
                << ")" << std::endl;
    else
      std::cerr << "[Engine] Channel refused: " << ack.message << std::endl;
  }
  void operator()(const ConnectMessage &m) const {
    std::cerr << "[Engine] Unexpected connect request from " << m.client_id
              << std::endl;
  }
  void operator()(const HeartbeatMessage &) const {}
  void operator()(const FileChangedMessage &m) const {
    std::cout << "[Engine] Peer reported " << toString(m.operation) << " of "
              << m.file_info.path << std::endl;
  }
  void operator()(const ClientJoinedMessage &m) const {
    if (m.client_id != self)
      std::cout << "[Engine] Client joined: " << m.client_id << std::endl;
  }
  void operator()(const ClientLeftMessage &m) const {
    std::cout << "[Engine] Client left: " << m.client_id << std::endl;
  }
  void operator()(const ErrorMessage &m) const {
    std::cerr << "[Engine] Server error: " << m.error;
    if (!m.details.empty())
      std::cerr << " (" << m.details << ")";
    std::cerr << std::endl;
  }
  void operator()(const UnknownMessage &m) const {
    std::cerr << "[Engine] Dropping message of unknown type " << m.type
              << std::endl;
  }
};

SyncEngine::SyncEngine(ClientConfig config, MetricsSink &metrics)
    : SyncEngine(std::move(config), nullptr, metrics) {}

SyncEngine::SyncEngine(ClientConfig config,
                       ConnectionManager::Connector connector,
                       MetricsSink &metrics)
    : m_config(std::move(config)), m_metrics(metrics),
      m_clientId(makeClientId(m_config.client_name)) {
  m_transfers = std::make_unique<TransferManager>(
      m_config.server_host, m_config.server_port, m_config.sync_directory,
      m_clientId, transferOptions(m_config), m_metrics);

  if (!connector)
    connector = webSocketConnector(m_config, m_clientId);
  ConnectMessage hello{m_clientId, m_config.client_name,
                       m_config.sync_directory, m_config.api_key};
  m_connection = std::make_unique<ConnectionManager>(
      hello, std::move(connector), connectionOptions(m_config), m_metrics);
  m_connection->setMessageHandler(
      [this](const ChannelMessage &message) { onChannelMessage(message); });

  CoalescerOptions coalescing;
  coalescing.ignorePatterns = m_config.ignore_patterns;
  coalescing.baseDelay = std::chrono::milliseconds(m_config.debounce_ms);
  m_coalescer = std::make_unique<ChangeCoalescer>(
      m_config.sync_directory,
      [this](const LocalChange &change) { onLocalChange(change); }, coalescing,
      m_metrics);

  m_watcher = std::make_unique<FilesystemWatcher>(
      m_config.sync_directory,
      [this](const RawEvent &event) { m_coalescer->onEvent(event); });
}

SyncEngine::~SyncEngine() { stop(); }

std::string SyncEngine::makeClientId(const std::string &clientName) {
  return clientName + "_" + compactTimestamp();
}

Result<void> SyncEngine::start() {
  if (m_running)
    return Result<void>::Ok();

  ClientInfo self;
  self.client_id = m_clientId;
  self.name = m_config.client_name;
  self.sync_root = m_config.sync_directory;
  self.last_seen = nowMillis();
  auto registered = m_transfers->api().registerClient(self);
  if (!registered)
    return registered;
  std::cout << "[Engine] Registered as " << m_clientId << std::endl;

  {
    std::lock_guard<std::mutex> lock(m_inboundMutex);
    m_inbound = std::make_unique<ThreadPool>(1);
  }
  m_connection->start();
  m_coalescer->start();
  auto watching = m_watcher->start();
  if (!watching) {
    std::cerr << "[Engine] Local changes will not be detected: "
              << watching.error().describe() << std::endl;
  }
  m_running = true;
  return Result<void>::Ok();
}

void SyncEngine::stop() {
  if (!m_running)
    return;
  m_running = false;

  m_watcher->stop();
  m_coalescer->stop();
  m_connection->stop();

  std::unique_ptr<ThreadPool> inbound;
  {
    std::lock_guard<std::mutex> lock(m_inboundMutex);
    inbound = std::move(m_inbound);
  }
  inbound.reset(); // Drains queued remote changes
  std::cout << "[Engine] Stopped" << std::endl;
}

ConnectionStatus SyncEngine::connectionStatus() const {
  return m_connection->status();
}

Result<SyncReport> SyncEngine::performInitialSync() {
  ScopedTimer timer(m_metrics, "engine.initial_sync");

  ScanOptions scanOptions;
  scanOptions.ignorePatterns = m_config.ignore_patterns;
  scanOptions.workers = kScanWorkers;
  scanOptions.includeDirectories = false;
  FileSystemScanner scanner(m_config.sync_directory, scanOptions);
  auto localFiles = scanner.scanSyncPath();
  std::cout << "[Engine] Local manifest has " << localFiles.size() << " files"
            << std::endl;

  SyncRequest request;
  request.client_id = m_clientId;
  request.files = localFiles;
  request.sync_root = m_config.sync_directory;
  auto response = m_transfers->api().requestSync(request);
  if (!response)
    return Result<SyncReport>::Error(response.error());
  const auto &plan = response.value();

  SyncReport report;
  std::vector<std::string> pulls;
  std::map<std::string, std::string> expected;
  for (const auto &info : plan.files_to_pull) {
    if (!isSafeRelativePath(info.path)) {
      std::cerr << "[Engine] Ignoring unsafe server path " << info.path
                << std::endl;
      continue;
    }
    if (info.is_directory) {
      std::error_code ec;
      fs::create_directories(fs::path(m_config.sync_directory) / info.path, ec);
      if (ec)
        report.failed.push_back(
            {info.path, fromErrno(ec.value(), info.path, "mkdir")});
      continue;
    }
    if (shouldIgnore(info.path, m_config.ignore_patterns))
      continue;
    // Recorded before the download so the watcher's echo is recognised.
    rememberSynced(info.path, info.checksum);
    pulls.push_back(info.path);
    expected[info.path] = info.checksum;
  }

  auto downloads = m_transfers->downloadAll(pulls, expected);
  report.downloaded = downloads.succeeded;
  for (auto &failure : downloads.failed) {
    forgetSynced(failure.path);
    report.failed.push_back(std::move(failure));
  }

  std::vector<std::string> pushes;
  for (const auto &info : plan.files_to_push) {
    if (!info.is_directory)
      pushes.push_back(info.path);
  }
  auto uploads = m_transfers->uploadAll(pushes);
  report.uploaded = uploads.succeeded;
  for (auto &failure : uploads.failed)
    report.failed.push_back(std::move(failure));

  std::map<std::string, std::string> localChecksums;
  for (const auto &info : localFiles)
    localChecksums[info.path] = info.checksum;
  for (const auto &path : report.uploaded)
    rememberSynced(path, localChecksums[path]);

  report.conflicts = plan.conflicts;
  for (const auto &path : report.conflicts)
    std::cerr << "[Engine] Conflict: " << path
              << " is newer on the server, local copy left untouched"
              << std::endl;

  m_metrics.incrementCounter("engine.initial_sync.downloaded",
                             static_cast<int64_t>(report.downloaded.size()));
  m_metrics.incrementCounter("engine.initial_sync.uploaded",
                             static_cast<int64_t>(report.uploaded.size()));
  std::cout << "[Engine] Initial sync: " << report.downloaded.size()
            << " downloaded, " << report.uploaded.size() << " uploaded, "
            << report.conflicts.size() << " conflicts, "
            << report.failed.size() << " failed" << std::endl;
  return Result<SyncReport>::Ok(std::move(report));
}

void SyncEngine::onLocalChange(const LocalChange &change) {
  const auto &path = change.info.path;
  if (isEcho(change)) {
    m_metrics.incrementCounter("engine.echo_suppressed");
    return;
  }

  Result<void> result = Result<void>::Ok();
  switch (change.operation) {
  case SyncOperation::Create:
  case SyncOperation::Update:
    if (change.info.is_directory)
      return; // The server creates directories with their first file
    result = m_transfers->uploadFile(path,
                                     change.operation == SyncOperation::Update);
    break;
  case SyncOperation::Delete:
    if (change.old_path) {
      // Moved and then deleted before the move was committed.
      auto removed = m_transfers->deleteRemote(*change.old_path);
      if (!removed)
        std::cerr << "[Engine] " << removed.error().describe() << std::endl;
      forgetSynced(*change.old_path);
    }
    result = m_transfers->deleteRemote(path);
    break;
  case SyncOperation::Move:
    if (change.old_path) {
      auto removed = m_transfers->deleteRemote(*change.old_path);
      if (!removed)
        std::cerr << "[Engine] " << removed.error().describe() << std::endl;
      forgetSynced(*change.old_path);
    }
    if (change.info.is_directory)
      uploadDirectory(path);
    else
      result = m_transfers->uploadFile(path, false);
    break;
  }

  if (!result) {
    if (result.error().kind == ErrorKind::NotFound &&
        change.operation != SyncOperation::Delete) {
      std::cout << "[Engine] " << path << " vanished before upload" << std::endl;
      return;
    }
    std::cerr << "[Engine] " << toString(change.operation) << " of " << path
              << " failed: " << result.error().describe() << std::endl;
    m_metrics.incrementCounter("engine.local_change.failed");
    return;
  }

  if (change.operation == SyncOperation::Delete)
    forgetSynced(path);
  else if (!change.info.is_directory)
    rememberSynced(path, change.info.checksum);
  m_metrics.incrementCounter("engine.local_change",
                             1, {{"operation", toString(change.operation)}});
  announce(change);
}

void SyncEngine::uploadDirectory(const std::string &relativeDir) {
  ScanOptions scanOptions;
  scanOptions.ignorePatterns = m_config.ignore_patterns;
  scanOptions.includeDirectories = false;
  FileSystemScanner scanner(m_config.sync_directory, scanOptions);
  std::vector<std::string> paths;
  std::map<std::string, std::string> checksums;
  for (const auto &info : scanner.scanSyncPath(relativeDir)) {
    paths.push_back(info.path);
    checksums[info.path] = info.checksum;
  }
  auto report = m_transfers->uploadAll(paths);
  for (const auto &path : report.succeeded)
    rememberSynced(path, checksums[path]);
}

void SyncEngine::announce(const LocalChange &change) {
  FileChangedMessage message{change.operation, change.info, change.old_path};
  auto sent = m_connection->send(makeMessage(message, m_clientId));
  if (!sent)
    std::cout << "[Engine] Change of " << change.info.path
              << " not announced: " << sent.error().describe() << std::endl;
}

void SyncEngine::onChannelMessage(const ChannelMessage &message) {
  {
    std::lock_guard<std::mutex> lock(m_inboundMutex);
    if (m_inbound) {
      m_inbound->submit([this, message]() { applyInbound(message); });
      return;
    }
  }
  applyInbound(message);
}

void SyncEngine::applyInbound(const ChannelMessage &message) {
  if (auto *update = std::get_if<FileUpdatedMessage>(&message.payload)) {
    applyRemoteUpdate(*update);
  } else if (auto *removal = std::get_if<FileDeletedMessage>(&message.payload)) {
    applyRemoteDelete(*removal);
  } else {
    std::visit(InboundVisitor{m_clientId}, message.payload);
  }
}

void SyncEngine::applyRemoteUpdate(const FileUpdatedMessage &update) {
  const auto &path = update.file_path;
  if (update.client_id == m_clientId)
    return;
  if (!isSafeRelativePath(path) ||
      shouldIgnore(path, m_config.ignore_patterns)) {
    std::cerr << "[Engine] Ignoring update of " << path << std::endl;
    return;
  }

  auto local = fs::path(m_config.sync_directory) / path;
  if (!update.checksum.empty() && calculateHash(local.string()) == update.checksum) {
    rememberSynced(path, update.checksum);
    return;
  }

  rememberSynced(path, update.checksum);
  auto result = m_transfers->downloadFile(path, update.checksum);
  if (!result) {
    forgetSynced(path);
    std::cerr << "[Engine] Download of " << path << " failed: "
              << result.error().describe() << std::endl;
    m_metrics.incrementCounter("engine.remote_change.failed");
    return;
  }
  if (update.checksum.empty())
    rememberSynced(path, calculateHash(local.string()));
  std::cout << "[Engine] Applied " << toString(update.operation) << " of "
            << path << " from " << update.client_id << std::endl;
  m_metrics.incrementCounter("engine.remote_change",
                             1, {{"operation", toString(update.operation)}});
}

void SyncEngine::applyRemoteDelete(const FileDeletedMessage &removal) {
  const auto &path = removal.file_path;
  if (removal.client_id == m_clientId)
    return;
  if (!isSafeRelativePath(path)) {
    std::cerr << "[Engine] Ignoring delete of " << path << std::endl;
    return;
  }

  auto local = fs::path(m_config.sync_directory) / path;
  std::error_code ec;
  if (!fs::exists(fs::symlink_status(local, ec)))
    return;

  rememberSynced(path, "");
  if (fs::is_directory(local, ec))
    fs::remove_all(local, ec);
  else
    fs::remove(local, ec);
  if (ec) {
    forgetSynced(path);
    std::cerr << "[Engine] "
              << fromErrno(ec.value(), path, "delete").describe() << std::endl;
    return;
  }
  std::cout << "[Engine] Deleted " << path << " (removed by "
            << removal.client_id << ")" << std::endl;
  m_metrics.incrementCounter("engine.remote_change", 1,
                             {{"operation", "delete"}});
}

void SyncEngine::rememberSynced(const std::string &path,
                                const std::string &checksum) {
  std::lock_guard<std::mutex> lock(m_syncedMutex);
  m_synced[path] = checksum;
}

void SyncEngine::forgetSynced(const std::string &path) {
  std::lock_guard<std::mutex> lock(m_syncedMutex);
  m_synced.erase(path);
}

bool SyncEngine::isEcho(const LocalChange &change) {
  std::lock_guard<std::mutex> lock(m_syncedMutex);
  auto it = m_synced.find(change.info.path);
  if (it == m_synced.end())
    return false;

  switch (change.operation) {
  case SyncOperation::Create:
  case SyncOperation::Update:
    return !change.info.is_directory && !it->second.empty() &&
           it->second == change.info.checksum;
  case SyncOperation::Delete:
    if (it->second.empty()) {
      m_synced.erase(it);
      return true;
    }
    return false;
  case SyncOperation::Move:
    return false;
  }
  return false;
}

} // namespace filesync
