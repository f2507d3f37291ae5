#pragma once

#include "ChangeCoalescer.hpp"
#include "Config.hpp"
#include "ConnectionManager.hpp"
#include "FilesystemWatcher.hpp"
#include "Metrics.hpp"
#include "Protocol.hpp"
#include "SyncError.hpp"
#include "ThreadPool.hpp"
#include "TransferManager.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace filesync {

struct SyncReport {
  std::vector<std::string> uploaded;
  std::vector<std::string> downloaded;
  std::vector<std::string> conflicts; // Left untouched; the server copy is newer
  std::vector<TransferFailure> failed;

  bool ok() const { return failed.empty(); }
};

/**
 * SyncEngine keeps one local directory in step with the server.
 *
 * Local edits arrive from the watcher through the coalescer and are pushed
 * over HTTP, then announced on the channel. Changes announced by other
 * clients are applied on a single inbound worker so they land in order.
 * Files written by the engine itself are remembered by checksum and not sent
 * back when the watcher reports them.
 */
class SyncEngine {
public:
  explicit SyncEngine(ClientConfig config,
                      MetricsSink &metrics = defaultMetrics());
  // Uses connector instead of a WebSocket to the configured server.
  SyncEngine(ClientConfig config, ConnectionManager::Connector connector,
             MetricsSink &metrics = defaultMetrics());
  ~SyncEngine();

  SyncEngine(const SyncEngine &) = delete;
  SyncEngine &operator=(const SyncEngine &) = delete;

  // "<name>_<YYYYmmdd_HHMMSS>"
  static std::string makeClientId(const std::string &clientName);

  // Registers over HTTP, then starts the channel, the coalescer and the
  // filesystem watcher.
  Result<void> start();
  void stop();

  Result<SyncReport> performInitialSync();

  void onLocalChange(const LocalChange &change);
  // Queues the message for the inbound worker (or handles it inline when the
  // engine is not started).
  void onChannelMessage(const ChannelMessage &message);

  const std::string &clientId() const { return m_clientId; }
  const ClientConfig &config() const { return m_config; }
  ConnectionStatus connectionStatus() const;
  TransferManager &transfers() { return *m_transfers; }

private:
  void applyInbound(const ChannelMessage &message);
  void applyRemoteUpdate(const FileUpdatedMessage &update);
  void applyRemoteDelete(const FileDeletedMessage &removal);
  void announce(const LocalChange &change);
  void uploadDirectory(const std::string &relativeDir);

  void rememberSynced(const std::string &path, const std::string &checksum);
  void forgetSynced(const std::string &path);
  // True when the change only reflects something the engine just applied.
  bool isEcho(const LocalChange &change);

  ClientConfig m_config;
  MetricsSink &m_metrics;
  std::string m_clientId;

  std::unique_ptr<TransferManager> m_transfers;
  std::unique_ptr<ConnectionManager> m_connection;
  std::unique_ptr<ChangeCoalescer> m_coalescer;
  std::unique_ptr<FilesystemWatcher> m_watcher;

  std::mutex m_inboundMutex;
  std::unique_ptr<ThreadPool> m_inbound;

  std::mutex m_syncedMutex;
  // path -> checksum last known to match the server ("" after a remote delete)
  std::map<std::string, std::string> m_synced;

  bool m_running = false;
};

} // namespace filesync
