#pragma once

#include "ApiClient.hpp"
#include "DeltaEngine.hpp"
#include "Metrics.hpp"
#include "SyncError.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace filesync {

struct TransferOptions {
  bool enableCompression = true;
  bool enableDifferential = true;
  size_t maxConcurrentUploads = 3;
  size_t maxConcurrentDownloads = 3;
  uint64_t maxInMemoryCompression = 64ull * 1024 * 1024;
  std::chrono::seconds timeout = std::chrono::seconds(30);
};

struct TransferFailure {
  std::string path;
  SyncError error;
};

struct BatchReport {
  std::vector<std::string> succeeded;
  std::vector<TransferFailure> failed;

  bool ok() const { return failed.empty(); }
};

/**
 * TransferManager moves file bodies between the sync directory and the
 * server: streamed or compressed uploads, differential uploads against the
 * server's chunk signature, and resumable downloads through a partial file.
 */
class TransferManager {
public:
  TransferManager(std::string host, int port, std::string syncDirectory,
                  std::string clientId, TransferOptions options = {},
                  MetricsSink &metrics = defaultMetrics());
  ~TransferManager();

  static size_t adaptiveChunkSize(uint64_t fileSize);

  // serverHasCopy enables the differential path for large files.
  Result<void> uploadFile(const std::string &relativePath,
                          bool serverHasCopy = false);
  // A leftover partial file is resumed only when expectedChecksum is given;
  // a resumed body that does not hash to it is fetched again from zero.
  Result<void> downloadFile(const std::string &relativePath,
                            const std::string &expectedChecksum = "");
  Result<void> deleteRemote(const std::string &relativePath);

  BatchReport uploadAll(const std::vector<std::string> &paths,
                        const std::set<std::string> &serverHas = {});
  // checksums maps paths to their expected content hash.
  BatchReport downloadAll(const std::vector<std::string> &paths,
                          const std::map<std::string, std::string> &checksums = {});

  ApiClient &api() { return *m_api; }
  const std::string &clientId() const { return m_clientId; }

private:
  using Task = std::function<Result<void>(ApiClient &, const std::string &)>;

  Result<void> uploadWith(ApiClient &api, const std::string &relativePath,
                          bool serverHasCopy);
  Result<void> uploadDifferential(ApiClient &api,
                                  const std::string &relativePath,
                                  const std::string &absPath);
  Result<void> downloadWith(ApiClient &api, const std::string &relativePath,
                            const std::string &expectedChecksum);
  BatchReport runBatch(const std::vector<std::string> &paths,
                       size_t concurrency, const std::string &kind,
                       const Task &task);

  std::string m_host;
  int m_port;
  std::string m_syncDirectory;
  std::string m_clientId;
  TransferOptions m_options;
  MetricsSink &m_metrics;
  DeltaEngine m_delta;
  std::unique_ptr<ApiClient> m_api;
};

} // namespace filesync
