#pragma once

#include "Metrics.hpp"
#include "SyncError.hpp"
#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace filesync {

struct MetadataStoreOptions {
  std::string dbPath; // Defaults to <syncDirectory>/metadata.db
  size_t poolSize = 10;
  std::chrono::milliseconds cacheTtl = std::chrono::seconds(300);
  size_t scanWorkers = 4;
  std::vector<std::string> ignorePatterns;
};

/**
 * MetadataStore is the server's manifest and sync history.
 *
 * Rows live in SQLite (tables file_metadata and sync_history) behind a fixed
 * pool of connections; callers block when every connection is leased. Reads
 * of single entries go through an in-process TTL cache which can be dropped
 * at any time.
 */
class MetadataStore {
public:
  MetadataStore(std::string syncDirectory, MetadataStoreOptions options = {},
                MetricsSink &metrics = defaultMetrics());
  ~MetadataStore();

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  // Creates the schema and opens the pool. Must succeed before any other call.
  Result<void> open();

  Result<void> upsert(const FileInfo &info);
  Result<void> batchUpsert(const std::vector<FileInfo> &infos);
  Result<std::optional<FileInfo>> get(const std::string &path);
  Result<void> remove(const std::string &path);

  // Stored rows below basePath. Falls back to scanning the sync directory
  // (and persisting the result) when nothing is stored or useCache is false.
  Result<std::vector<FileInfo>> list(const std::string &basePath = "",
                                     bool useCache = true);

  Result<void> logOperation(const std::string &path, SyncOperation op,
                            const std::string &clientId,
                            const std::string &checksum = "",
                            int64_t size = 0);
  Result<std::vector<HistoryRecord>> history(const std::string &path = "",
                                             size_t limit = 100);
  Result<std::vector<ConflictReport>>
  conflicts(std::chrono::milliseconds window = std::chrono::hours(1));

  // Drops rows whose file is gone from disk. Returns the number removed.
  Result<size_t> cleanupDeleted();

  void invalidate(const std::string &path);
  void clearCache();
  CacheStats cacheStats() const;

  std::filesystem::path fullPath(const std::string &relativePath) const;
  const std::string &syncDirectory() const { return m_syncDirectory; }
  const std::string &dbPath() const { return m_options.dbPath; }
  // The database and its journal files, relative to the sync directory.
  std::vector<std::string> databaseFileNames() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::string m_syncDirectory;
  MetadataStoreOptions m_options;
  MetricsSink &m_metrics;

  void cachePut(const FileInfo &info);
  std::optional<FileInfo> cacheGet(const std::string &path);
};

} // namespace filesync
