#include "MetadataStore.hpp"
#include "FileSystemScanner.hpp"
#include "PathUtils.hpp"
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;
namespace fs = std::filesystem;

namespace filesync {

namespace {

struct FileRow {
  std::string path;
  int64_t size = 0;
  std::string checksum;
  int64_t modified_time = 0;
  bool is_directory = false;
  int64_t updated_at = 0;
};

FileRow toRow(const FileInfo &info) {
  FileRow row;
  row.path = normalizePath(info.path);
  row.size = static_cast<int64_t>(info.size);
  row.checksum = info.checksum;
  row.modified_time = info.modified_time;
  row.is_directory = info.is_directory;
  row.updated_at = nowMillis();
  return row;
}

FileInfo fromRow(const FileRow &row) {
  FileInfo info;
  info.path = row.path;
  info.size = static_cast<uint64_t>(row.size);
  info.checksum = row.checksum;
  info.modified_time = row.modified_time;
  info.is_directory = row.is_directory;
  return info;
}

inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_index("idx_file_metadata_modified_time", &FileRow::modified_time),
      make_index("idx_sync_history_file_path", &HistoryRecord::file_path),
      make_index("idx_sync_history_client_id", &HistoryRecord::client_id),
      make_index("idx_sync_history_timestamp", &HistoryRecord::timestamp),
      make_table<FileRow>(
          "file_metadata",
          make_column("path", &FileRow::path, primary_key()),
          make_column("size", &FileRow::size),
          make_column("checksum", &FileRow::checksum),
          make_column("modified_time", &FileRow::modified_time),
          make_column("is_directory", &FileRow::is_directory),
          make_column("updated_at", &FileRow::updated_at)),
      make_table<HistoryRecord>(
          "sync_history",
          make_column("id", &HistoryRecord::id, primary_key().autoincrement()),
          make_column("file_path", &HistoryRecord::file_path),
          make_column("operation", &HistoryRecord::operation),
          make_column("client_id", &HistoryRecord::client_id),
          make_column("timestamp", &HistoryRecord::timestamp),
          make_column("checksum", &HistoryRecord::checksum),
          make_column("size", &HistoryRecord::size)));
}

using Storage = decltype(create_storage_impl(""));

bool isBelow(const std::string &path, const std::string &base) {
  if (base.empty())
    return true;
  if (path == base)
    return true;
  return path.size() > base.size() && path.compare(0, base.size(), base) == 0 &&
         path[base.size()] == '/';
}

} // namespace

struct MetadataStore::Impl {
  std::vector<std::unique_ptr<Storage>> pool;
  std::vector<Storage *> idle;
  std::mutex poolMutex;
  std::condition_variable poolCv;

  // Row writers hold it exclusively and cache fills hold it shared, so a
  // cached entry is never older than the row it mirrors.
  std::shared_mutex rowMutex;

  mutable std::mutex cacheMutex;
  std::map<std::string, std::pair<FileInfo, std::chrono::steady_clock::time_point>>
      cache;

  // Returns a connection to the pool when it goes out of scope.
  class Lease {
  public:
    explicit Lease(Impl &impl) : m_impl(impl) {
      std::unique_lock<std::mutex> lock(m_impl.poolMutex);
      if (m_impl.pool.empty())
        throw std::runtime_error("metadata store is not open");
      m_impl.poolCv.wait(lock, [this]() { return !m_impl.idle.empty(); });
      m_storage = m_impl.idle.back();
      m_impl.idle.pop_back();
    }
    ~Lease() {
      {
        std::lock_guard<std::mutex> lock(m_impl.poolMutex);
        m_impl.idle.push_back(m_storage);
      }
      m_impl.poolCv.notify_one();
    }
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    Storage &operator*() { return *m_storage; }
    Storage *operator->() { return m_storage; }

  private:
    Impl &m_impl;
    Storage *m_storage = nullptr;
  };
};

MetadataStore::MetadataStore(std::string syncDirectory,
                             MetadataStoreOptions options, MetricsSink &metrics)
    : m_impl(std::make_unique<Impl>()),
      m_syncDirectory(std::move(syncDirectory)), m_options(std::move(options)),
      m_metrics(metrics) {
  if (m_options.dbPath.empty())
    m_options.dbPath = (fs::path(m_syncDirectory) / "metadata.db").string();
  if (m_options.poolSize == 0)
    m_options.poolSize = 1;
}

MetadataStore::~MetadataStore() = default;

Result<void> MetadataStore::open() {
  try {
    std::error_code ec;
    fs::create_directories(m_syncDirectory, ec);
    auto parent = fs::path(m_options.dbPath).parent_path();
    if (!parent.empty())
      fs::create_directories(parent, ec);

    std::lock_guard<std::mutex> lock(m_impl->poolMutex);
    if (!m_impl->pool.empty())
      return Result<void>::Ok();

    for (size_t i = 0; i < m_options.poolSize; ++i) {
      auto storage = std::make_unique<Storage>(
          create_storage_impl(m_options.dbPath));
      storage->open_forever();
      storage->busy_timeout(5000);
      if (i == 0) {
        storage->pragma.journal_mode(journal_mode::WAL);
        storage->sync_schema();
      }
      storage->pragma.synchronous(1);
      m_impl->idle.push_back(storage.get());
      m_impl->pool.push_back(std::move(storage));
    }
    std::cout << "[Store] Opened " << m_options.dbPath << " with "
              << m_options.poolSize << " connections" << std::endl;
    return Result<void>::Ok();
  } catch (const std::exception &e) {
    m_impl->idle.clear();
    m_impl->pool.clear();
    return Result<void>::Error(SyncError::database("open", e.what()));
  }
}

void MetadataStore::cachePut(const FileInfo &info) {
  std::lock_guard<std::mutex> lock(m_impl->cacheMutex);
  m_impl->cache[info.path] = {info, std::chrono::steady_clock::now()};
}

std::optional<FileInfo> MetadataStore::cacheGet(const std::string &path) {
  std::lock_guard<std::mutex> lock(m_impl->cacheMutex);
  auto it = m_impl->cache.find(path);
  if (it == m_impl->cache.end())
    return std::nullopt;
  if (std::chrono::steady_clock::now() - it->second.second >= m_options.cacheTtl) {
    m_impl->cache.erase(it);
    return std::nullopt;
  }
  return it->second.first;
}

Result<void> MetadataStore::upsert(const FileInfo &info) {
  ScopedTimer timer(m_metrics, "store.upsert");
  auto row = toRow(info);
  std::unique_lock<std::shared_mutex> writing(m_impl->rowMutex);
  try {
    Impl::Lease storage(*m_impl);
    storage->replace(row);
  } catch (const std::exception &e) {
    invalidate(row.path);
    return Result<void>::Error(SyncError::database("upsert " + row.path, e.what()));
  }
  cachePut(fromRow(row));
  return Result<void>::Ok();
}

Result<void> MetadataStore::batchUpsert(const std::vector<FileInfo> &infos) {
  if (infos.empty())
    return Result<void>::Ok();

  ScopedTimer timer(m_metrics, "store.batch_upsert");
  std::vector<FileRow> rows;
  rows.reserve(infos.size());
  for (const auto &info : infos)
    rows.push_back(toRow(info));

  std::unique_lock<std::shared_mutex> writing(m_impl->rowMutex);
  try {
    Impl::Lease storage(*m_impl);
    auto guard = storage->transaction_guard();
    for (const auto &row : rows)
      storage->replace(row);
    guard.commit();
  } catch (const std::exception &e) {
    for (const auto &row : rows)
      invalidate(row.path);
    return Result<void>::Error(SyncError::database("batch upsert", e.what()));
  }

  for (const auto &row : rows)
    cachePut(fromRow(row));
  writing.unlock();
  m_metrics.recordHistogram("store.batch_size", static_cast<double>(rows.size()));
  return Result<void>::Ok();
}

Result<std::optional<FileInfo>> MetadataStore::get(const std::string &path) {
  auto key = normalizePath(path);
  if (auto cached = cacheGet(key)) {
    m_metrics.incrementCounter("store.cache_hit");
    return Result<std::optional<FileInfo>>::Ok(cached);
  }
  m_metrics.incrementCounter("store.cache_miss");

  std::shared_lock<std::shared_mutex> reading(m_impl->rowMutex);
  std::optional<FileRow> row;
  try {
    Impl::Lease storage(*m_impl);
    row = storage->get_optional<FileRow>(key);
  } catch (const std::exception &e) {
    return Result<std::optional<FileInfo>>::Error(
        SyncError::database("get " + key, e.what()));
  }

  if (!row)
    return Result<std::optional<FileInfo>>::Ok(std::nullopt);
  auto info = fromRow(*row);
  cachePut(info);
  return Result<std::optional<FileInfo>>::Ok(info);
}

Result<void> MetadataStore::remove(const std::string &path) {
  auto key = normalizePath(path);
  std::unique_lock<std::shared_mutex> writing(m_impl->rowMutex);
  try {
    Impl::Lease storage(*m_impl);
    storage->remove_all<FileRow>(where(c(&FileRow::path) == key));
  } catch (const std::exception &e) {
    invalidate(key);
    return Result<void>::Error(SyncError::database("remove " + key, e.what()));
  }
  invalidate(key);
  return Result<void>::Ok();
}

std::vector<std::string> MetadataStore::databaseFileNames() const {
  auto rel = toRelativePath(fs::path(m_options.dbPath), fs::path(m_syncDirectory));
  return {rel, rel + "-wal", rel + "-shm", rel + "-journal"};
}

Result<std::vector<FileInfo>> MetadataStore::list(const std::string &basePath,
                                                  bool useCache) {
  ScopedTimer timer(m_metrics, "store.list");
  auto base = normalizePath(basePath);

  if (useCache) {
    try {
      Impl::Lease storage(*m_impl);
      auto rows = storage->get_all<FileRow>(order_by(&FileRow::path));
      if (!rows.empty()) {
        std::vector<FileInfo> result;
        for (const auto &row : rows) {
          if (isBelow(row.path, base))
            result.push_back(fromRow(row));
        }
        return Result<std::vector<FileInfo>>::Ok(std::move(result));
      }
    } catch (const std::exception &e) {
      return Result<std::vector<FileInfo>>::Error(
          SyncError::database("list", e.what()));
    }
  }

  ScanOptions scanOptions;
  scanOptions.ignorePatterns = m_options.ignorePatterns;
  scanOptions.excludedFiles = databaseFileNames();
  scanOptions.workers = m_options.scanWorkers;
  FileSystemScanner scanner(m_syncDirectory, scanOptions);
  auto files = scanner.scanSyncPath(base);
  std::cout << "[Store] Scanned " << files.size() << " entries from "
            << m_syncDirectory << std::endl;

  auto persisted = batchUpsert(files);
  if (!persisted)
    return Result<std::vector<FileInfo>>::Error(persisted.error());
  return Result<std::vector<FileInfo>>::Ok(std::move(files));
}

Result<void> MetadataStore::logOperation(const std::string &path,
                                         SyncOperation op,
                                         const std::string &clientId,
                                         const std::string &checksum,
                                         int64_t size) {
  HistoryRecord record;
  record.file_path = normalizePath(path);
  record.operation = toString(op);
  record.client_id = clientId;
  record.timestamp = nowMillis();
  record.checksum = checksum;
  record.size = size;

  try {
    Impl::Lease storage(*m_impl);
    storage->insert(record);
  } catch (const std::exception &e) {
    return Result<void>::Error(
        SyncError::database("log " + record.operation + " " + record.file_path,
                            e.what()));
  }
  m_metrics.incrementCounter("store.history_records",
                             1, {{"operation", record.operation}});
  return Result<void>::Ok();
}

Result<std::vector<HistoryRecord>>
MetadataStore::history(const std::string &path, size_t limitCount) {
  auto key = normalizePath(path);
  try {
    Impl::Lease storage(*m_impl);
    auto order = multi_order_by(order_by(&HistoryRecord::timestamp).desc(),
                                order_by(&HistoryRecord::id).desc());
    if (key.empty()) {
      return Result<std::vector<HistoryRecord>>::Ok(storage->get_all<HistoryRecord>(
          order, limit(static_cast<int>(limitCount))));
    }
    return Result<std::vector<HistoryRecord>>::Ok(storage->get_all<HistoryRecord>(
        where(c(&HistoryRecord::file_path) == key), order,
        limit(static_cast<int>(limitCount))));
  } catch (const std::exception &e) {
    return Result<std::vector<HistoryRecord>>::Error(
        SyncError::database("history", e.what()));
  }
}

Result<std::vector<ConflictReport>>
MetadataStore::conflicts(std::chrono::milliseconds window) {
  std::map<std::string, std::set<std::string>> writers;
  try {
    Impl::Lease storage(*m_impl);
    auto cutoff = nowMillis() - window.count();
    auto recent = storage->get_all<HistoryRecord>(
        where(c(&HistoryRecord::timestamp) > cutoff));
    for (const auto &record : recent) {
      if (record.operation == "create" || record.operation == "update")
        writers[record.file_path].insert(record.client_id);
    }
  } catch (const std::exception &e) {
    return Result<std::vector<ConflictReport>>::Error(
        SyncError::database("conflicts", e.what()));
  }

  std::vector<ConflictReport> reports;
  for (const auto &[path, clients] : writers) {
    if (clients.size() < 2)
      continue;
    auto recent = history(path, 10);
    if (!recent)
      return Result<std::vector<ConflictReport>>::Error(recent.error());
    reports.push_back({path, std::move(recent.value())});
  }
  return Result<std::vector<ConflictReport>>::Ok(std::move(reports));
}

Result<size_t> MetadataStore::cleanupDeleted() {
  std::vector<std::string> gone;
  std::unique_lock<std::shared_mutex> writing(m_impl->rowMutex);
  try {
    Impl::Lease storage(*m_impl);
    auto paths = storage->select(&FileRow::path);
    for (const auto &path : paths) {
      std::error_code ec;
      if (!fs::exists(fullPath(path), ec))
        gone.push_back(path);
    }
    if (!gone.empty()) {
      auto guard = storage->transaction_guard();
      for (const auto &path : gone)
        storage->remove_all<FileRow>(where(c(&FileRow::path) == path));
      guard.commit();
    }
  } catch (const std::exception &e) {
    return Result<size_t>::Error(SyncError::database("cleanup", e.what()));
  }

  for (const auto &path : gone)
    invalidate(path);
  writing.unlock();
  if (!gone.empty())
    std::cout << "[Store] Removed " << gone.size() << " stale entries"
              << std::endl;
  return Result<size_t>::Ok(gone.size());
}

void MetadataStore::invalidate(const std::string &path) {
  std::lock_guard<std::mutex> lock(m_impl->cacheMutex);
  m_impl->cache.erase(normalizePath(path));
}

void MetadataStore::clearCache() {
  std::lock_guard<std::mutex> lock(m_impl->cacheMutex);
  m_impl->cache.clear();
}

CacheStats MetadataStore::cacheStats() const {
  std::lock_guard<std::mutex> lock(m_impl->cacheMutex);
  CacheStats stats;
  auto now = std::chrono::steady_clock::now();
  stats.total_entries = m_impl->cache.size();
  for (const auto &entry : m_impl->cache) {
    if (now - entry.second.second >= m_options.cacheTtl)
      ++stats.expired_entries;
  }
  stats.active_entries = stats.total_entries - stats.expired_entries;
  return stats;
}

fs::path MetadataStore::fullPath(const std::string &relativePath) const {
  return fs::path(m_syncDirectory) / normalizePath(relativePath);
}

} // namespace filesync
