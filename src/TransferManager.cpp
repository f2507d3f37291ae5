#include "TransferManager.hpp"
#include "Compressor.hpp"
#include "PathUtils.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;

namespace filesync {

namespace {

constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * KiB;
constexpr double kMaxDeltaRatio = 0.9;

// Server statuses that map onto local error kinds.
SyncError classifyServerError(SyncError error) {
  if (error.kind != ErrorKind::Server)
    return error;
  if (error.status_code == 403)
    error.kind = ErrorKind::Permission;
  else if (error.status_code == 507)
    error.kind = ErrorKind::DiskSpace;
  return error;
}

} // namespace

TransferManager::TransferManager(std::string host, int port,
                                 std::string syncDirectory, std::string clientId,
                                 TransferOptions options, MetricsSink &metrics)
    : m_host(std::move(host)), m_port(port),
      m_syncDirectory(std::move(syncDirectory)), m_clientId(std::move(clientId)),
      m_options(options), m_metrics(metrics),
      m_api(std::make_unique<ApiClient>(m_host, m_port, m_options.timeout)) {}

TransferManager::~TransferManager() = default;

size_t TransferManager::adaptiveChunkSize(uint64_t fileSize) {
  if (fileSize < 1 * MiB)
    return 8 * KiB;
  if (fileSize < 10 * MiB)
    return 32 * KiB;
  if (fileSize < 100 * MiB)
    return 64 * KiB;
  return 128 * KiB;
}

Result<void> TransferManager::uploadFile(const std::string &relativePath,
                                         bool serverHasCopy) {
  return uploadWith(*m_api, relativePath, serverHasCopy);
}

Result<void> TransferManager::downloadFile(const std::string &relativePath,
                                           const std::string &expectedChecksum) {
  return downloadWith(*m_api, relativePath, expectedChecksum);
}

Result<void> TransferManager::deleteRemote(const std::string &relativePath) {
  auto result = m_api->deleteFile(normalizePath(relativePath), m_clientId);
  if (!result)
    return Result<void>::Error(classifyServerError(result.error()));
  m_metrics.incrementCounter("transfer.delete");
  return result;
}

Result<void> TransferManager::uploadWith(ApiClient &api,
                                         const std::string &relativePath,
                                         bool serverHasCopy) {
  auto rel = normalizePath(relativePath);
  auto absPath = (fs::path(m_syncDirectory) / rel).string();
  ScopedTimer timer(m_metrics, "transfer.upload");

  std::error_code ec;
  auto status = fs::status(absPath, ec);
  if (ec || !fs::exists(status) || fs::is_directory(status))
    return Result<void>::Error(SyncError::notFound(rel, "upload"));

  auto size = fs::file_size(absPath, ec);
  if (ec)
    return Result<void>::Error(fromErrno(ec.value(), rel, "upload"));

  if (serverHasCopy && m_options.enableDifferential &&
      DeltaEngine::shouldUseDifferential(size)) {
    auto diff = uploadDifferential(api, rel, absPath);
    if (diff)
      return diff;
    std::cerr << "[Transfer] Differential upload of " << rel
              << " failed, sending full file: " << diff.error().describe()
              << std::endl;
  }

  errno = 0;
  std::FILE *file = std::fopen(absPath.c_str(), "rb");
  if (!file)
    return Result<void>::Error(fromErrno(errno != 0 ? errno : EIO, rel, "upload"));
  std::unique_ptr<std::FILE, int (*)(std::FILE *)> guard(file, &std::fclose);

  UploadForm form;
  form.relative_path = rel;
  form.client_id = m_clientId;
  form.original_size = size;

  Result<void> sent = Result<void>::Ok();
  if (m_options.enableCompression && size <= m_options.maxInMemoryCompression &&
      Compressor::shouldCompress(size, rel)) {
    std::string content(size, '\0');
    if (size > 0 && std::fread(&content[0], 1, size, file) != size)
      return Result<void>::Error(
          fromErrno(errno != 0 ? errno : EIO, rel, "upload"));

    auto payload = Compressor::chooseBestCompression(content);
    form.compression = payload.type;
    m_metrics.recordHistogram(
        "transfer.compression_ratio",
        Compressor::compressionRatio(size, payload.data.size()),
        {{"type", toString(payload.type)}});
    sent = api.uploadBytes(form, payload.data);
  } else {
    int readErrno = 0;
    auto source = [&](uint64_t offset, char *buf, size_t len) -> long long {
      if (fseeko(file, static_cast<off_t>(offset), SEEK_SET) != 0) {
        readErrno = errno;
        return -1;
      }
      auto got = std::fread(buf, 1, len, file);
      if (got < len && std::ferror(file)) {
        readErrno = errno;
        return -1;
      }
      return static_cast<long long>(got);
    };
    sent = api.uploadStream(form, source, adaptiveChunkSize(size));
    if (!sent && readErrno != 0)
      return Result<void>::Error(fromErrno(readErrno, rel, "upload"));
  }

  if (!sent) {
    m_metrics.incrementCounter("transfer.upload.failed");
    auto error = classifyServerError(sent.error());
    if (error.path.empty())
      error.path = rel;
    if (error.operation.empty())
      error.operation = "upload";
    return Result<void>::Error(error);
  }

  m_metrics.incrementCounter("transfer.upload.bytes", static_cast<int64_t>(size));
  std::cout << "[Transfer] Uploaded " << rel << " (" << size << " bytes, "
            << toString(form.compression) << ")" << std::endl;
  return sent;
}

Result<void> TransferManager::uploadDifferential(ApiClient &api,
                                                 const std::string &rel,
                                                 const std::string &absPath) {
  auto signature = api.fetchSignature(rel);
  if (!signature)
    return Result<void>::Error(signature.error());

  auto delta = m_delta.createDelta(absPath, signature.value());
  if (delta.compression_ratio >= kMaxDeltaRatio)
    return Result<void>::Error(SyncError::fileOperation(
        "delta too large to be worth sending", rel, "delta",
        std::to_string(delta.compression_ratio)));

  auto checksum = calculateHash(absPath);
  if (checksum.empty())
    return Result<void>::Error(
        SyncError::fileOperation("cannot hash file", rel, "delta"));

  auto sent = api.uploadDelta(rel, m_clientId, checksum, delta);
  if (!sent)
    return sent;

  auto savings = DeltaEngine::calculateTransferSavings(delta);
  m_metrics.incrementCounter("transfer.delta.bytes_saved",
                             static_cast<int64_t>(savings.unchanged_size));
  std::cout << "[Transfer] Sent delta for " << rel << " ("
            << savings.savings_percent << "% saved)" << std::endl;
  return sent;
}

Result<void> TransferManager::downloadWith(ApiClient &api,
                                           const std::string &relativePath,
                                           const std::string &expectedChecksum) {
  auto rel = normalizePath(relativePath);
  if (!isSafeRelativePath(rel))
    return Result<void>::Error(
        SyncError::fileOperation("unsafe path", rel, "download"));

  ScopedTimer timer(m_metrics, "transfer.download");
  fs::path target = fs::path(m_syncDirectory) / rel;
  std::string part = target.string() + kPartialSuffix;

  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    return Result<void>::Error(fromErrno(ec.value(), rel, "download"));

  // A partial body is only resumed when the finished file can be checked.
  uint64_t offset = 0;
  if (fs::exists(part, ec)) {
    if (expectedChecksum.empty()) {
      fs::remove(part, ec);
    } else {
      offset = fs::file_size(part, ec);
      if (ec)
        offset = 0;
    }
  }

  auto outcome = api.downloadFile(rel, part, offset);
  if (!outcome && offset > 0 && outcome.error().status_code == 416) {
    std::cout << "[Transfer] Range rejected for " << rel
              << ", restarting from zero" << std::endl;
    fs::remove(part, ec);
    outcome = api.downloadFile(rel, part, 0);
  }

  bool resumed = outcome && outcome.value().status == 206;
  if (resumed && calculateHash(part) != expectedChecksum) {
    std::cerr << "[Transfer] Resumed " << rel
              << " does not match its checksum, fetching it whole" << std::endl;
    m_metrics.incrementCounter("transfer.download.checksum_mismatch");
    fs::remove(part, ec);
    resumed = false;
    outcome = api.downloadFile(rel, part, 0);
  }

  if (!outcome) {
    if (outcome.error().kind == ErrorKind::NotFound)
      fs::remove(part, ec);
    m_metrics.incrementCounter("transfer.download.failed");
    return Result<void>::Error(classifyServerError(outcome.error()));
  }

  if (resumed)
    m_metrics.incrementCounter("transfer.download.resumed");

  fs::rename(part, target, ec);
  if (ec)
    return Result<void>::Error(fromErrno(ec.value(), rel, "download"));

  m_metrics.incrementCounter("transfer.download.bytes",
                             static_cast<int64_t>(outcome.value().written));
  std::cout << "[Transfer] Downloaded " << rel << std::endl;
  return Result<void>::Ok();
}

BatchReport TransferManager::runBatch(const std::vector<std::string> &paths,
                                      size_t concurrency,
                                      const std::string &kind,
                                      const Task &task) {
  BatchReport report;
  if (paths.empty())
    return report;

  std::mutex reportMutex;
  std::atomic<size_t> next{0};
  size_t workers = std::max<size_t>(1, std::min(concurrency, paths.size()));

  // One HTTP client per worker; httplib serializes requests per client.
  auto worker = [&]() {
    ApiClient api(m_host, m_port, m_options.timeout);
    for (;;) {
      size_t i = next.fetch_add(1);
      if (i >= paths.size())
        return;
      auto result = task(api, paths[i]);
      std::lock_guard<std::mutex> lock(reportMutex);
      if (result) {
        report.succeeded.push_back(paths[i]);
      } else {
        std::cerr << "[Transfer] " << kind << " failed: "
                  << result.error().describe() << std::endl;
        report.failed.push_back({paths[i], result.error()});
      }
    }
  };

  std::vector<std::thread> threads;
  for (size_t i = 0; i < workers; ++i)
    threads.emplace_back(worker);
  for (auto &t : threads)
    t.join();
  return report;
}

BatchReport TransferManager::uploadAll(const std::vector<std::string> &paths,
                                       const std::set<std::string> &serverHas) {
  return runBatch(paths, m_options.maxConcurrentUploads, "upload",
                  [this, &serverHas](ApiClient &api, const std::string &path) {
                    return uploadWith(api, path, serverHas.count(path) > 0);
                  });
}

BatchReport
TransferManager::downloadAll(const std::vector<std::string> &paths,
                             const std::map<std::string, std::string> &checksums) {
  return runBatch(paths, m_options.maxConcurrentDownloads, "download",
                  [this, &checksums](ApiClient &api, const std::string &path) {
                    auto known = checksums.find(path);
                    return downloadWith(api, path,
                                        known != checksums.end() ? known->second
                                                                 : std::string());
                  });
}

} // namespace filesync
