#pragma once

#include "Compressor.hpp"
#include "SyncError.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace filesync {

struct UploadForm {
  std::string relative_path;
  std::string client_id;
  CompressionType compression = CompressionType::None;
  uint64_t original_size = 0;
};

// Body reader for streamed uploads: fill buf with up to len bytes starting at
// offset, return the number of bytes written (0 at end of file) or -1 on error.
using UploadSource =
    std::function<long long(uint64_t offset, char *buf, size_t len)>;

struct DownloadOutcome {
  int status = 0;       // 200 or 206
  uint64_t written = 0; // Bytes written by this request
};

/**
 * ApiClient handles communication with the sync server.
 * Uses cpp-httplib for networking and nlohmann/json for serialization.
 */
class ApiClient {
public:
  ApiClient(const std::string &host, int port,
            std::chrono::seconds timeout = std::chrono::seconds(30));
  ~ApiClient();

  Result<void> health();
  Result<void> registerClient(const ClientInfo &client);
  Result<SyncResponse> requestSync(const SyncRequest &request);

  // In-memory payload, used when the body was compressed.
  Result<void> uploadBytes(const UploadForm &form, const std::string &payload);
  // Streams the body through source in chunkSize reads.
  Result<void> uploadStream(const UploadForm &form, UploadSource source,
                            size_t chunkSize);

  // Single GET of /download/<path>. With offset > 0 a Range request is made
  // and a 206 body is appended to partPath; a 200 body replaces it.
  Result<DownloadOutcome> downloadFile(const std::string &relativePath,
                                       const std::string &partPath,
                                       uint64_t offset);

  Result<void> deleteFile(const std::string &relativePath,
                          const std::string &clientId);

  Result<std::vector<FileChunk>> fetchSignature(const std::string &relativePath);
  Result<void> uploadDelta(const std::string &relativePath,
                           const std::string &clientId,
                           const std::string &expectedChecksum,
                           const FileDelta &delta);

  Result<std::vector<HistoryRecord>> history(const std::string &path = "",
                                             size_t limit = 100);
  Result<std::vector<ConflictReport>> conflicts();
  Result<std::vector<ClientInfo>> clients();

  const std::string &host() const { return m_host; }
  int port() const { return m_port; }

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::string m_host;
  int m_port;
};

// Percent-encodes every byte except unreserved characters and '/'.
std::string encodeUrlPath(const std::string &path);
std::string urlEncode(const std::string &value);

} // namespace filesync
