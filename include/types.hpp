#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace filesync {

enum class SyncOperation { Create, Update, Delete, Move };

std::string toString(SyncOperation op);
std::optional<SyncOperation> parseSyncOperation(const std::string &value);

struct FileInfo {
  std::string path; // Relative to the sync root, forward slashes (e.g. "docs/a.txt")
  uint64_t size = 0;
  std::string checksum;      // SHA-256 hex, empty for directories
  int64_t modified_time = 0; // Unix milliseconds
  bool is_directory = false;
};

bool operator==(const FileInfo &lhs, const FileInfo &rhs);

struct FileChunk {
  uint64_t offset = 0;
  uint32_t size = 0;
  std::string checksum;
  std::optional<std::string> data; // Only set for changed chunks of a delta
};

struct FileDelta {
  std::vector<FileChunk> unchanged_chunks;
  std::vector<FileChunk> changed_chunks;
  uint64_t total_size = 0;
  uint32_t chunk_size = 0;
  double compression_ratio = 1.0;
};

struct TransferSavings {
  uint64_t total_size = 0;
  uint64_t changed_size = 0;
  uint64_t unchanged_size = 0;
  double transfer_ratio = 1.0;
  double savings_percent = 0.0;
};

struct ClientInfo {
  std::string client_id;
  std::string name;
  std::string sync_root;
  int64_t last_seen = 0;
  bool is_online = true;
};

struct SyncRequest {
  std::string client_id;
  std::vector<FileInfo> files;
  std::string sync_root;
};

struct SyncResponse {
  bool success = false;
  std::string message;
  std::vector<FileInfo> files_to_push; // Client holds the authoritative copy
  std::vector<FileInfo> files_to_pull; // Client must download
  std::vector<std::string> conflicts;

  std::vector<FileInfo> filesToSync() const;
};

struct HistoryRecord {
  int64_t id = 0;
  std::string file_path;
  std::string operation;
  std::string client_id;
  int64_t timestamp = 0; // Unix milliseconds
  std::string checksum;
  int64_t size = 0;
};

struct ConflictReport {
  std::string file_path;
  std::vector<HistoryRecord> recent_changes;
};

struct CacheStats {
  size_t total_entries = 0;
  size_t expired_entries = 0;
  size_t active_entries = 0;
};

} // namespace filesync
