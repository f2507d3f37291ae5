#pragma once

#include "SyncError.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace filesync {

struct ServerConfig {
  std::string host = "localhost";
  int port = 8000;
  int channel_port = 0; // 0: port + 1
  std::string sync_directory = "./sync_data";
  std::string db_path; // Empty: <sync_directory>/metadata.db
  uint64_t max_file_size = 100ull * 1024 * 1024;
  std::vector<std::string> allowed_extensions; // Empty: every extension
  std::vector<std::string> ignore_patterns = {".git", "__pycache__", "*.tmp"};
  size_t db_pool_size = 10;
  int cache_ttl_seconds = 300;
  size_t scan_workers = 4;

  // Throws ConfigError. Creates sync_directory and makes it absolute.
  void validate();
  int effectiveChannelPort() const;
};

struct ClientConfig {
  std::string server_host = "localhost";
  int server_port = 8000;
  int channel_port = 0; // 0: server_port + 1
  std::string client_name;
  std::string sync_directory;
  std::vector<std::string> ignore_patterns = {".git", "__pycache__", "*.tmp"};
  std::string api_key; // Optional

  bool enable_compression = true;
  bool enable_differential = true;
  size_t max_concurrent_uploads = 3;
  size_t max_concurrent_downloads = 3;
  int timeout_seconds = 30;

  int heartbeat_interval_seconds = 30;
  int max_reconnect_attempts = 10;
  double reconnect_base_delay_seconds = 1.0;
  double reconnect_max_delay_seconds = 60.0;
  int debounce_ms = 100;

  void validate();
  int effectiveChannelPort() const;
};

// Reads a JSON object; absent keys keep their defaults. Throws ConfigError
// for an unreadable file, invalid JSON, a mistyped value or a failed
// validation.
ServerConfig loadServerConfig(const std::string &path);
ClientConfig loadClientConfig(const std::string &path);

} // namespace filesync
