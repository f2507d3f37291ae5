#include "Config.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace filesync {

namespace {

constexpr uint64_t kMaxFileSizeLimit = 10ull * 1024 * 1024 * 1024;

void requirePort(const std::string &field, int port, bool allowZero) {
  if (allowZero && port == 0)
    return;
  if (port < 1 || port > 65535)
    throw ConfigError(field, "must be between 1 and 65535");
}

void requireHost(const std::string &field, const std::string &host) {
  if (host.find_first_not_of(" \t") == std::string::npos)
    throw ConfigError(field, "cannot be empty");
}

// Creates the directory and proves it is writable. Returns the absolute path.
std::string prepareDirectory(const std::string &field, const std::string &dir) {
  if (dir.find_first_not_of(" \t") == std::string::npos)
    throw ConfigError(field, "cannot be empty");

  std::error_code ec;
  fs::path path(dir);
  if (fs::exists(path, ec) && !fs::is_directory(path, ec))
    throw ConfigError(field, "exists but is not a directory: " + dir);
  fs::create_directories(path, ec);
  if (ec)
    throw ConfigError(field, "cannot create " + dir + ": " + ec.message());

  auto marker = path / ".write_test";
  {
    std::ofstream out(marker);
    if (!out || !(out << "test"))
      throw ConfigError(field, "no write permission for " + dir);
  }
  fs::remove(marker, ec);

  auto absolute = fs::absolute(path, ec);
  return (ec ? path : absolute).lexically_normal().generic_string();
}

void requirePatterns(const std::string &field,
                     const std::vector<std::string> &patterns) {
  for (const auto &pattern : patterns) {
    if (pattern.find_first_not_of(" \t") == std::string::npos)
      throw ConfigError(field, "patterns cannot be empty");
  }
}

json readDocument(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw ConfigError("config", "cannot open " + path);
  auto doc = json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw ConfigError("config", path + " is not a JSON object");
  return doc;
}

template <typename T>
void readField(const json &doc, const char *key, T &out) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null())
    return;
  try {
    out = it->get<T>();
  } catch (const json::exception &e) {
    throw ConfigError(key, std::string("invalid value: ") + e.what());
  }
}

} // namespace

void ServerConfig::validate() {
  requireHost("host", host);
  requirePort("port", port, false);
  requirePort("channel_port", channel_port, true);
  if (channel_port == port)
    throw ConfigError("channel_port", "must differ from port");
  if (channel_port == 0 && port == 65535)
    throw ConfigError("channel_port", "required when port is 65535");
  sync_directory = prepareDirectory("sync_directory", sync_directory);
  if (max_file_size == 0)
    throw ConfigError("max_file_size", "must be positive");
  if (max_file_size > kMaxFileSizeLimit)
    throw ConfigError("max_file_size", "too large (max 10GB)");
  for (const auto &ext : allowed_extensions) {
    if (ext.empty() || ext[0] != '.')
      throw ConfigError("allowed_extensions",
                        "extension must start with a dot: " + ext);
  }
  requirePatterns("ignore_patterns", ignore_patterns);
  if (db_pool_size == 0)
    throw ConfigError("db_pool_size", "must be positive");
  if (cache_ttl_seconds < 0)
    throw ConfigError("cache_ttl_seconds", "cannot be negative");
  if (scan_workers == 0)
    throw ConfigError("scan_workers", "must be positive");
}

int ServerConfig::effectiveChannelPort() const {
  return channel_port != 0 ? channel_port : port + 1;
}

void ClientConfig::validate() {
  requireHost("server_host", server_host);
  requirePort("server_port", server_port, false);
  requirePort("channel_port", channel_port, true);

  auto first = client_name.find_first_not_of(" \t");
  if (first == std::string::npos)
    throw ConfigError("client_name", "cannot be empty");
  client_name = client_name.substr(
      first, client_name.find_last_not_of(" \t") - first + 1);
  if (client_name.find_first_of("<>:\"/\\|?*") != std::string::npos)
    throw ConfigError("client_name",
                      "contains invalid characters: <>:\"/\\|?*");
  if (client_name.size() > 50)
    throw ConfigError("client_name", "too long (max 50 characters)");

  sync_directory = prepareDirectory("sync_directory", sync_directory);
  requirePatterns("ignore_patterns", ignore_patterns);

  if (!api_key.empty() && (api_key.size() < 8 || api_key.size() > 256))
    throw ConfigError("api_key", "must be 8 to 256 characters");
  if (max_concurrent_uploads == 0 || max_concurrent_downloads == 0)
    throw ConfigError("max_concurrent_transfers", "must be positive");
  if (timeout_seconds <= 0)
    throw ConfigError("timeout_seconds", "must be positive");
  if (heartbeat_interval_seconds <= 0)
    throw ConfigError("heartbeat_interval_seconds", "must be positive");
  if (max_reconnect_attempts <= 0)
    throw ConfigError("max_reconnect_attempts", "must be positive");
  if (reconnect_base_delay_seconds <= 0 ||
      reconnect_max_delay_seconds < reconnect_base_delay_seconds)
    throw ConfigError("reconnect_delay",
                      "base must be positive and not above the maximum");
  if (debounce_ms <= 0)
    throw ConfigError("debounce_ms", "must be positive");
}

int ClientConfig::effectiveChannelPort() const {
  return channel_port != 0 ? channel_port : server_port + 1;
}

ServerConfig loadServerConfig(const std::string &path) {
  auto doc = readDocument(path);
  ServerConfig config;
  readField(doc, "host", config.host);
  readField(doc, "port", config.port);
  readField(doc, "channel_port", config.channel_port);
  readField(doc, "sync_directory", config.sync_directory);
  readField(doc, "db_path", config.db_path);
  readField(doc, "max_file_size", config.max_file_size);
  readField(doc, "allowed_extensions", config.allowed_extensions);
  readField(doc, "ignore_patterns", config.ignore_patterns);
  readField(doc, "db_pool_size", config.db_pool_size);
  readField(doc, "cache_ttl_seconds", config.cache_ttl_seconds);
  readField(doc, "scan_workers", config.scan_workers);
  config.validate();
  return config;
}

ClientConfig loadClientConfig(const std::string &path) {
  auto doc = readDocument(path);
  ClientConfig config;
  readField(doc, "server_host", config.server_host);
  readField(doc, "server_port", config.server_port);
  readField(doc, "channel_port", config.channel_port);
  readField(doc, "client_name", config.client_name);
  readField(doc, "sync_directory", config.sync_directory);
  readField(doc, "ignore_patterns", config.ignore_patterns);
  readField(doc, "api_key", config.api_key);
  readField(doc, "enable_compression", config.enable_compression);
  readField(doc, "enable_differential", config.enable_differential);
  readField(doc, "max_concurrent_uploads", config.max_concurrent_uploads);
  readField(doc, "max_concurrent_downloads", config.max_concurrent_downloads);
  readField(doc, "timeout_seconds", config.timeout_seconds);
  readField(doc, "heartbeat_interval_seconds",
            config.heartbeat_interval_seconds);
  readField(doc, "max_reconnect_attempts", config.max_reconnect_attempts);
  readField(doc, "reconnect_base_delay_seconds",
            config.reconnect_base_delay_seconds);
  readField(doc, "reconnect_max_delay_seconds",
            config.reconnect_max_delay_seconds);
  readField(doc, "debounce_ms", config.debounce_ms);
  config.validate();
  return config;
}

} // namespace filesync
