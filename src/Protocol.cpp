#include "Protocol.hpp"
#include "PathUtils.hpp"

namespace filesync {

void to_json(json &j, const FileInfo &info) {
  j = json{{"path", info.path},
           {"size", info.size},
           {"checksum", info.checksum},
           {"modified_time", info.modified_time},
           {"is_directory", info.is_directory}};
}

void from_json(const json &j, FileInfo &info) {
  info.path = normalizePath(j.at("path").get<std::string>());
  info.size = j.value("size", uint64_t{0});
  info.checksum = j.value("checksum", std::string());
  info.modified_time = j.value("modified_time", int64_t{0});
  info.is_directory = j.value("is_directory", false);
}

void to_json(json &j, const FileChunk &chunk) {
  j = json{{"offset", chunk.offset},
           {"size", chunk.size},
           {"checksum", chunk.checksum}};
  if (chunk.data) {
    j["data"] = json::binary(
        std::vector<std::uint8_t>(chunk.data->begin(), chunk.data->end()));
  }
}

void from_json(const json &j, FileChunk &chunk) {
  chunk.offset = j.at("offset").get<uint64_t>();
  chunk.size = j.at("size").get<uint32_t>();
  chunk.checksum = j.at("checksum").get<std::string>();
  chunk.data.reset();
  if (j.contains("data") && !j["data"].is_null()) {
    const auto &data = j["data"];
    if (data.is_binary()) {
      const auto &bytes = data.get_binary();
      chunk.data = std::string(bytes.begin(), bytes.end());
    } else {
      chunk.data = data.get<std::string>();
    }
  }
}

void to_json(json &j, const FileDelta &delta) {
  j = json{{"unchanged_chunks", delta.unchanged_chunks},
           {"changed_chunks", delta.changed_chunks},
           {"total_size", delta.total_size},
           {"chunk_size", delta.chunk_size},
           {"compression_ratio", delta.compression_ratio}};
}

void from_json(const json &j, FileDelta &delta) {
  j.at("unchanged_chunks").get_to(delta.unchanged_chunks);
  j.at("changed_chunks").get_to(delta.changed_chunks);
  delta.total_size = j.at("total_size").get<uint64_t>();
  delta.chunk_size = j.at("chunk_size").get<uint32_t>();
  delta.compression_ratio = j.value("compression_ratio", 1.0);
}

void to_json(json &j, const ClientInfo &client) {
  j = json{{"client_id", client.client_id},
           {"name", client.name},
           {"sync_root", client.sync_root},
           {"last_seen", client.last_seen},
           {"is_online", client.is_online}};
}

void from_json(const json &j, ClientInfo &client) {
  client.client_id = j.at("client_id").get<std::string>();
  client.name = j.value("name", std::string());
  client.sync_root = j.value("sync_root", std::string());
  client.last_seen = j.value("last_seen", int64_t{0});
  client.is_online = j.value("is_online", true);
}

void to_json(json &j, const SyncRequest &request) {
  j = json{{"client_id", request.client_id},
           {"files", request.files},
           {"sync_root", request.sync_root}};
}

void from_json(const json &j, SyncRequest &request) {
  request.client_id = j.at("client_id").get<std::string>();
  j.at("files").get_to(request.files);
  request.sync_root = j.value("sync_root", std::string());
}

void to_json(json &j, const SyncResponse &response) {
  j = json{{"success", response.success},
           {"message", response.message},
           {"files_to_sync", response.filesToSync()},
           {"files_to_push", response.files_to_push},
           {"files_to_pull", response.files_to_pull},
           {"conflicts", response.conflicts}};
}

void from_json(const json &j, SyncResponse &response) {
  response.success = j.at("success").get<bool>();
  response.message = j.value("message", std::string());
  response.files_to_push.clear();
  response.files_to_pull.clear();
  if (j.contains("files_to_push") || j.contains("files_to_pull")) {
    if (j.contains("files_to_push"))
      j["files_to_push"].get_to(response.files_to_push);
    if (j.contains("files_to_pull"))
      j["files_to_pull"].get_to(response.files_to_pull);
  } else if (j.contains("files_to_sync")) {
    // Undirected set: the client decides per file by looking at its tree.
    j["files_to_sync"].get_to(response.files_to_pull);
  }
  response.conflicts =
      j.value("conflicts", std::vector<std::string>());
}

void to_json(json &j, const HistoryRecord &record) {
  j = json{{"id", record.id},
           {"file_path", record.file_path},
           {"operation", record.operation},
           {"client_id", record.client_id},
           {"timestamp", record.timestamp},
           {"checksum", record.checksum},
           {"size", record.size}};
}

void to_json(json &j, const ConflictReport &report) {
  j = json{{"file_path", report.file_path},
           {"recent_changes", report.recent_changes}};
}

void to_json(json &j, const TransferSavings &savings) {
  j = json{{"total_size", savings.total_size},
           {"changed_size", savings.changed_size},
           {"unchanged_size", savings.unchanged_size},
           {"transfer_ratio", savings.transfer_ratio},
           {"savings_percent", savings.savings_percent}};
}

std::string encodeDelta(const FileDelta &delta) {
  auto bytes = json::to_cbor(json(delta));
  return std::string(bytes.begin(), bytes.end());
}

Result<FileDelta> decodeDelta(const std::string &bytes) {
  try {
    auto j = json::from_cbor(bytes);
    return Result<FileDelta>::Ok(j.get<FileDelta>());
  } catch (const json::exception &e) {
    return Result<FileDelta>::Error(
        SyncError::protocol("malformed delta payload", e.what()));
  }
}

namespace {

struct PayloadEncoder {
  json operator()(const ConnectMessage &m) const {
    return {{"client_id", m.client_id},
            {"client_name", m.client_name},
            {"sync_root", m.sync_root},
            {"api_key", m.api_key}};
  }
  json operator()(const ConnectAck &m) const {
    return {{"success", m.success},
            {"message", m.message},
            {"server_time", m.server_time}};
  }
  json operator()(const HeartbeatMessage &m) const {
    return {{"timestamp", m.timestamp}};
  }
  json operator()(const FileChangedMessage &m) const {
    json data = {{"operation", toString(m.operation)},
                 {"file_info", m.file_info}};
    if (m.old_path)
      data["old_path"] = *m.old_path;
    return data;
  }
  json operator()(const FileUpdatedMessage &m) const {
    return {{"operation", toString(m.operation)},
            {"file_path", m.file_path},
            {"client_id", m.client_id},
            {"checksum", m.checksum}};
  }
  json operator()(const FileDeletedMessage &m) const {
    return {{"operation", "delete"},
            {"file_path", m.file_path},
            {"client_id", m.client_id}};
  }
  json operator()(const ClientJoinedMessage &m) const {
    return {{"client_id", m.client_id}, {"name", m.name}};
  }
  json operator()(const ClientLeftMessage &m) const {
    return {{"client_id", m.client_id}};
  }
  json operator()(const ErrorMessage &m) const {
    json data = {{"error", m.error}};
    if (!m.details.empty())
      data["details"] = m.details;
    return data;
  }
  json operator()(const UnknownMessage &m) const { return m.data; }
};

struct TypeName {
  std::string operator()(const ConnectMessage &) const { return "connect"; }
  std::string operator()(const ConnectAck &) const { return "connect"; }
  std::string operator()(const HeartbeatMessage &) const { return "heartbeat"; }
  std::string operator()(const FileChangedMessage &) const {
    return "file_changed";
  }
  std::string operator()(const FileUpdatedMessage &) const {
    return "file_updated";
  }
  std::string operator()(const FileDeletedMessage &) const {
    return "file_deleted";
  }
  std::string operator()(const ClientJoinedMessage &) const {
    return "client_joined";
  }
  std::string operator()(const ClientLeftMessage &) const {
    return "client_left";
  }
  std::string operator()(const ErrorMessage &) const { return "error"; }
  std::string operator()(const UnknownMessage &m) const { return m.type; }
};

SyncOperation operationField(const json &data, SyncOperation fallback) {
  if (!data.contains("operation") || !data["operation"].is_string())
    return fallback;
  return parseSyncOperation(data["operation"].get<std::string>())
      .value_or(fallback);
}

MessagePayload decodePayload(const std::string &type, const json &data) {
  if (type == "connect") {
    if (data.contains("success")) {
      ConnectAck ack;
      ack.success = data.at("success").get<bool>();
      ack.message = data.value("message", std::string());
      ack.server_time = data.value("server_time", std::string());
      return ack;
    }
    ConnectMessage m;
    m.client_id = data.at("client_id").get<std::string>();
    m.client_name = data.at("client_name").get<std::string>();
    m.sync_root = data.value("sync_root", std::string());
    m.api_key = data.value("api_key", std::string());
    return m;
  }
  if (type == "heartbeat")
    return HeartbeatMessage{data.value("timestamp", std::string())};
  if (type == "file_changed") {
    FileChangedMessage m;
    m.operation = operationField(data, SyncOperation::Update);
    m.file_info = data.at("file_info").get<FileInfo>();
    if (data.contains("old_path") && data["old_path"].is_string())
      m.old_path = data["old_path"].get<std::string>();
    return m;
  }
  if (type == "file_updated") {
    FileUpdatedMessage m;
    m.operation = operationField(data, SyncOperation::Update);
    m.file_path = normalizePath(data.at("file_path").get<std::string>());
    m.client_id = data.value("client_id", std::string());
    m.checksum = data.value("checksum", std::string());
    return m;
  }
  if (type == "file_deleted") {
    FileDeletedMessage m;
    m.file_path = normalizePath(data.at("file_path").get<std::string>());
    m.client_id = data.value("client_id", std::string());
    return m;
  }
  if (type == "client_joined") {
    return ClientJoinedMessage{data.value("client_id", std::string()),
                               data.value("name", std::string())};
  }
  if (type == "client_left")
    return ClientLeftMessage{data.value("client_id", std::string())};
  if (type == "error") {
    return ErrorMessage{data.value("error", std::string()),
                        data.value("details", std::string())};
  }
  return UnknownMessage{type, data};
}

} // namespace

std::string messageType(const MessagePayload &payload) {
  return std::visit(TypeName{}, payload);
}

ChannelMessage makeMessage(MessagePayload payload, const std::string &clientId) {
  ChannelMessage message;
  message.payload = std::move(payload);
  message.client_id = clientId;
  message.timestamp = formatTimestamp(nowMillis());
  return message;
}

std::string serializeMessage(const ChannelMessage &message) {
  json j = {{"type", messageType(message.payload)},
            {"data", std::visit(PayloadEncoder{}, message.payload)},
            {"client_id", message.client_id},
            {"timestamp", message.timestamp}};
  return j.dump();
}

Result<ChannelMessage> parseMessage(const std::string &text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &e) {
    return Result<ChannelMessage>::Error(
        SyncError::protocol("invalid JSON message", e.what()));
  }

  if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
    return Result<ChannelMessage>::Error(
        SyncError::protocol("message without a type field"));
  }

  try {
    ChannelMessage message;
    json data = j.value("data", json::object());
    if (!data.is_object())
      data = json::object();
    message.payload = decodePayload(j["type"].get<std::string>(), data);
    message.client_id = j.value("client_id", std::string());
    message.timestamp = j.value("timestamp", std::string());
    return Result<ChannelMessage>::Ok(std::move(message));
  } catch (const json::exception &e) {
    return Result<ChannelMessage>::Error(SyncError::protocol(
        "malformed " + j["type"].get<std::string>() + " message", e.what()));
  }
}

} // namespace filesync
