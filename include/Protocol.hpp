#pragma once

#include "SyncError.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace filesync {

using json = nlohmann::json;

// JSON mapping of the HTTP payloads. Found through ADL by nlohmann::json.
void to_json(json &j, const FileInfo &info);
void from_json(const json &j, FileInfo &info);
void to_json(json &j, const FileChunk &chunk);
void from_json(const json &j, FileChunk &chunk);
void to_json(json &j, const FileDelta &delta);
void from_json(const json &j, FileDelta &delta);
void to_json(json &j, const ClientInfo &client);
void from_json(const json &j, ClientInfo &client);
void to_json(json &j, const SyncRequest &request);
void from_json(const json &j, SyncRequest &request);
void to_json(json &j, const SyncResponse &response);
void from_json(const json &j, SyncResponse &response);
void to_json(json &j, const HistoryRecord &record);
void to_json(json &j, const ConflictReport &report);
void to_json(json &j, const TransferSavings &savings);

// Deltas travel as CBOR so that chunk bytes stay binary.
std::string encodeDelta(const FileDelta &delta);
Result<FileDelta> decodeDelta(const std::string &bytes);

// Persistent channel messages: {type, data, client_id, timestamp}.

struct ConnectMessage {
  std::string client_id;
  std::string client_name;
  std::string sync_root;
  std::string api_key;
};

struct ConnectAck {
  bool success = true;
  std::string message;
  std::string server_time;
};

struct HeartbeatMessage {
  std::string timestamp;
};

struct FileChangedMessage {
  SyncOperation operation = SyncOperation::Update;
  FileInfo file_info;
  std::optional<std::string> old_path;
};

struct FileUpdatedMessage {
  SyncOperation operation = SyncOperation::Update;
  std::string file_path;
  std::string client_id;
  std::string checksum;
};

struct FileDeletedMessage {
  std::string file_path;
  std::string client_id;
};

struct ClientJoinedMessage {
  std::string client_id;
  std::string name;
};

struct ClientLeftMessage {
  std::string client_id;
};

struct ErrorMessage {
  std::string error;
  std::string details;
};

struct UnknownMessage {
  std::string type;
  json data;
};

using MessagePayload =
    std::variant<ConnectMessage, ConnectAck, HeartbeatMessage,
                 FileChangedMessage, FileUpdatedMessage, FileDeletedMessage,
                 ClientJoinedMessage, ClientLeftMessage, ErrorMessage,
                 UnknownMessage>;

struct ChannelMessage {
  MessagePayload payload;
  std::string client_id;
  std::string timestamp;
};

// Wire name of the payload, e.g. "file_updated".
std::string messageType(const MessagePayload &payload);

// Stamps the message with the current time.
ChannelMessage makeMessage(MessagePayload payload,
                           const std::string &clientId = "");

std::string serializeMessage(const ChannelMessage &message);

// Malformed JSON or a known type with a malformed body is a Protocol error.
// Unrecognized types parse to UnknownMessage.
Result<ChannelMessage> parseMessage(const std::string &text);

} // namespace filesync
