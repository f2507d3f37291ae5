#include "types.hpp"

namespace filesync {

std::string toString(SyncOperation op) {
  switch (op) {
  case SyncOperation::Create:
    return "create";
  case SyncOperation::Update:
    return "update";
  case SyncOperation::Delete:
    return "delete";
  case SyncOperation::Move:
    return "move";
  }
  return "update";
}

std::optional<SyncOperation> parseSyncOperation(const std::string &value) {
  if (value == "create")
    return SyncOperation::Create;
  if (value == "update")
    return SyncOperation::Update;
  if (value == "delete")
    return SyncOperation::Delete;
  if (value == "move")
    return SyncOperation::Move;
  return std::nullopt;
}

bool operator==(const FileInfo &lhs, const FileInfo &rhs) {
  return lhs.path == rhs.path && lhs.size == rhs.size &&
         lhs.checksum == rhs.checksum &&
         lhs.modified_time == rhs.modified_time &&
         lhs.is_directory == rhs.is_directory;
}

std::vector<FileInfo> SyncResponse::filesToSync() const {
  std::vector<FileInfo> all = files_to_push;
  all.insert(all.end(), files_to_pull.begin(), files_to_pull.end());
  return all;
}

} // namespace filesync
