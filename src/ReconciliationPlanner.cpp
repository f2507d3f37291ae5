#include "ReconciliationPlanner.hpp"
#include "PathUtils.hpp"
#include <algorithm>
#include <map>

namespace filesync {

std::vector<FileInfo> SyncPlan::filesToSync() const {
  std::vector<FileInfo> all = files_to_push;
  all.insert(all.end(), files_to_pull.begin(), files_to_pull.end());
  return all;
}

bool SyncPlan::empty() const {
  return files_to_push.empty() && files_to_pull.empty() && conflicts.empty();
}

SyncPlan ReconciliationPlanner::plan(const std::vector<FileInfo> &clientFiles,
                                     const std::vector<FileInfo> &serverFiles) {
  SyncPlan result;

  std::map<std::string, const FileInfo *> serverByPath;
  for (const auto &f : serverFiles)
    serverByPath.emplace(normalizePath(f.path), &f);

  std::map<std::string, const FileInfo *> clientByPath;
  for (const auto &f : clientFiles)
    clientByPath.emplace(normalizePath(f.path), &f);

  for (const auto &[path, client] : clientByPath) {
    auto it = serverByPath.find(path);
    if (it == serverByPath.end()) {
      result.files_to_push.push_back(*client);
      continue;
    }

    const FileInfo *server = it->second;
    if (server->checksum == client->checksum)
      continue;

    if (server->modified_time > client->modified_time)
      result.conflicts.push_back(path);
    else if (client->modified_time > server->modified_time)
      result.files_to_push.push_back(*client);
    // Equal timestamps with different content: left alone.
  }

  for (const auto &[path, server] : serverByPath) {
    if (!clientByPath.count(path))
      result.files_to_pull.push_back(*server);
  }

  return result;
}

} // namespace filesync
