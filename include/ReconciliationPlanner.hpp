#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace filesync {

struct SyncPlan {
  std::vector<FileInfo> files_to_push; // Client copy wins, server must receive it
  std::vector<FileInfo> files_to_pull; // Server copy the client lacks
  std::vector<std::string> conflicts;  // Server copy is newer and differs

  std::vector<FileInfo> filesToSync() const;
  bool empty() const;
};

/**
 * ReconciliationPlanner compares a client manifest with the server manifest.
 *
 * For each path:
 *  - only on the client: push
 *  - same checksum on both sides: nothing
 *  - different checksum, server newer: conflict
 *  - different checksum, client newer: push
 *  - different checksum, identical timestamps: nothing
 *  - only on the server: pull
 */
class ReconciliationPlanner {
public:
  static SyncPlan plan(const std::vector<FileInfo> &clientFiles,
                       const std::vector<FileInfo> &serverFiles);
};

} // namespace filesync
