#ifndef FILESYNC_FILESYSTEMSCANNER_HPP
#define FILESYNC_FILESYSTEMSCANNER_HPP

#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace filesync {

struct ScanOptions {
  std::vector<std::string> ignorePatterns;
  std::vector<std::string> excludedFiles; // Exact relative paths, e.g. "metadata.db"
  size_t workers = 4;
  bool includeDirectories = true;
};

/**
 * FileSystemScanner walks a sync root and builds a manifest. Checksums are
 * computed on a bounded worker pool.
 */
class FileSystemScanner {
public:
  explicit FileSystemScanner(std::string syncPath, ScanOptions options = {});
  ~FileSystemScanner();

  std::vector<FileInfo> scanSyncPath(const std::string &basePath = "");
  std::optional<FileInfo> statFile(const std::filesystem::path &absPath) const;

  std::string toRelativePath(const std::filesystem::path &absPath) const;
  const std::string &syncPath() const { return m_syncPath; }

private:
  bool isExcluded(const std::string &relativePath) const;

  std::string m_syncPath;
  ScanOptions m_options;
};

} // namespace filesync

#endif // FILESYNC_FILESYSTEMSCANNER_HPP
