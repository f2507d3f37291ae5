#include "FileSystemScanner.hpp"
#include "PathUtils.hpp"
#include "ThreadPool.hpp"
#include <algorithm>
#include <future>
#include <iostream>

namespace fs = std::filesystem;

namespace filesync {

FileSystemScanner::FileSystemScanner(std::string syncPath, ScanOptions options)
    : m_syncPath(std::move(syncPath)), m_options(std::move(options)) {}

FileSystemScanner::~FileSystemScanner() = default;

std::string FileSystemScanner::toRelativePath(const fs::path &absPath) const {
  return filesync::toRelativePath(absPath, fs::path(m_syncPath));
}

bool FileSystemScanner::isExcluded(const std::string &relativePath) const {
  if (hasPartialSuffix(relativePath))
    return true;
  if (std::find(m_options.excludedFiles.begin(), m_options.excludedFiles.end(),
                relativePath) != m_options.excludedFiles.end())
    return true;
  return shouldIgnore(relativePath, m_options.ignorePatterns);
}

std::optional<FileInfo>
FileSystemScanner::statFile(const fs::path &absPath) const {
  std::error_code ec;
  auto status = fs::status(absPath, ec);
  if (ec || !fs::exists(status))
    return std::nullopt;

  FileInfo info;
  info.path = toRelativePath(absPath);
  auto mtime = fs::last_write_time(absPath, ec);
  if (ec)
    return std::nullopt;
  info.modified_time = getUnixTimeStamp(mtime);

  if (fs::is_directory(status)) {
    info.is_directory = true;
    info.size = 0;
    info.checksum = "";
    return info;
  }

  auto size = fs::file_size(absPath, ec);
  if (ec)
    return std::nullopt;
  info.size = size;
  info.checksum = calculateHash(absPath.string());
  if (info.checksum.empty())
    return std::nullopt;
  return info;
}

std::vector<FileInfo>
FileSystemScanner::scanSyncPath(const std::string &basePath) {
  std::vector<FileInfo> result;
  fs::path root = fs::path(m_syncPath);
  if (!basePath.empty())
    root /= normalizePath(basePath);

  std::vector<fs::path> files;
  try {
    if (!fs::exists(root))
      return result;

    fs::directory_options opts = fs::directory_options::skip_permission_denied;
    for (auto it = fs::recursive_directory_iterator(root, opts);
         it != fs::recursive_directory_iterator(); ++it) {
      const auto &entry = *it;
      try {
        auto rel = toRelativePath(entry.path());
        if (isExcluded(rel)) {
          if (entry.is_directory())
            it.disable_recursion_pending();
          continue;
        }

        if (entry.is_regular_file()) {
          files.push_back(entry.path());
        } else if (entry.is_directory() && m_options.includeDirectories) {
          FileInfo dir;
          dir.path = rel;
          dir.is_directory = true;
          dir.modified_time = getUnixTimeStamp(fs::last_write_time(entry.path()));
          result.push_back(dir);
        }
      } catch (const std::exception &e) {
        std::cerr << "[Scanner] Error scanning item: " << entry.path() << " - "
                  << e.what() << std::endl;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "[Scanner] FileSystem Error: " << e.what() << std::endl;
  }

  // Hashing dominates the walk; spread it over a small pool.
  {
    ThreadPool pool(m_options.workers);
    std::vector<std::future<std::optional<FileInfo>>> pending;
    pending.reserve(files.size());
    for (const auto &file : files) {
      pending.push_back(
          pool.submit([this, file]() { return statFile(file); }));
    }
    for (auto &f : pending) {
      auto info = f.get();
      if (info)
        result.push_back(*info);
    }
  }

  std::sort(result.begin(), result.end(),
            [](const FileInfo &a, const FileInfo &b) { return a.path < b.path; });
  return result;
}

} // namespace filesync
