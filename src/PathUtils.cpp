#include "PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fnmatch.h>
#include <fstream>
#include <iomanip>
#include "picosha2.h"
#include <sstream>

namespace fs = std::filesystem;

namespace filesync {

std::string normalizePath(const std::string &path) {
  std::string result = path;
  std::replace(result.begin(), result.end(), '\\', '/');
  if (result.empty())
    return result;

  result = fs::path(result).lexically_normal().generic_string();
  while (result.rfind("./", 0) == 0)
    result.erase(0, 2);
  while (!result.empty() && result.front() == '/')
    result.erase(0, 1);
  while (!result.empty() && result.back() == '/')
    result.pop_back();
  if (result == ".")
    result.clear();
  return result;
}

std::string toRelativePath(const fs::path &absPath, const fs::path &root) {
  auto base = root.lexically_normal();
  auto full = absPath.lexically_normal();
  auto rel = full.lexically_relative(base);
  if (rel.empty() || *rel.begin() == "..")
    return normalizePath(full.generic_string());
  return normalizePath(rel.generic_string());
}

bool hasPartialSuffix(const std::string &path) {
  const std::string suffix = kPartialSuffix;
  return path.size() >= suffix.size() &&
         path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isSafeRelativePath(const std::string &relativePath) {
  if (relativePath.empty())
    return false;
  fs::path p(relativePath);
  if (p.is_absolute() || relativePath.front() == '/')
    return false;
  for (const auto &part : p.lexically_normal()) {
    if (part == "..")
      return false;
  }
  return true;
}

static bool globMatch(const std::string &pattern, const std::string &value) {
  return fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

bool shouldIgnore(const std::string &relativePath,
                  const std::vector<std::string> &patterns) {
  if (patterns.empty())
    return false;

  auto normalized = normalizePath(relativePath);
  fs::path p(normalized);
  auto basename = p.filename().generic_string();

  for (const auto &pattern : patterns) {
    if (globMatch(pattern, basename) || globMatch(pattern, normalized))
      return true;
    for (const auto &part : p.parent_path()) {
      if (globMatch(pattern, part.generic_string()))
        return true;
    }
  }
  return false;
}

std::string fileExtension(const std::string &filename) {
  auto ext = fs::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

int64_t getUnixTimeStamp(const fs::file_time_type &ftime) {
  auto now_file = fs::file_time_type::clock::now();
  auto now_sys = std::chrono::system_clock::now();
  auto file_duration = ftime - now_file;
  auto sys_time =
      now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    file_duration);
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             sys_time.time_since_epoch())
      .count();
}

int64_t nowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string formatTimestamp(int64_t unixMillis) {
  std::time_t seconds = static_cast<std::time_t>(unixMillis / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3)
      << std::setfill('0') << (unixMillis % 1000) << "Z";
  return out.str();
}

std::string compactTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return out.str();
}

std::string calculateHash(const std::string &absPath) {
  std::ifstream f(absPath, std::ios::binary);
  if (!f.is_open())
    return "";

  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(f, hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string calculateHash(const char *data, size_t len) {
  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(data, data + len, hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

int writeFileBytes(const fs::path &path, const std::string &data,
                   bool append) {
  errno = 0;
  std::FILE *file = std::fopen(path.c_str(), append ? "ab" : "wb");
  if (!file)
    return errno != 0 ? errno : EIO;

  size_t written = data.empty()
                       ? 0
                       : std::fwrite(data.data(), 1, data.size(), file);
  int err = 0;
  if (written != data.size())
    err = errno != 0 ? errno : EIO;
  if (std::fclose(file) != 0 && err == 0)
    err = errno != 0 ? errno : EIO;
  return err;
}

} // namespace filesync
