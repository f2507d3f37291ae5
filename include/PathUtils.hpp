#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace filesync {

// Suffix of in-progress downloads; never synced.
inline constexpr const char *kPartialSuffix = ".fsync-part";

bool hasPartialSuffix(const std::string &path);

// Forward slashes, no "./" or leading "/", lexically normalized.
std::string normalizePath(const std::string &path);

// Path of absPath relative to root, normalized. Returns absPath normalized
// when it is not below root.
std::string toRelativePath(const std::filesystem::path &absPath,
                           const std::filesystem::path &root);

// Rejects empty, absolute and parent-escaping relative paths.
bool isSafeRelativePath(const std::string &relativePath);

// Glob match against the basename, the whole relative path and each parent
// directory component.
bool shouldIgnore(const std::string &relativePath,
                  const std::vector<std::string> &patterns);

std::string fileExtension(const std::string &filename); // lower-case, with dot

int64_t getUnixTimeStamp(const std::filesystem::file_time_type &ftime);
int64_t nowMillis();
std::string formatTimestamp(int64_t unixMillis); // ISO-8601, UTC
std::string compactTimestamp();                  // YYYYmmdd_HHMMSS, local time

std::string calculateHash(const std::string &absPath); // "" if unreadable
std::string calculateHash(const char *data, size_t len);

// Writes (or appends) bytes with stdio so that errno survives a failure.
// Returns 0 on success or the errno of the failing call.
int writeFileBytes(const std::filesystem::path &path, const std::string &data,
                   bool append = false);

} // namespace filesync
