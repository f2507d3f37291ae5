#include "Compressor.hpp"
#include "PathUtils.hpp"
#include <iostream>
#include <set>
#include <zlib.h>

#ifdef FILESYNC_HAVE_LZ4
#include <lz4frame.h>
#endif

namespace filesync {

namespace {

const std::set<std::string> kPrecompressedExtensions = {
    ".zip",  ".gz",   ".bz2", ".xz",  ".7z",   ".rar",  ".tar", ".tgz",
    ".jpg",  ".jpeg", ".png", ".gif", ".webp", ".avif", ".heic",
    ".mp4",  ".avi",  ".mkv", ".mov", ".webm", ".flv",  ".wmv",
    ".mp3",  ".aac",  ".ogg", ".flac", ".m4a", ".wma",
    ".pdf",  ".docx", ".xlsx", ".pptx", ".odt", ".ods",
    ".exe",  ".dll",  ".so",  ".dylib", ".lz4", ".zst", ".br"};

const std::set<std::string> kTextExtensions = {
    ".txt", ".log", ".json", ".xml", ".html", ".css", ".js",   ".py",
    ".java", ".cpp", ".c",   ".h",   ".sql",  ".md",  ".rst",  ".csv",
    ".tsv", ".yaml", ".yml", ".ini", ".conf", ".cfg"};

constexpr uint64_t kMinCompressSize = 512;
constexpr uint64_t kMinTextCompressSize = 256;
constexpr uint64_t kMinDefaultCompressSize = 1024;
constexpr size_t kMinBestCompressionSize = 1024;
constexpr double kAdoptRatio = 0.9;

// windowBits 15 gives zlib framing, +16 gives gzip framing.
int windowBitsFor(CompressionType type) {
  return type == CompressionType::Gzip ? 15 + 16 : 15;
}

std::optional<std::string> deflateBytes(const std::string &data, int windowBits) {
  z_stream zs{};
  if (deflateInit2(&zs, Compressor::kLevel, Z_DEFLATED, windowBits, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK)
    return std::nullopt;

  std::string out;
  out.resize(deflateBound(&zs, static_cast<uLong>(data.size())) + 32);
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  zs.next_out = reinterpret_cast<Bytef *>(&out[0]);
  zs.avail_out = static_cast<uInt>(out.size());

  int rc = deflate(&zs, Z_FINISH);
  auto produced = zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END)
    return std::nullopt;
  out.resize(produced);
  return out;
}

std::optional<std::string> inflateBytes(const std::string &data, int windowBits) {
  z_stream zs{};
  if (inflateInit2(&zs, windowBits) != Z_OK)
    return std::nullopt;

  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::string out;
  char buffer[32768];
  int rc = Z_OK;
  while (rc == Z_OK) {
    zs.next_out = reinterpret_cast<Bytef *>(buffer);
    zs.avail_out = sizeof(buffer);
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END)
      break;
    out.append(buffer, sizeof(buffer) - zs.avail_out);
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      // Input exhausted before the end of stream: truncated data.
      rc = Z_DATA_ERROR;
      break;
    }
  }
  inflateEnd(&zs);
  if (rc != Z_STREAM_END)
    return std::nullopt;
  return out;
}

#ifdef FILESYNC_HAVE_LZ4
std::optional<std::string> lz4Compress(const std::string &data) {
  LZ4F_preferences_t prefs{};
  prefs.frameInfo.contentSize = data.size();
  std::string out;
  out.resize(LZ4F_compressFrameBound(data.size(), &prefs));
  size_t written = LZ4F_compressFrame(&out[0], out.size(), data.data(),
                                      data.size(), &prefs);
  if (LZ4F_isError(written))
    return std::nullopt;
  out.resize(written);
  return out;
}

std::optional<std::string> lz4Decompress(const std::string &data) {
  LZ4F_dctx *ctx = nullptr;
  if (LZ4F_isError(LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION)))
    return std::nullopt;

  std::string out;
  char buffer[65536];
  const char *src = data.data();
  size_t remaining = data.size();
  size_t hint = 1;
  while (remaining > 0 && hint != 0) {
    size_t dstSize = sizeof(buffer);
    size_t srcSize = remaining;
    hint = LZ4F_decompress(ctx, buffer, &dstSize, src, &srcSize, nullptr);
    if (LZ4F_isError(hint)) {
      LZ4F_freeDecompressionContext(ctx);
      return std::nullopt;
    }
    out.append(buffer, dstSize);
    src += srcSize;
    remaining -= srcSize;
  }
  LZ4F_freeDecompressionContext(ctx);
  if (hint != 0)
    return std::nullopt;
  return out;
}
#endif

} // namespace

std::string toString(CompressionType type) {
  switch (type) {
  case CompressionType::None:
    return "none";
  case CompressionType::Gzip:
    return "gzip";
  case CompressionType::Zlib:
    return "zlib";
  case CompressionType::Lz4:
    return "lz4";
  }
  return "none";
}

std::optional<CompressionType> parseCompressionType(const std::string &value) {
  if (value == "none" || value.empty())
    return CompressionType::None;
  if (value == "gzip")
    return CompressionType::Gzip;
  if (value == "zlib")
    return CompressionType::Zlib;
  if (value == "lz4")
    return CompressionType::Lz4;
  return std::nullopt;
}

bool Compressor::isAvailable(CompressionType type) {
#ifdef FILESYNC_HAVE_LZ4
  (void)type;
  return true;
#else
  return type != CompressionType::Lz4;
#endif
}

std::vector<CompressionType> Compressor::availableTypes() {
  std::vector<CompressionType> types = {CompressionType::Gzip,
                                        CompressionType::Zlib};
  if (isAvailable(CompressionType::Lz4))
    types.push_back(CompressionType::Lz4);
  return types;
}

CompressedPayload Compressor::compress(const std::string &data,
                                       CompressionType type) {
  if (type == CompressionType::Lz4 && !isAvailable(type))
    type = CompressionType::Zlib;

  std::optional<std::string> out;
  switch (type) {
  case CompressionType::None:
    return {data, CompressionType::None};
  case CompressionType::Gzip:
  case CompressionType::Zlib:
    out = deflateBytes(data, windowBitsFor(type));
    break;
  case CompressionType::Lz4:
#ifdef FILESYNC_HAVE_LZ4
    out = lz4Compress(data);
#endif
    break;
  }

  if (!out) {
    std::cerr << "[Compression] " << toString(type)
              << " compression failed, sending raw bytes" << std::endl;
    return {data, CompressionType::None};
  }
  return {std::move(*out), type};
}

std::optional<std::string> Compressor::decompress(const std::string &data,
                                                  CompressionType type) {
  switch (type) {
  case CompressionType::None:
    return data;
  case CompressionType::Gzip:
  case CompressionType::Zlib:
    return inflateBytes(data, windowBitsFor(type));
  case CompressionType::Lz4:
#ifdef FILESYNC_HAVE_LZ4
    return lz4Decompress(data);
#else
    std::cerr << "[Compression] lz4 support not compiled in" << std::endl;
    return std::nullopt;
#endif
  }
  return std::nullopt;
}

bool Compressor::shouldCompress(uint64_t size, const std::string &filename) {
  // Text files qualify below the general floor; a named file of unknown type
  // needs the larger default size.
  if (!filename.empty()) {
    auto ext = fileExtension(filename);
    if (kPrecompressedExtensions.count(ext))
      return false;
    if (kTextExtensions.count(ext))
      return size >= kMinTextCompressSize;
    return size >= kMinDefaultCompressSize;
  }
  return size >= kMinCompressSize;
}

CompressedPayload Compressor::chooseBestCompression(const std::string &data) {
  if (data.size() < kMinBestCompressionSize)
    return {data, CompressionType::None};

  CompressedPayload best{data, CompressionType::None};
  for (auto type : availableTypes()) {
    auto candidate = compress(data, type);
    if (candidate.type == CompressionType::None)
      continue;
    if (candidate.data.size() < best.data.size())
      best = std::move(candidate);
  }

  if (best.type == CompressionType::None ||
      compressionRatio(data.size(), best.data.size()) >= kAdoptRatio)
    return {data, CompressionType::None};
  return best;
}

double Compressor::compressionRatio(uint64_t originalSize,
                                    uint64_t compressedSize) {
  if (originalSize == 0)
    return 0.0;
  return static_cast<double>(compressedSize) /
         static_cast<double>(originalSize);
}

} // namespace filesync
