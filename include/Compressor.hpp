#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace filesync {

enum class CompressionType { None, Gzip, Zlib, Lz4 };

std::string toString(CompressionType type);
std::optional<CompressionType> parseCompressionType(const std::string &value);

struct CompressedPayload {
  std::string data;
  CompressionType type = CompressionType::None;
};

/**
 * Compressor wraps zlib (gzip and zlib framing) and, when found at configure
 * time, the LZ4 frame format. Without LZ4, requests for it are served with
 * zlib and reported as such.
 */
class Compressor {
public:
  static constexpr int kLevel = 6;

  static CompressedPayload compress(const std::string &data,
                                    CompressionType type);
  static std::optional<std::string> decompress(const std::string &data,
                                               CompressionType type);

  static bool shouldCompress(uint64_t size, const std::string &filename = "");
  static CompressedPayload chooseBestCompression(const std::string &data);

  static bool isAvailable(CompressionType type);
  static std::vector<CompressionType> availableTypes();
  static double compressionRatio(uint64_t originalSize, uint64_t compressedSize);
};

} // namespace filesync
