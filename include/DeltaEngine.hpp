#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace filesync {

/**
 * DeltaEngine computes fixed-size chunk signatures of a file, the delta of a
 * candidate file against a reference signature, and rebuilds a file from a
 * delta plus the reference copy.
 *
 * Chunk boundaries are offset aligned: an insertion near the start of a file
 * marks every later chunk as changed.
 */
class DeltaEngine {
public:
  static constexpr uint32_t kDefaultChunkSize = 8192;

  explicit DeltaEngine(uint32_t chunkSize = kDefaultChunkSize);

  uint32_t chunkSize() const { return m_chunkSize; }

  // Empty when the file is missing or unreadable.
  std::vector<FileChunk> createSignature(const std::string &path) const;

  FileDelta createDelta(const std::string &candidatePath,
                        const std::vector<FileChunk> &referenceSignature) const;

  // Writes outputPath + ".tmp" and renames it over outputPath. sourcePath
  // supplies the bytes of unchanged chunks.
  bool applyDelta(const std::string &outputPath, const FileDelta &delta,
                  const std::string &sourcePath) const;

  static bool shouldUseDifferential(uint64_t fileSize,
                                    double estimatedChangeRatio = 0.3);
  static TransferSavings calculateTransferSavings(const FileDelta &delta);

  // Weak polynomial hash (base 256, mod 1000003).
  static uint32_t computeRollingHash(const std::string &data);

private:
  uint32_t m_chunkSize;
};

} // namespace filesync
