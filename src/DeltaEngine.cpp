#include "DeltaEngine.hpp"
#include "PathUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace filesync {

namespace {

constexpr uint64_t kMinDifferentialSize = 64 * 1024;
constexpr uint64_t kAlwaysDifferentialSize = 1024 * 1024;
constexpr uint32_t kRollingBase = 256;
constexpr uint32_t kRollingModulus = 1000003;

// Reads exactly len bytes at offset. False on a short read.
bool readChunk(std::ifstream &in, uint64_t offset, uint32_t len,
               std::string &out) {
  out.resize(len);
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset));
  if (!in)
    return false;
  in.read(&out[0], len);
  return static_cast<uint32_t>(in.gcount()) == len;
}

} // namespace

DeltaEngine::DeltaEngine(uint32_t chunkSize)
    : m_chunkSize(chunkSize == 0 ? kDefaultChunkSize : chunkSize) {}

std::vector<FileChunk>
DeltaEngine::createSignature(const std::string &path) const {
  std::vector<FileChunk> chunks;
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    return chunks;

  std::string buffer(m_chunkSize, '\0');
  uint64_t offset = 0;
  while (in) {
    in.read(&buffer[0], m_chunkSize);
    auto got = static_cast<uint32_t>(in.gcount());
    if (got == 0)
      break;

    FileChunk chunk;
    chunk.offset = offset;
    chunk.size = got;
    chunk.checksum = calculateHash(buffer.data(), got);
    chunks.push_back(std::move(chunk));
    offset += got;
  }
  return chunks;
}

FileDelta
DeltaEngine::createDelta(const std::string &candidatePath,
                         const std::vector<FileChunk> &referenceSignature) const {
  FileDelta delta;
  delta.chunk_size = m_chunkSize;

  std::unordered_set<std::string> known;
  for (const auto &chunk : referenceSignature)
    known.insert(chunk.checksum);

  auto signature = createSignature(candidatePath);
  std::ifstream in(candidatePath, std::ios::binary);

  uint64_t changedBytes = 0;
  for (auto &chunk : signature) {
    delta.total_size += chunk.size;
    if (known.count(chunk.checksum)) {
      delta.unchanged_chunks.push_back(chunk);
      continue;
    }

    std::string data;
    if (!in.is_open() || !readChunk(in, chunk.offset, chunk.size, data)) {
      // File shrank or vanished while diffing; keep the reference bytes.
      delta.unchanged_chunks.push_back(chunk);
      continue;
    }
    chunk.data = std::move(data);
    changedBytes += chunk.size;
    delta.changed_chunks.push_back(std::move(chunk));
  }

  delta.compression_ratio =
      delta.total_size == 0
          ? 1.0
          : static_cast<double>(changedBytes) /
                static_cast<double>(delta.total_size);
  return delta;
}

bool DeltaEngine::applyDelta(const std::string &outputPath,
                             const FileDelta &delta,
                             const std::string &sourcePath) const {
  std::vector<const FileChunk *> ordered;
  ordered.reserve(delta.unchanged_chunks.size() + delta.changed_chunks.size());
  for (const auto &c : delta.unchanged_chunks)
    ordered.push_back(&c);
  for (const auto &c : delta.changed_chunks)
    ordered.push_back(&c);
  std::sort(ordered.begin(), ordered.end(),
            [](const FileChunk *a, const FileChunk *b) {
              return a->offset < b->offset;
            });

  const std::string tmpPath = outputPath + ".tmp";
  std::error_code ec;

  auto fail = [&](const std::string &reason) {
    std::cerr << "[Delta] Failed to apply delta to " << outputPath << ": "
              << reason << std::endl;
    fs::remove(tmpPath, ec);
    return false;
  };

  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
      return fail("cannot open temporary file");

    std::ifstream source;
    std::string buffer;
    for (const auto *chunk : ordered) {
      if (chunk->data) {
        out.write(chunk->data->data(),
                  static_cast<std::streamsize>(chunk->data->size()));
      } else {
        if (!source.is_open()) {
          source.open(sourcePath, std::ios::binary);
          if (!source.is_open())
            return fail("cannot open source " + sourcePath);
        }
        if (!readChunk(source, chunk->offset, chunk->size, buffer))
          return fail("short read at offset " + std::to_string(chunk->offset));
        out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      }
      if (!out)
        return fail("write error");
    }
    out.flush();
    if (!out)
      return fail("flush error");
  }

  fs::rename(tmpPath, outputPath, ec);
  if (ec)
    return fail(ec.message());
  return true;
}

bool DeltaEngine::shouldUseDifferential(uint64_t fileSize,
                                        double estimatedChangeRatio) {
  if (fileSize < kMinDifferentialSize)
    return false;
  if (fileSize > kAlwaysDifferentialSize)
    return true;
  return estimatedChangeRatio < 0.5;
}

TransferSavings DeltaEngine::calculateTransferSavings(const FileDelta &delta) {
  TransferSavings savings;
  savings.total_size = delta.total_size;
  for (const auto &c : delta.changed_chunks)
    savings.changed_size += c.size;
  for (const auto &c : delta.unchanged_chunks)
    savings.unchanged_size += c.size;

  if (savings.total_size == 0) {
    savings.transfer_ratio = 1.0;
    savings.savings_percent = 0.0;
    return savings;
  }
  savings.transfer_ratio = static_cast<double>(savings.changed_size) /
                           static_cast<double>(savings.total_size);
  savings.savings_percent = static_cast<double>(savings.unchanged_size) /
                            static_cast<double>(savings.total_size) * 100.0;
  return savings;
}

uint32_t DeltaEngine::computeRollingHash(const std::string &data) {
  uint64_t hash = 0;
  for (unsigned char byte : data)
    hash = (hash * kRollingBase + byte) % kRollingModulus;
  return static_cast<uint32_t>(hash);
}

} // namespace filesync
