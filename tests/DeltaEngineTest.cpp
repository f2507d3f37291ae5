#include "DeltaEngine.hpp"
#include "PathUtils.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace filesync;
using test::TempDir;

class DeltaEngineTest : public ::testing::Test {
protected:
  std::string path(const std::string &name) const { return (dir / name).string(); }

  TempDir dir;
  DeltaEngine engine{1024};
};

TEST_F(DeltaEngineTest, SignatureCoversWholeFileInOrder) {
  test::writeFile(path("a.bin"), test::randomBytes(3000));
  auto signature = engine.createSignature(path("a.bin"));

  ASSERT_EQ(signature.size(), 3u);
  uint64_t expected = 0;
  for (const auto &chunk : signature) {
    EXPECT_EQ(chunk.offset, expected);
    EXPECT_FALSE(chunk.data.has_value());
    EXPECT_EQ(chunk.checksum.size(), 64u);
    expected += chunk.size;
  }
  EXPECT_EQ(signature.back().size, 3000u - 2048u);
  EXPECT_EQ(expected, 3000u);
}

TEST_F(DeltaEngineTest, SignatureIsDeterministic) {
  test::writeFile(path("a.bin"), test::randomBytes(5000));
  auto first = engine.createSignature(path("a.bin"));
  auto second = engine.createSignature(path("a.bin"));
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i)
    EXPECT_EQ(first[i].checksum, second[i].checksum);
}

TEST_F(DeltaEngineTest, MissingFileHasEmptySignature) {
  EXPECT_TRUE(engine.createSignature(path("nope.bin")).empty());
}

TEST_F(DeltaEngineTest, IdenticalFilesProduceNoChangedChunks) {
  auto bytes = test::randomBytes(4096);
  test::writeFile(path("old.bin"), bytes);
  test::writeFile(path("new.bin"), bytes);

  auto delta = engine.createDelta(path("new.bin"),
                                  engine.createSignature(path("old.bin")));
  EXPECT_TRUE(delta.changed_chunks.empty());
  EXPECT_EQ(delta.unchanged_chunks.size(), 4u);
  EXPECT_DOUBLE_EQ(delta.compression_ratio, 0.0);

  auto savings = DeltaEngine::calculateTransferSavings(delta);
  EXPECT_DOUBLE_EQ(savings.savings_percent, 100.0);
  EXPECT_DOUBLE_EQ(savings.transfer_ratio, 0.0);
}

TEST_F(DeltaEngineTest, ModifiedChunkIsCarriedAndApplied) {
  auto original = test::randomBytes(4096, 1);
  auto modified = original;
  modified[1500] = static_cast<char>(modified[1500] ^ 0x5a);
  modified += "tail bytes";
  test::writeFile(path("server.bin"), original);
  test::writeFile(path("client.bin"), modified);

  auto delta = engine.createDelta(path("client.bin"),
                                  engine.createSignature(path("server.bin")));
  ASSERT_EQ(delta.changed_chunks.size(), 2u);
  EXPECT_EQ(delta.changed_chunks[0].offset, 1024u);
  EXPECT_EQ(delta.changed_chunks[1].offset, 4096u);
  ASSERT_TRUE(delta.changed_chunks[0].data.has_value());
  EXPECT_EQ(delta.total_size, modified.size());

  ASSERT_TRUE(engine.applyDelta(path("server.bin"), delta, path("server.bin")));
  EXPECT_EQ(test::readFile(path("server.bin")), modified);
  EXPECT_FALSE(std::filesystem::exists(path("server.bin") + ".tmp"));
  EXPECT_EQ(calculateHash(path("server.bin")), calculateHash(path("client.bin")));
}

TEST_F(DeltaEngineTest, InsertionShiftsEveryLaterChunk) {
  auto original = test::randomBytes(4096, 2);
  test::writeFile(path("old.bin"), original);
  test::writeFile(path("new.bin"), "X" + original);

  auto delta = engine.createDelta(path("new.bin"),
                                  engine.createSignature(path("old.bin")));
  EXPECT_TRUE(delta.unchanged_chunks.empty());
  EXPECT_EQ(delta.changed_chunks.size(), 5u);
  EXPECT_DOUBLE_EQ(delta.compression_ratio, 1.0);
}

TEST_F(DeltaEngineTest, ApplyFailsWithoutSourceAndLeavesNoTemp) {
  auto bytes = test::randomBytes(2048, 3);
  test::writeFile(path("ref.bin"), bytes);
  auto delta = engine.createDelta(path("ref.bin"), engine.createSignature(path("ref.bin")));

  EXPECT_FALSE(engine.applyDelta(path("out.bin"), delta, path("missing.bin")));
  EXPECT_FALSE(std::filesystem::exists(path("out.bin")));
  EXPECT_FALSE(std::filesystem::exists(path("out.bin") + ".tmp"));
}

TEST_F(DeltaEngineTest, SavingsOfEmptyDeltaDoNotDivideByZero) {
  FileDelta empty;
  auto savings = DeltaEngine::calculateTransferSavings(empty);
  EXPECT_DOUBLE_EQ(savings.transfer_ratio, 1.0);
  EXPECT_DOUBLE_EQ(savings.savings_percent, 0.0);
}

TEST_F(DeltaEngineTest, DifferentialThresholds) {
  EXPECT_FALSE(DeltaEngine::shouldUseDifferential(1000));
  EXPECT_TRUE(DeltaEngine::shouldUseDifferential(100 * 1024, 0.3));
  EXPECT_FALSE(DeltaEngine::shouldUseDifferential(100 * 1024, 0.7));
  EXPECT_TRUE(DeltaEngine::shouldUseDifferential(5 * 1024 * 1024, 0.9));
}

TEST_F(DeltaEngineTest, RollingHashIsBounded) {
  EXPECT_EQ(DeltaEngine::computeRollingHash(""), 0u);
  EXPECT_EQ(DeltaEngine::computeRollingHash("A"), 65u);
  EXPECT_EQ(DeltaEngine::computeRollingHash("AB"), 65u * 256 + 66);
  EXPECT_LT(DeltaEngine::computeRollingHash(test::randomBytes(1000)), 1000003u);
}
