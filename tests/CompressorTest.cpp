#include "Compressor.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace filesync;

namespace {

std::string repetitiveText(size_t size) {
  std::string out;
  while (out.size() < size)
    out += "The quick brown fox jumps over the lazy dog. ";
  out.resize(size);
  return out;
}

} // namespace

TEST(CompressorTest, ShouldCompressDecisions) {
  EXPECT_FALSE(Compressor::shouldCompress(100));
  EXPECT_TRUE(Compressor::shouldCompress(512));
  EXPECT_FALSE(Compressor::shouldCompress(10000, "photo.jpg"));
  EXPECT_FALSE(Compressor::shouldCompress(10000, "ARCHIVE.ZIP"));
  EXPECT_TRUE(Compressor::shouldCompress(256, "x.txt"));
  EXPECT_FALSE(Compressor::shouldCompress(255, "x.txt"));
  EXPECT_TRUE(Compressor::shouldCompress(300, "main.CPP"));
}

TEST(CompressorTest, UnknownExtensionNeedsDefaultSize) {
  EXPECT_FALSE(Compressor::shouldCompress(800, "data.bin"));
  EXPECT_TRUE(Compressor::shouldCompress(1024, "data.bin"));
}

TEST(CompressorTest, GzipAndZlibRoundTrip) {
  auto original = repetitiveText(10000);
  for (auto type : {CompressionType::Gzip, CompressionType::Zlib}) {
    auto packed = Compressor::compress(original, type);
    EXPECT_EQ(packed.type, type);
    EXPECT_LT(packed.data.size(), original.size());

    auto restored = Compressor::decompress(packed.data, packed.type);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, original);
  }
}

TEST(CompressorTest, GzipFramingIsRecognizable) {
  auto packed = Compressor::compress(repetitiveText(2000), CompressionType::Gzip);
  ASSERT_GE(packed.data.size(), 2u);
  EXPECT_EQ(static_cast<unsigned char>(packed.data[0]), 0x1f);
  EXPECT_EQ(static_cast<unsigned char>(packed.data[1]), 0x8b);
}

TEST(CompressorTest, CorruptInputFailsToDecompress) {
  auto packed = Compressor::compress(repetitiveText(5000), CompressionType::Zlib);
  EXPECT_FALSE(Compressor::decompress("definitely not zlib", CompressionType::Zlib)
                   .has_value());
  auto truncated = packed.data.substr(0, packed.data.size() / 2);
  EXPECT_FALSE(Compressor::decompress(truncated, CompressionType::Zlib).has_value());
}

TEST(CompressorTest, Lz4FallsBackWhenUnavailable) {
  auto packed = Compressor::compress(repetitiveText(4000), CompressionType::Lz4);
  if (Compressor::isAvailable(CompressionType::Lz4))
    EXPECT_EQ(packed.type, CompressionType::Lz4);
  else
    EXPECT_EQ(packed.type, CompressionType::Zlib);

  auto restored = Compressor::decompress(packed.data, packed.type);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(*restored, repetitiveText(4000));
}

TEST(CompressorTest, BestCompressionSkipsSmallAndRandomData) {
  EXPECT_EQ(Compressor::chooseBestCompression("tiny").type, CompressionType::None);

  auto noise = test::randomBytes(8192);
  auto result = Compressor::chooseBestCompression(noise);
  EXPECT_EQ(result.type, CompressionType::None);
  EXPECT_EQ(result.data, noise);
}

TEST(CompressorTest, BestCompressionPicksSmallestOutput) {
  auto text = repetitiveText(50000);
  auto best = Compressor::chooseBestCompression(text);
  EXPECT_NE(best.type, CompressionType::None);
  EXPECT_LT(Compressor::compressionRatio(text.size(), best.data.size()), 0.9);

  for (auto type : Compressor::availableTypes())
    EXPECT_LE(best.data.size(), Compressor::compress(text, type).data.size());
}

TEST(CompressorTest, TypeNamesParse) {
  EXPECT_EQ(parseCompressionType("gzip"), CompressionType::Gzip);
  EXPECT_EQ(parseCompressionType("none"), CompressionType::None);
  EXPECT_FALSE(parseCompressionType("brotli").has_value());
  EXPECT_EQ(toString(CompressionType::Zlib), "zlib");
  EXPECT_DOUBLE_EQ(Compressor::compressionRatio(0, 0), 0.0);
}
