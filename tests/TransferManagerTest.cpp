#include "PathUtils.hpp"
#include "SyncServer.hpp"
#include "TestHelpers.hpp"
#include "TransferManager.hpp"
#include "httplib.h"
#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using namespace filesync;
using test::TempDir;

TEST(TransferManagerChunkTest, AdaptiveChunkSizes) {
  EXPECT_EQ(TransferManager::adaptiveChunkSize(0), 8u * 1024);
  EXPECT_EQ(TransferManager::adaptiveChunkSize(1024 * 1024 - 1), 8u * 1024);
  EXPECT_EQ(TransferManager::adaptiveChunkSize(1024 * 1024), 32u * 1024);
  EXPECT_EQ(TransferManager::adaptiveChunkSize(10 * 1024 * 1024), 64u * 1024);
  EXPECT_EQ(TransferManager::adaptiveChunkSize(100ull * 1024 * 1024), 128u * 1024);
}

class TransferManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.sync_directory = serverDir.str();
    config.allowed_extensions = {};

    server = std::make_unique<SyncServer>(config, serverMetrics);
    auto started = server->start();
    ASSERT_TRUE(started.ok()) << started.error().describe();

    TransferOptions options;
    options.timeout = std::chrono::seconds(5);
    transfers = std::make_unique<TransferManager>(
        "127.0.0.1", server->httpPort(), clientDir.str(), "laptop_1", options,
        metrics);
  }

  void TearDown() override {
    transfers.reset();
    if (server)
      server->stop();
  }

  std::string serverCopy(const std::string &rel) {
    return test::readFile(serverDir / rel);
  }

  TempDir serverDir;
  TempDir clientDir;
  InMemoryMetrics serverMetrics;
  InMemoryMetrics metrics;
  std::unique_ptr<SyncServer> server;
  std::unique_ptr<TransferManager> transfers;
};

TEST_F(TransferManagerTest, UploadThenDownloadElsewhere) {
  auto body = test::randomBytes(70000, 1);
  test::writeFile(clientDir / "photos" / "a.bin", body);

  ASSERT_TRUE(transfers->uploadFile("photos/a.bin").ok());
  EXPECT_EQ(serverCopy("photos/a.bin"), body);
  EXPECT_EQ(metrics.counter("transfer.upload.bytes"), 70000);

  TempDir other;
  TransferManager peer("127.0.0.1", server->httpPort(), other.str(), "desk_1",
                       {}, metrics);
  ASSERT_TRUE(peer.downloadFile("photos/a.bin").ok());
  EXPECT_EQ(test::readFile(other / "photos" / "a.bin"), body);
  EXPECT_FALSE(std::filesystem::exists(
      (other / "photos" / "a.bin").string() + kPartialSuffix));
}

TEST_F(TransferManagerTest, TextIsCompressedOnTheWire) {
  std::string text;
  for (int i = 0; i < 400; ++i)
    text += "line " + std::to_string(i) + " of a very repetitive log file\n";
  test::writeFile(clientDir / "app.log", text);

  ASSERT_TRUE(transfers->uploadFile("app.log").ok());
  EXPECT_EQ(serverCopy("app.log"), text);

  auto stored = server->store().get("app.log");
  ASSERT_TRUE(stored.ok());
  ASSERT_TRUE(stored.value().has_value());
  EXPECT_EQ(stored.value()->size, text.size());
  EXPECT_EQ(stored.value()->checksum, calculateHash(text.data(), text.size()));
}

TEST_F(TransferManagerTest, DownloadResumesFromPartialFile) {
  auto body = test::randomBytes(60000, 2);
  test::writeFile(serverDir / "big.bin", body);
  test::writeFile((clientDir / "big.bin").string() + kPartialSuffix,
                  body.substr(0, 25000));

  auto checksum = calculateHash(body.data(), body.size());
  ASSERT_TRUE(transfers->downloadFile("big.bin", checksum).ok());
  EXPECT_EQ(test::readFile(clientDir / "big.bin"), body);
  EXPECT_EQ(metrics.counter("transfer.download.resumed"), 1);
  EXPECT_EQ(metrics.counter("transfer.download.bytes"), 35000);
}

TEST_F(TransferManagerTest, StalePartialFromOlderVersionIsRefetched) {
  auto v1 = test::randomBytes(60000, 21);
  auto v2 = test::randomBytes(60000, 22);
  test::writeFile(serverDir / "doc.bin", v2);
  test::writeFile((clientDir / "doc.bin").string() + kPartialSuffix,
                  v1.substr(0, 30000));

  ASSERT_TRUE(
      transfers->downloadFile("doc.bin", calculateHash(v2.data(), v2.size())).ok());
  EXPECT_EQ(test::readFile(clientDir / "doc.bin"), v2);
  EXPECT_EQ(metrics.counter("transfer.download.checksum_mismatch"), 1);
  EXPECT_EQ(metrics.counter("transfer.download.resumed"), 0);
}

TEST_F(TransferManagerTest, PartialFileIsDiscardedWithoutChecksum) {
  auto body = test::randomBytes(60000, 23);
  test::writeFile(serverDir / "plain.bin", body);
  test::writeFile((clientDir / "plain.bin").string() + kPartialSuffix,
                  test::randomBytes(20000, 24));

  ASSERT_TRUE(transfers->downloadFile("plain.bin").ok());
  EXPECT_EQ(test::readFile(clientDir / "plain.bin"), body);
  EXPECT_EQ(metrics.counter("transfer.download.resumed"), 0);
  EXPECT_EQ(metrics.counter("transfer.download.bytes"), 60000);
}

TEST_F(TransferManagerTest, OversizedPartialFileRestartsFromZero) {
  auto body = test::randomBytes(4000, 3);
  test::writeFile(serverDir / "small.bin", body);
  test::writeFile((clientDir / "small.bin").string() + kPartialSuffix,
                  test::randomBytes(5000, 9));

  ASSERT_TRUE(
      transfers->downloadFile("small.bin", calculateHash(body.data(), body.size()))
          .ok());
  EXPECT_EQ(test::readFile(clientDir / "small.bin"), body);
  EXPECT_EQ(metrics.counter("transfer.download.resumed"), 0);
}

TEST_F(TransferManagerTest, MissingRemoteDropsPartialFile) {
  auto part = (clientDir / "ghost.txt").string() + kPartialSuffix;
  test::writeFile(part, "stale");

  auto result = transfers->downloadFile("ghost.txt");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
  EXPECT_FALSE(std::filesystem::exists(part));
  EXPECT_FALSE(std::filesystem::exists(clientDir / "ghost.txt"));
  EXPECT_EQ(metrics.counter("transfer.download.failed"), 1);
}

TEST_F(TransferManagerTest, UnsafeDownloadPathIsRejected) {
  auto result = transfers->downloadFile("../escape.txt");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::FileOperation);
}

TEST_F(TransferManagerTest, MissingLocalFileIsNotFound) {
  auto result = transfers->uploadFile("nowhere.bin");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
  EXPECT_EQ(result.error().path, "nowhere.bin");

  std::filesystem::create_directories(clientDir / "folder");
  EXPECT_EQ(transfers->uploadFile("folder").error().kind, ErrorKind::NotFound);
}

TEST_F(TransferManagerTest, DifferentialUploadSendsOnlyChangedChunks) {
  auto original = test::randomBytes(400 * 1024, 5);
  test::writeFile(clientDir / "disk.img", original);
  ASSERT_TRUE(transfers->uploadFile("disk.img").ok());

  auto edited = original;
  for (size_t i = 100000; i < 100100; ++i)
    edited[i] = static_cast<char>(~edited[i]);
  test::writeFile(clientDir / "disk.img", edited);

  ASSERT_TRUE(transfers->uploadFile("disk.img", true).ok());
  EXPECT_EQ(serverCopy("disk.img"), edited);
  EXPECT_GT(metrics.counter("transfer.delta.bytes_saved"), 300 * 1024);
}

TEST_F(TransferManagerTest, DifferentialFallsBackWithoutServerCopy) {
  auto body = test::randomBytes(200 * 1024, 6);
  test::writeFile(clientDir / "fresh.bin", body);

  ASSERT_TRUE(transfers->uploadFile("fresh.bin", true).ok());
  EXPECT_EQ(serverCopy("fresh.bin"), body);
  EXPECT_EQ(metrics.counter("transfer.delta.bytes_saved"), 0);
}

TEST_F(TransferManagerTest, BatchesReportEachPath) {
  std::vector<std::string> paths;
  for (int i = 0; i < 7; ++i) {
    auto name = "batch/f" + std::to_string(i) + ".bin";
    test::writeFile(clientDir / name, test::randomBytes(3000 + i, i));
    paths.push_back(name);
  }
  paths.push_back("batch/missing.bin");

  auto uploads = transfers->uploadAll(paths);
  EXPECT_EQ(uploads.succeeded.size(), 7u);
  ASSERT_EQ(uploads.failed.size(), 1u);
  EXPECT_EQ(uploads.failed[0].path, "batch/missing.bin");
  EXPECT_EQ(uploads.failed[0].error.kind, ErrorKind::NotFound);
  EXPECT_FALSE(uploads.ok());

  TempDir other;
  TransferManager peer("127.0.0.1", server->httpPort(), other.str(), "desk_1",
                       {}, metrics);
  paths.pop_back();
  auto downloads = peer.downloadAll(paths);
  EXPECT_TRUE(downloads.ok());
  EXPECT_EQ(downloads.succeeded.size(), 7u);
  for (const auto &path : paths)
    EXPECT_EQ(test::readFile(other / path), test::readFile(clientDir / path));

  EXPECT_TRUE(transfers->uploadAll({}).ok());
}

TEST_F(TransferManagerTest, DeleteRemoteRemovesServerCopy) {
  test::writeFile(clientDir / "old.txt", "obsolete");
  ASSERT_TRUE(transfers->uploadFile("old.txt").ok());
  ASSERT_TRUE(std::filesystem::exists(serverDir / "old.txt"));

  ASSERT_TRUE(transfers->deleteRemote("old.txt").ok());
  EXPECT_FALSE(std::filesystem::exists(serverDir / "old.txt"));
  EXPECT_EQ(metrics.counter("transfer.delete"), 1);
  EXPECT_TRUE(transfers->deleteRemote("old.txt").ok());
}

// A stand-in server that answers slowly and refuses some paths, to observe
// how the client schedules and classifies requests.
class TransferManagerStubServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto answer = [this](const std::string &rel, httplib::Response &res) {
      int now = ++inFlight;
      int seen = maxInFlight.load();
      while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      --inFlight;

      if (rel.rfind("locked/", 0) == 0) {
        res.status = 403;
        res.set_content(R"({"detail":"Permission denied"})", "application/json");
      } else if (rel.rfind("full/", 0) == 0) {
        res.status = 507;
        res.set_content(R"({"detail":"Insufficient storage"})", "application/json");
      } else {
        res.status = 200;
        res.set_content("payload", "application/octet-stream");
      }
    };
    stub.Post("/upload", [answer](const httplib::Request &req,
                                  httplib::Response &res) {
      answer(req.form.get_field("relative_path"), res);
      if (res.status == 200)
        res.set_content(R"({"success":true})", "application/json");
    });
    stub.Get(R"(/download/(.+))", [answer](const httplib::Request &req,
                                           httplib::Response &res) {
      answer(req.matches[1].str(), res);
    });

    port = stub.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    thread = std::thread([this]() { stub.listen_after_bind(); });
    stub.wait_until_ready();

    TransferOptions options;
    options.timeout = std::chrono::seconds(5);
    options.maxConcurrentUploads = 3;
    options.maxConcurrentDownloads = 3;
    options.enableCompression = false;
    transfers = std::make_unique<TransferManager>(
        "127.0.0.1", port, clientDir.str(), "laptop_1", options, metrics);
  }

  void TearDown() override {
    transfers.reset();
    stub.stop();
    if (thread.joinable())
      thread.join();
  }

  httplib::Server stub;
  std::thread thread;
  int port = 0;
  std::atomic<int> inFlight{0};
  std::atomic<int> maxInFlight{0};
  TempDir clientDir;
  InMemoryMetrics metrics;
  std::unique_ptr<TransferManager> transfers;
};

TEST_F(TransferManagerStubServerTest, BatchesNeverExceedTheConcurrencyLimit) {
  std::vector<std::string> paths;
  for (int i = 0; i < 9; ++i) {
    auto name = "many/f" + std::to_string(i) + ".bin";
    test::writeFile(clientDir / name, test::randomBytes(1000, i));
    paths.push_back(name);
  }

  auto uploads = transfers->uploadAll(paths);
  EXPECT_TRUE(uploads.ok());
  EXPECT_EQ(uploads.succeeded.size(), 9u);
  EXPECT_LE(maxInFlight.load(), 3);
  EXPECT_GE(maxInFlight.load(), 2);

  maxInFlight = 0;
  auto downloads = transfers->downloadAll(paths);
  EXPECT_TRUE(downloads.ok());
  EXPECT_LE(maxInFlight.load(), 3);
  EXPECT_GE(maxInFlight.load(), 2);
}

TEST_F(TransferManagerStubServerTest, RefusalsAreClassified) {
  test::writeFile(clientDir / "locked" / "a.bin", test::randomBytes(100, 1));
  test::writeFile(clientDir / "full" / "b.bin", test::randomBytes(100, 2));

  auto denied = transfers->uploadFile("locked/a.bin");
  ASSERT_FALSE(denied.ok());
  EXPECT_EQ(denied.error().kind, ErrorKind::Permission);

  auto noSpace = transfers->uploadFile("full/b.bin");
  ASSERT_FALSE(noSpace.ok());
  EXPECT_EQ(noSpace.error().kind, ErrorKind::DiskSpace);

  auto fetch = transfers->downloadFile("locked/c.bin");
  ASSERT_FALSE(fetch.ok());
  EXPECT_EQ(fetch.error().kind, ErrorKind::Permission);
  EXPECT_FALSE(std::filesystem::exists(clientDir / "locked" / "c.bin"));
}
