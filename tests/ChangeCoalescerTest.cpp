#include "ChangeCoalescer.hpp"
#include "PathUtils.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace filesync;
using namespace std::chrono_literals;
using test::TempDir;

class ChangeCoalescerTest : public ::testing::Test {
protected:
  void SetUp() override {
    CoalescerOptions options;
    options.ignorePatterns = {"*.tmp", ".git"};
    coalescer = std::make_unique<ChangeCoalescer>(
        root.str(),
        [this](const LocalChange &change) { committed.push_back(change); },
        options, metrics);
  }

  RawEvent event(RawEventKind kind, const std::string &rel,
                 const std::string &oldRel = "") {
    RawEvent e;
    e.kind = kind;
    e.absPath = (root / rel).string();
    if (!oldRel.empty())
      e.oldAbsPath = (root / oldRel).string();
    return e;
  }

  TempDir root;
  InMemoryMetrics metrics;
  std::vector<LocalChange> committed;
  std::unique_ptr<ChangeCoalescer> coalescer;
  ChangeCoalescer::Clock::time_point t0 = ChangeCoalescer::Clock::now();
};

TEST_F(ChangeCoalescerTest, RapidModificationsCommitOnce) {
  test::writeFile(root / "notes.txt", "v3");

  coalescer->onEvent(event(RawEventKind::Modified, "notes.txt"), t0);
  coalescer->onEvent(event(RawEventKind::Modified, "notes.txt"), t0 + 10ms);
  coalescer->onEvent(event(RawEventKind::Modified, "notes.txt"), t0 + 20ms);

  EXPECT_EQ(coalescer->pendingCount(), 1u);
  // The delay grows with each rapid event, so the base delay is not enough.
  EXPECT_EQ(coalescer->flushDue(t0 + 120ms), 0u);
  EXPECT_EQ(coalescer->flushDue(t0 + 2s), 1u);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Update);
  EXPECT_EQ(committed[0].info.path, "notes.txt");
  EXPECT_EQ(committed[0].info.size, 2u);
  EXPECT_FALSE(committed[0].info.checksum.empty());
  EXPECT_EQ(metrics.counter("watcher.events_coalesced"), 2);
}

TEST_F(ChangeCoalescerTest, CreateAbsorbsLaterUpdate) {
  test::writeFile(root / "new.txt", "hello");

  coalescer->onEvent(event(RawEventKind::Created, "new.txt"), t0);
  coalescer->onEvent(event(RawEventKind::Modified, "new.txt"), t0 + 5ms);
  coalescer->flushDue(t0 + 5s);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Create);
}

TEST_F(ChangeCoalescerTest, VanishedFileIsCommittedAsDelete) {
  coalescer->onEvent(event(RawEventKind::Modified, "gone.txt"), t0);
  coalescer->flushDue(t0 + 1s);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Delete);
  EXPECT_EQ(committed[0].info.path, "gone.txt");
  EXPECT_TRUE(committed[0].info.checksum.empty());
}

TEST_F(ChangeCoalescerTest, IgnoredPathsAreDropped) {
  test::writeFile(root / "build.tmp", "x");
  test::writeFile(root / ".git" / "HEAD", "ref");

  coalescer->onEvent(event(RawEventKind::Created, "build.tmp"), t0);
  coalescer->onEvent(event(RawEventKind::Modified, ".git/HEAD"), t0);
  coalescer->onEvent(event(RawEventKind::Created, std::string("a.txt") + kPartialSuffix),
                     t0);

  EXPECT_EQ(coalescer->pendingCount(), 0u);
}

TEST_F(ChangeCoalescerTest, MoveOutOfIgnoredNameBecomesCreate) {
  test::writeFile(root / "doc.txt", "saved");

  coalescer->onEvent(event(RawEventKind::Moved, "doc.txt", "doc.txt.tmp"), t0);
  coalescer->flushDue(t0 + 1s);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Create);
  EXPECT_FALSE(committed[0].old_path.has_value());
}

TEST_F(ChangeCoalescerTest, MoveKeepsRelativeSource) {
  test::writeFile(root / "b.txt", "moved");

  coalescer->onEvent(event(RawEventKind::Moved, "b.txt", "a.txt"), t0);
  coalescer->flushDue(t0 + 1s);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Move);
  ASSERT_TRUE(committed[0].old_path.has_value());
  EXPECT_EQ(*committed[0].old_path, "a.txt");
  EXPECT_EQ(committed[0].info.path, "b.txt");
}

TEST_F(ChangeCoalescerTest, EditAfterMoveKeepsSource) {
  test::writeFile(root / "b.txt", "moved then edited");

  coalescer->onEvent(event(RawEventKind::Moved, "b.txt", "a.txt"), t0);
  coalescer->onEvent(event(RawEventKind::Modified, "b.txt"), t0 + 5ms);
  coalescer->flushDue(t0 + 5s);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Move);
  ASSERT_TRUE(committed[0].old_path.has_value());
  EXPECT_EQ(*committed[0].old_path, "a.txt");
  EXPECT_EQ(committed[0].info.path, "b.txt");
}

TEST_F(ChangeCoalescerTest, DeleteAfterMoveKeepsSource) {
  coalescer->onEvent(event(RawEventKind::Moved, "d.txt", "c.txt"), t0);
  coalescer->onEvent(event(RawEventKind::Deleted, "d.txt"), t0 + 5ms);
  coalescer->flushDue(t0 + 5s);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Delete);
  EXPECT_EQ(committed[0].info.path, "d.txt");
  ASSERT_TRUE(committed[0].old_path.has_value());
  EXPECT_EQ(*committed[0].old_path, "c.txt");
}

TEST_F(ChangeCoalescerTest, MoveOfVanishedFileDeletesWithSource) {
  coalescer->onEvent(event(RawEventKind::Moved, "f.txt", "e.txt"), t0);
  coalescer->flushDue(t0 + 1s);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Delete);
  EXPECT_EQ(committed[0].info.path, "f.txt");
  ASSERT_TRUE(committed[0].old_path.has_value());
  EXPECT_EQ(*committed[0].old_path, "e.txt");
}

TEST_F(ChangeCoalescerTest, MoveIntoIgnoredNameDeletesSource) {
  coalescer->onEvent(event(RawEventKind::Moved, "a.txt.tmp", "a.txt"), t0);
  coalescer->flushDue(t0 + 1s);

  ASSERT_EQ(committed.size(), 1u);
  EXPECT_EQ(committed[0].operation, SyncOperation::Delete);
  EXPECT_EQ(committed[0].info.path, "a.txt");
}

TEST_F(ChangeCoalescerTest, StaleTimestampsAreForgotten) {
  test::writeFile(root / "a.txt", "a");
  coalescer->onEvent(event(RawEventKind::Modified, "a.txt"), t0);
  coalescer->flushDue(t0 + 1s);
  EXPECT_EQ(coalescer->trackedCount(), 1u);

  EXPECT_EQ(coalescer->cleanupStale(t0 + 1min), 0u);
  EXPECT_EQ(coalescer->cleanupStale(t0 + 10min), 1u);
  EXPECT_EQ(coalescer->trackedCount(), 0u);
}

TEST_F(ChangeCoalescerTest, SchedulerThreadCommitsOnItsOwn) {
  test::writeFile(root / "live.txt", "live");
  coalescer->start();
  coalescer->onEvent(event(RawEventKind::Modified, "live.txt"));

  EXPECT_TRUE(test::waitUntil([this]() { return coalescer->pendingCount() == 0; }));
  coalescer->stop();
  EXPECT_EQ(committed.size(), 1u);
}
