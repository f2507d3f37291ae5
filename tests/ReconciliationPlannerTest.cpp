#include "ReconciliationPlanner.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace filesync;

namespace {

FileInfo file(const std::string &path, const std::string &checksum,
              int64_t mtime) {
  FileInfo info;
  info.path = path;
  info.checksum = checksum;
  info.modified_time = mtime;
  info.size = checksum.size();
  return info;
}

std::vector<std::string> paths(const std::vector<FileInfo> &files) {
  std::vector<std::string> out;
  for (const auto &f : files)
    out.push_back(f.path);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

TEST(ReconciliationPlannerTest, ClassifiesEveryCase) {
  std::vector<FileInfo> client = {
      file("only_client.txt", "a", 100),
      file("same.txt", "s", 100),
      file("client_newer.txt", "c2", 200),
      file("server_newer.txt", "c1", 100),
      file("tie.txt", "t1", 300),
  };
  std::vector<FileInfo> server = {
      file("same.txt", "s", 50),
      file("client_newer.txt", "c1", 100),
      file("server_newer.txt", "s2", 200),
      file("tie.txt", "t2", 300),
      file("only_server.txt", "z", 100),
  };

  auto plan = ReconciliationPlanner::plan(client, server);
  EXPECT_EQ(paths(plan.files_to_push),
            (std::vector<std::string>{"client_newer.txt", "only_client.txt"}));
  EXPECT_EQ(paths(plan.files_to_pull), (std::vector<std::string>{"only_server.txt"}));
  EXPECT_EQ(plan.conflicts, (std::vector<std::string>{"server_newer.txt"}));
  EXPECT_EQ(plan.filesToSync().size(), 3u);
}

TEST(ReconciliationPlannerTest, PushedEntriesCarryClientMetadata) {
  auto plan = ReconciliationPlanner::plan({file("a.txt", "new", 900)},
                                          {file("a.txt", "old", 100)});
  ASSERT_EQ(plan.files_to_push.size(), 1u);
  EXPECT_EQ(plan.files_to_push[0].checksum, "new");
}

TEST(ReconciliationPlannerTest, PathsAreComparedNormalized) {
  auto plan = ReconciliationPlanner::plan({file("./docs//a.txt", "x", 1)},
                                          {file("docs/a.txt", "x", 1)});
  EXPECT_TRUE(plan.empty());
}

TEST(ReconciliationPlannerTest, EmptyManifests) {
  EXPECT_TRUE(ReconciliationPlanner::plan({}, {}).empty());

  auto fresh = ReconciliationPlanner::plan({}, {file("a", "1", 1), file("b", "2", 1)});
  EXPECT_EQ(fresh.files_to_pull.size(), 2u);
  EXPECT_TRUE(fresh.files_to_push.empty());

  auto first = ReconciliationPlanner::plan({file("a", "1", 1)}, {});
  EXPECT_EQ(first.files_to_push.size(), 1u);
}
