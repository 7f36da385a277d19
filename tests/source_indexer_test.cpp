#include <reorg/errors.h>
#include <reorg/filesystem_source_indexer.h>

#include <filesystem>
#include <memory>
#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include "test_support/temporary_tree.h"

namespace reorg {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

std::filesystem::path Canonical(const std::filesystem::path &path) {
  return std::filesystem::weakly_canonical(path);
}

TEST(SourceIndexerTest, IndexesNestedRegularFilesByFilename) {
  test::TemporaryTree tree;
  const auto a = tree.AddFile("src/x/y/z/a.png", "A");
  const auto b = tree.AddFile("src/b.png", "B");
  tree.AddDirectory("src/empty/deeper");

  FilesystemSourceIndexer indexer;
  const auto index = indexer.BuildIndex(tree.root() / "src");

  EXPECT_EQ(index.files_seen, 2u);
  EXPECT_EQ(index.entries.size(), 2u);
  EXPECT_EQ(index.collisions, 0u);
  ASSERT_NE(index.Find("a.png"), nullptr);
  EXPECT_EQ(*index.Find("a.png"), Canonical(a));
  ASSERT_NE(index.Find("b.png"), nullptr);
  EXPECT_EQ(*index.Find("b.png"), Canonical(b));
  EXPECT_EQ(index.Find("empty"), nullptr);
  EXPECT_EQ(index.Find("missing.png"), nullptr);
}

TEST(SourceIndexerTest, IndexesAbsolutePathsForRelativeRoot) {
  test::TemporaryTree tree;
  tree.AddFile("src/a.png");
  const auto previous = std::filesystem::current_path();
  std::filesystem::current_path(tree.root());

  FilesystemSourceIndexer indexer;
  const auto index = indexer.BuildIndex("src");
  std::filesystem::current_path(previous);

  ASSERT_NE(index.Find("a.png"), nullptr);
  EXPECT_TRUE(index.Find("a.png")->is_absolute());
}

TEST(SourceIndexerTest, KeepsLexicographicallySmallestPathOnCollision) {
  test::TemporaryTree tree;
  tree.AddFile("src/b/dup.png", "from b");
  const auto smallest = tree.AddFile("src/a/dup.png", "from a");
  tree.AddFile("src/c/deep/dup.png", "from c");

  std::ostringstream log;
  FilesystemSourceIndexer indexer(
      CollisionPolicy::kKeepSmallestPath,
      MakeLogger(LoggingConfig{LogLevel::kWarn}, log));
  const auto index = indexer.BuildIndex(tree.root() / "src");

  EXPECT_EQ(index.files_seen, 3u);
  EXPECT_EQ(index.entries.size(), 1u);
  EXPECT_EQ(index.collisions, 2u);
  EXPECT_THAT(index.collided_names, ElementsAre("dup.png"));
  ASSERT_NE(index.Find("dup.png"), nullptr);
  EXPECT_EQ(*index.Find("dup.png"), Canonical(smallest));
  EXPECT_THAT(log.str(), HasSubstr("index.collisions"));
}

TEST(SourceIndexerTest, RejectPolicyNamesDuplicates) {
  test::TemporaryTree tree;
  tree.AddFile("src/a/dup.png");
  tree.AddFile("src/b/dup.png");
  tree.AddFile("src/unique.png");

  FilesystemSourceIndexer indexer(CollisionPolicy::kReject);
  try {
    indexer.BuildIndex(tree.root() / "src");
    FAIL() << "Expected SetupError";
  } catch (const SetupError &error) {
    EXPECT_THAT(error.what(), HasSubstr("dup.png"));
  }
}

TEST(SourceIndexerTest, RejectPolicyAcceptsUniqueNames) {
  test::TemporaryTree tree;
  tree.AddFile("src/a/one.png");
  tree.AddFile("src/b/two.png");

  FilesystemSourceIndexer indexer(CollisionPolicy::kReject);
  EXPECT_EQ(indexer.BuildIndex(tree.root() / "src").entries.size(), 2u);
}

TEST(SourceIndexerTest, FailsForMissingOrNonDirectoryRoot) {
  test::TemporaryTree tree;
  const auto file = tree.AddFile("file.txt");

  FilesystemSourceIndexer indexer;
  EXPECT_THROW(indexer.BuildIndex(tree.root() / "missing"), SetupError);
  EXPECT_THROW(indexer.BuildIndex(file), SetupError);
  EXPECT_THROW(indexer.BuildIndex(""), SetupError);
}

TEST(SourceIndexerTest, SkipsExcludedDirectory) {
  test::TemporaryTree tree;
  tree.AddFile("data/a.png");
  tree.AddFile("data/output/sd1.5/v1/a.png");
  tree.AddFile("data/output/sd1.5/v1/only_in_output.png");

  FilesystemSourceIndexer indexer(CollisionPolicy::kReject, nullptr,
                                  tree.root() / "data" / "output" / "");
  const auto index = indexer.BuildIndex(tree.root() / "data");

  EXPECT_EQ(index.files_seen, 1u);
  EXPECT_EQ(index.collisions, 0u);
  EXPECT_EQ(index.Find("only_in_output.png"), nullptr);
}

TEST(SourceIndexerTest, StopsScanningOnceCancelled) {
  test::TemporaryTree tree;
  tree.AddFile("src/a/dup.png");
  tree.AddFile("src/b/dup.png");
  auto cancellation = std::make_shared<CancellationToken>();
  cancellation->Cancel();
  std::stringstream log;

  FilesystemSourceIndexer indexer(
      CollisionPolicy::kReject,
      MakeLogger(LoggingConfig{LogLevel::kWarn}, log), {}, cancellation);
  const auto index = indexer.BuildIndex(tree.root() / "src");

  EXPECT_TRUE(index.interrupted);
  EXPECT_EQ(index.files_seen, 0u);
  EXPECT_TRUE(index.entries.empty());
  EXPECT_THAT(log.str(), HasSubstr("index.cancelled"));
}

TEST(SourceIndexerTest, SkipsUnreadableSubdirectories) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "permission checks do not apply to root";
  }
  test::TemporaryTree tree;
  tree.AddFile("src/visible.png");
  tree.AddFile("src/locked/hidden.png");
  std::filesystem::permissions(tree.root() / "src" / "locked",
                               std::filesystem::perms::none);

  FilesystemSourceIndexer indexer;
  const auto index = indexer.BuildIndex(tree.root() / "src");

  std::filesystem::permissions(tree.root() / "src" / "locked",
                               std::filesystem::perms::owner_all);
  EXPECT_NE(index.Find("visible.png"), nullptr);
  EXPECT_EQ(index.Find("hidden.png"), nullptr);
}

} // namespace
} // namespace reorg
