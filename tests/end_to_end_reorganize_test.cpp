#include <reorg/cancellation.h>
#include <reorg/cli_exit_codes.h>
#include <reorg/default_reorganize_pipeline.h>
#include <reorg/errors.h>
#include <reorg/logging.h>
#include <reorg/pipeline_builder.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_tree.h"

namespace reorg {
namespace {

using ::testing::HasSubstr;

constexpr char kThreeRowMetadata[] =
    "filename,base_model,model_name,model_type\n"
    "a.png,SD1.5,v1,Checkpoint\n"
    "b.png,SD1.5,someLora,LORA\n"
    "missing.png,SDXL,v2,Checkpoint\n";

class EndToEndReorganizeTest : public ::testing::Test {
protected:
  void SetUp() override {
    metadata_ = tree_.AddFile("meta.csv", kThreeRowMetadata);
    tree_.AddFile("source/2023/batch1/a.png", "alpha-bytes");
    tree_.AddFile("source/loras/b.png", "beta-bytes");
    tree_.AddFile("source/unlisted.png", "ignored");
  }

  ReorganizeConfig Config() const {
    ReorganizeConfig config;
    config.metadata_file = metadata_;
    config.source_root = tree_.root() / "source";
    config.output_root = tree_.root() / "output";
    config.worker_count = 4;
    config.formats = {"text", "json"};
    return config;
  }

  PipelineResult Run(const ReorganizeConfig &config,
                     const std::string &strategy = "copy",
                     std::shared_ptr<CancellationToken> cancellation = nullptr) {
    ReorganizePipelineBuilder builder;
    builder.WithLogger(MakeLogger(LoggingConfig{LogLevel::kInfo}, log_))
        .WithStrategyName(strategy)
        .WithCancellation(std::move(cancellation));
    auto pipeline = builder.Build();
    return pipeline.Run(config);
  }

  test::TemporaryTree tree_;
  std::filesystem::path metadata_;
  std::stringstream log_;
};

TEST_F(EndToEndReorganizeTest, CopiesResolvedRowsIntoTaxonomy) {
  const auto result = Run(Config());

  const auto output = tree_.root() / "output";
  EXPECT_EQ(test::ReadFile(output / "sd1.5" / "v1" / "a.png"), "alpha-bytes");
  EXPECT_EQ(test::ReadFile(output / "sd1.5" / "sd1.5" / "b.png"), "beta-bytes");
  EXPECT_FALSE(std::filesystem::exists(output / "sdxl"));
  EXPECT_FALSE(std::filesystem::exists(output / "sd1.5" / "somelora"));

  EXPECT_EQ(result.summary.total_records, 3u);
  EXPECT_EQ(result.summary.resolved, 2u);
  EXPECT_EQ(result.summary.skipped_unresolved, 1u);
  EXPECT_EQ(result.summary.copied, 2u);
  EXPECT_EQ(result.summary.failed, 0u);
  EXPECT_EQ(result.summary.source_files_seen, 3u);
  EXPECT_EQ(result.summary.directories_ensured, 2u);
  EXPECT_FALSE(result.summary.interrupted);
  EXPECT_THAT(result.report.text, HasSubstr("Jobs copied:"));
  EXPECT_THAT(result.report.json, HasSubstr("\"copied\": 2,"));
  EXPECT_THAT(log_.str(), HasSubstr("message=\"pipeline.complete\""));
}

TEST_F(EndToEndReorganizeTest, RerunIsIdempotent) {
  Run(Config());
  const auto second = Run(Config());

  EXPECT_EQ(second.summary.copied, 2u);
  EXPECT_EQ(second.summary.failed, 0u);
  const auto output = tree_.root() / "output";
  EXPECT_EQ(test::ReadFile(output / "sd1.5" / "v1" / "a.png"), "alpha-bytes");
  std::size_t files = 0;
  for (const auto &entry :
       std::filesystem::recursive_directory_iterator(output)) {
    if (entry.is_regular_file()) {
      ++files;
    }
  }
  EXPECT_EQ(files, 2u);
}

TEST_F(EndToEndReorganizeTest, SymlinkStrategyLinksSources) {
  Run(Config(), "symlink");

  const auto link = tree_.root() / "output" / "sd1.5" / "v1" / "a.png";
  EXPECT_TRUE(std::filesystem::is_symlink(link));
  EXPECT_EQ(test::ReadFile(link), "alpha-bytes");
}

TEST_F(EndToEndReorganizeTest, DryRunCreatesNothing) {
  auto config = Config();
  config.dry_run = true;

  const auto result = Run(config);

  EXPECT_FALSE(std::filesystem::exists(tree_.root() / "output"));
  EXPECT_EQ(result.summary.resolved, 2u);
  EXPECT_EQ(result.summary.copied, 0u);
  EXPECT_EQ(result.plan.jobs.size(), 2u);
  EXPECT_EQ(result.plan.jobs[0].destination_path,
            tree_.root() / "output" / "sd1.5" / "v1" / "a.png");
  EXPECT_THAT(result.report.text, HasSubstr("Dry run"));
}

TEST_F(EndToEndReorganizeTest, OutputInsideSourceIsNotIndexed) {
  auto config = Config();
  config.output_root = tree_.root() / "source" / "sorted";

  Run(config);
  const auto second = Run(config);

  EXPECT_EQ(second.summary.source_files_seen, 3u);
  EXPECT_EQ(second.summary.filename_collisions, 0u);
}

TEST_F(EndToEndReorganizeTest, MissingMetadataIsInputError) {
  auto config = Config();
  config.metadata_file = tree_.root() / "absent.csv";
  EXPECT_THROW(Run(config), InputError);
  EXPECT_FALSE(std::filesystem::exists(tree_.root() / "output"));
}

TEST_F(EndToEndReorganizeTest, MissingSourceIsSetupError) {
  auto config = Config();
  config.source_root = tree_.root() / "absent";
  EXPECT_THROW(Run(config), SetupError);
}

TEST_F(EndToEndReorganizeTest, OutputRootThatIsAFileIsSetupError) {
  auto config = Config();
  config.output_root = tree_.AddFile("occupied", "file");
  EXPECT_THROW(Run(config), SetupError);
}

TEST_F(EndToEndReorganizeTest, RejectPolicyFailsOnDuplicateFilenames) {
  tree_.AddFile("source/copy/a.png", "other");
  auto config = Config();
  config.collision_policy = CollisionPolicy::kReject;

  try {
    Run(config);
    FAIL() << "Expected SetupError";
  } catch (const SetupError &error) {
    EXPECT_THAT(error.what(), HasSubstr("a.png"));
  }
  EXPECT_FALSE(std::filesystem::exists(tree_.root() / "output"));
}

TEST_F(EndToEndReorganizeTest, CancelledBeforeRunCreatesNothing) {
  auto cancellation = std::make_shared<CancellationToken>();
  cancellation->Cancel();

  const auto result = Run(Config(), "copy", cancellation);

  EXPECT_FALSE(std::filesystem::exists(tree_.root() / "output"));
  EXPECT_TRUE(result.summary.interrupted);
  EXPECT_EQ(result.summary.copied, 0u);
  EXPECT_EQ(ExitCodeFor(result.summary), 130);
  EXPECT_THAT(log_.str(), HasSubstr("pipeline.cancelled"));
}

TEST_F(EndToEndReorganizeTest, CopiesSidecarsWhenEnabled) {
  tree_.AddFile("source/meta/a.json", "{\"prompt\": \"cat\"}");
  auto config = Config();
  config.copy_sidecars = true;

  const auto result = Run(config);

  EXPECT_EQ(result.summary.sidecars_copied, 1u);
  EXPECT_EQ(test::ReadFile(tree_.root() / "output" / "sd1.5" / "v1" / "a.json"),
            "{\"prompt\": \"cat\"}");
}

} // namespace
} // namespace reorg
