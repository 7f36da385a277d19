#include <reorg/summary_reporter.h>

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace reorg {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

CopyJob Job(const std::string &filename, const std::string &destination) {
  CopyJob job;
  job.record.filename = filename;
  job.source_path = "/src/" + filename;
  job.destination_path = destination;
  return job;
}

TransferOutcome Outcome(TransferStatus status, const std::string &error = "",
                        bool sidecar = false) {
  TransferOutcome outcome;
  outcome.status = status;
  outcome.error = error;
  outcome.sidecar_copied = sidecar;
  return outcome;
}

struct Fixture {
  CopyPlan plan;
  SourceIndex index;
  TaxonomyResult taxonomy;
  ExecutionResult execution;
};

Fixture MixedRun() {
  Fixture fixture;
  fixture.plan.parsed_records = 6;
  fixture.plan.malformed_rows = 2;
  fixture.plan.duplicate_destinations = 1;
  fixture.plan.jobs = {Job("a.png", "/out/b/m/a.png"),
                       Job("b.png", "/out/b/m/b.png"),
                       Job("c.png", "/out/b/n/c.png"),
                       Job("d.png", "/out/b/n/d.png")};
  fixture.plan.unresolved.resize(2);
  fixture.index.files_seen = 10;
  fixture.index.collisions = 3;
  fixture.taxonomy.directories_ensured = 2;
  fixture.taxonomy.failed_directories = {"/out/x/y"};
  fixture.execution.strategy = "copy";
  fixture.execution.worker_count = 16;
  fixture.execution.transfer_seconds = 1.5;
  fixture.execution.outcomes = {
      Outcome(TransferStatus::kCopied, "", true),
      Outcome(TransferStatus::kFailed, "Permission denied"),
      Outcome(TransferStatus::kCopied),
      Outcome(TransferStatus::kCancelled)};
  return fixture;
}

ReorganizeConfig Config() {
  ReorganizeConfig config;
  config.metadata_file = "meta.csv";
  config.source_root = "/data/src";
  config.output_root = "/data/out";
  config.formats = {"text"};
  return config;
}

TEST(BuildRunReportTest, CountsEveryOutcome) {
  const auto fixture = MixedRun();

  const auto summary =
      BuildRunReport(fixture.plan, fixture.index, fixture.taxonomy,
                     fixture.execution, 4.0, false);

  EXPECT_EQ(summary.total_records, 6u);
  EXPECT_EQ(summary.malformed_rows, 2u);
  EXPECT_EQ(summary.resolved, 4u);
  EXPECT_EQ(summary.skipped_unresolved, 2u);
  EXPECT_EQ(summary.copied, 2u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.cancelled, 1u);
  EXPECT_EQ(summary.sidecars_copied, 1u);
  EXPECT_EQ(summary.source_files_seen, 10u);
  EXPECT_EQ(summary.filename_collisions, 3u);
  EXPECT_EQ(summary.duplicate_destinations, 1u);
  EXPECT_EQ(summary.directories_ensured, 2u);
  EXPECT_EQ(summary.directory_failures, 1u);
  EXPECT_EQ(summary.strategy, "copy");
  EXPECT_EQ(summary.worker_count, 16u);
  EXPECT_DOUBLE_EQ(summary.elapsed_seconds, 4.0);
  EXPECT_DOUBLE_EQ(summary.transfer_seconds, 1.5);
  EXPECT_DOUBLE_EQ(summary.throughput, 0.5);
  ASSERT_EQ(summary.failures.size(), 1u);
  EXPECT_EQ(summary.failures[0].filename, "b.png");
  EXPECT_EQ(summary.failures[0].destination, "/out/b/m/b.png");
  EXPECT_EQ(summary.failures[0].error, "Permission denied");
}

TEST(BuildRunReportTest, ThroughputIsZeroWithoutElapsedTime) {
  const auto fixture = MixedRun();

  const auto summary =
      BuildRunReport(fixture.plan, fixture.index, fixture.taxonomy,
                     fixture.execution, 0.0, false);

  EXPECT_DOUBLE_EQ(summary.throughput, 0.0);
}

TEST(BuildRunReportTest, DryRunHasNoTransferCounts) {
  auto fixture = MixedRun();
  fixture.execution.outcomes.clear();

  const auto summary =
      BuildRunReport(fixture.plan, fixture.index, fixture.taxonomy,
                     fixture.execution, 1.0, true);

  EXPECT_TRUE(summary.dry_run);
  EXPECT_EQ(summary.resolved, 4u);
  EXPECT_EQ(summary.copied, 0u);
  EXPECT_EQ(summary.failed, 0u);
  EXPECT_EQ(summary.cancelled, 0u);
}

TEST(SummaryReporterTest, RendersTextSummary) {
  const auto fixture = MixedRun();
  const auto summary =
      BuildRunReport(fixture.plan, fixture.index, fixture.taxonomy,
                     fixture.execution, 4.0, false);

  SummaryReporter reporter;
  const auto report = reporter.Render(summary, Config());

  EXPECT_THAT(report.text, HasSubstr("Reorganization summary ("));
  EXPECT_THAT(report.text, HasSubstr("Source:"));
  EXPECT_THAT(report.text, HasSubstr("/data/src"));
  EXPECT_THAT(report.text, HasSubstr("Records parsed:"));
  EXPECT_THAT(report.text, HasSubstr("Jobs skipped (unresolved):  2"));
  EXPECT_THAT(report.text, HasSubstr("Jobs copied:"));
  EXPECT_THAT(report.text, HasSubstr("Elapsed time:"));
  EXPECT_THAT(report.text, HasSubstr("4.00 s"));
  EXPECT_THAT(report.text, HasSubstr("0.50 files/s"));
  EXPECT_THAT(report.text,
              HasSubstr("  - b.png -> /out/b/m/b.png: Permission denied"));
  EXPECT_THAT(report.text, Not(HasSubstr("Dry run")));
  EXPECT_TRUE(report.json.empty());
}

TEST(SummaryReporterTest, NotesDryRunAndInterruption) {
  RunReport summary;
  summary.dry_run = true;
  summary.interrupted = true;

  SummaryReporter reporter;
  const auto report = reporter.Render(summary, Config());

  EXPECT_THAT(report.text, HasSubstr("Dry run: no directories were created"));
  EXPECT_THAT(report.text, HasSubstr("Interrupted:"));
}

TEST(SummaryReporterTest, TruncatesLongFailureList) {
  RunReport summary;
  for (int i = 0; i < 25; ++i) {
    summary.failures.push_back(
        JobFailure{"f" + std::to_string(i) + ".png", "/out/x", "boom"});
  }
  summary.failed = summary.failures.size();

  SummaryReporter reporter;
  const auto report = reporter.Render(summary, Config());

  EXPECT_THAT(report.text, HasSubstr("f19.png"));
  EXPECT_THAT(report.text, Not(HasSubstr("f20.png")));
  EXPECT_THAT(report.text, HasSubstr("... and 5 more"));
}

TEST(SummaryReporterTest, RendersJsonWhenRequested) {
  const auto fixture = MixedRun();
  const auto summary =
      BuildRunReport(fixture.plan, fixture.index, fixture.taxonomy,
                     fixture.execution, 4.0, false);
  auto config = Config();
  config.formats = {"text", "json"};

  SummaryReporter reporter;
  const auto report = reporter.Render(summary, config);

  EXPECT_THAT(report.json, HasSubstr("\"strategy\": \"copy\""));
  EXPECT_THAT(report.json, HasSubstr("\"copied\": 2,"));
  EXPECT_THAT(report.json, HasSubstr("\"skipped_unresolved\": 2,"));
  EXPECT_THAT(report.json, HasSubstr("\"throughput\": 0.50,"));
  EXPECT_THAT(report.json, HasSubstr("\"error\": \"Permission denied\""));
  EXPECT_EQ(report.json.front(), '{');
  EXPECT_EQ(report.json.back(), '}');
}

TEST(SummaryReporterTest, EscapesJsonStrings) {
  EXPECT_EQ(EscapeJsonString("plain"), "plain");
  EXPECT_EQ(EscapeJsonString("say \"hi\"\\"), "say \\\"hi\\\"\\\\");
  EXPECT_EQ(EscapeJsonString("a\nb\tc"), "a\\nb\\tc");
  EXPECT_EQ(EscapeJsonString(std::string("x\x01y")), "x\\u0001y");
}

} // namespace
} // namespace reorg
