#include <reorg/default_reorganize_pipeline.h>

#include <reorg/copy_planner.h>
#include <reorg/errors.h>
#include <reorg/filesystem_source_indexer.h>
#include <reorg/metadata_parser.h>
#include <reorg/parallel_executor.h>
#include <reorg/summary_reporter.h>
#include <reorg/taxonomy_builder.h>

#include <chrono>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace reorg {

void PrepareOutputRoot(const std::filesystem::path &output_root) {
  std::error_code ec;
  if (!EnsureDirectory(output_root, ec)) {
    throw SetupError("Cannot create output root " + output_root.string() +
                     ": " + ec.message());
  }
  if (::access(output_root.c_str(), W_OK | X_OK) != 0) {
    throw SetupError("Output root is not writable: " + output_root.string());
  }
}

DefaultReorganizePipeline::DefaultReorganizePipeline(
    PipelineComponents components)
    : indexer_(std::move(components.indexer)),
      strategy_(std::move(components.strategy)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))),
      cancellation_(std::move(components.cancellation)) {}

bool DefaultReorganizePipeline::StopRequested(const char *stage) const {
  if (!cancellation_ || !cancellation_->IsCancelled()) {
    return false;
  }
  logger_->Log(LogLevel::kWarn, "pipeline.cancelled", {{"stage", stage}});
  return true;
}

PipelineResult DefaultReorganizePipeline::Run(const ReorganizeConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"metadata", config.metadata_file.string()},
                {"source", config.source_root.string()},
                {"output", config.output_root.string()},
                {"strategy", strategy_->Name()},
                {"dry_run", config.dry_run ? "true" : "false"}});
  const auto pipeline_start = std::chrono::steady_clock::now();

  auto reader = MetadataReader::Open(config.metadata_file, logger_);
  const ParallelExecutor executor(
      ExecutorOptions{config.worker_count, config.batch_size, cancellation_},
      logger_);

  PipelineResult result;
  result.execution.strategy = strategy_->Name();
  result.execution.worker_count = executor.WorkerCount();
  SourceIndex index;
  TaxonomyResult taxonomy;
  const auto finish = [&](bool interrupted) {
    if (interrupted) {
      // Every planned job that never reached a worker counts as cancelled.
      result.execution.outcomes.resize(result.plan.jobs.size());
      result.execution.cancelled = true;
    }
    const double elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                      pipeline_start)
            .count();
    result.summary = BuildRunReport(result.plan, index, taxonomy,
                                    result.execution, elapsed_seconds,
                                    config.dry_run);
    result.report = reporter_->Render(result.summary, config);
    logger_->Log(LogLevel::kInfo, "pipeline.complete",
                 {{"elapsed_seconds", std::to_string(elapsed_seconds)},
                  {"copied", std::to_string(result.summary.copied)},
                  {"failed", std::to_string(result.summary.failed)},
                  {"skipped",
                   std::to_string(result.summary.skipped_unresolved)},
                  {"interrupted",
                   result.summary.interrupted ? "true" : "false"}});
    return std::move(result);
  };

  if (indexer_) {
    index = indexer_->BuildIndex(config.source_root);
  } else {
    FilesystemSourceIndexer indexer(config.collision_policy, logger_,
                                    config.output_root, cancellation_);
    index = indexer.BuildIndex(config.source_root);
  }
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "index"},
                {"entries", std::to_string(index.entries.size())}});
  if (StopRequested("index") || index.interrupted) {
    return finish(true);
  }

  CopyPlannerOptions planner_options;
  planner_options.output_root = config.output_root;
  planner_options.base_model_routes = config.base_model_routes;
  planner_options.model_routes = config.model_routes;
  planner_options.copy_sidecars = config.copy_sidecars;
  planner_options.cancellation = cancellation_;
  const CopyPlanner planner(std::move(planner_options), logger_);

  result.plan = planner.Plan(reader, index);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "plan"},
                {"jobs", std::to_string(result.plan.jobs.size())},
                {"unresolved", std::to_string(result.plan.unresolved.size())}});
  if (StopRequested("plan") || result.plan.interrupted) {
    return finish(true);
  }
  if (config.dry_run) {
    return finish(false);
  }

  PrepareOutputRoot(config.output_root);
  if (StopRequested("prepare")) {
    return finish(true);
  }
  taxonomy = TaxonomyBuilder(logger_).Build(config.output_root,
                                            result.plan.taxonomy);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "taxonomy"},
                {"directories", std::to_string(taxonomy.directories_ensured)},
                {"failures", std::to_string(taxonomy.failed_directories.size())}});
  if (StopRequested("taxonomy")) {
    return finish(true);
  }

  result.execution = executor.Execute(result.plan.jobs, *strategy_);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "execute"},
                {"outcomes", std::to_string(result.execution.outcomes.size())}});
  return finish(false);
}

} // namespace reorg
