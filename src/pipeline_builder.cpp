#include <reorg/pipeline_builder.h>

#include <reorg/default_reorganize_pipeline.h>

#include <utility>

namespace reorg {

ReorganizePipelineBuilder::ReorganizePipelineBuilder(
    const ComponentRegistry &registry)
    : registry_(&registry) {
  selections_.strategy = registry_->DefaultStrategyName();
  selections_.reporter = registry_->DefaultReporterName();
}

ReorganizePipelineBuilder &
ReorganizePipelineBuilder::WithIndexer(std::unique_ptr<SourceIndexer> indexer) {
  components_.indexer = std::move(indexer);
  return *this;
}

ReorganizePipelineBuilder &ReorganizePipelineBuilder::WithStrategy(
    std::unique_ptr<TransferStrategy> strategy) {
  components_.strategy = std::move(strategy);
  return *this;
}

ReorganizePipelineBuilder &
ReorganizePipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

ReorganizePipelineBuilder &
ReorganizePipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

ReorganizePipelineBuilder &ReorganizePipelineBuilder::WithCancellation(
    std::shared_ptr<CancellationToken> cancellation) {
  components_.cancellation = std::move(cancellation);
  return *this;
}

ReorganizePipelineBuilder &
ReorganizePipelineBuilder::WithStrategyName(std::string name) {
  selections_.strategy = std::move(name);
  return *this;
}

ReorganizePipelineBuilder &
ReorganizePipelineBuilder::WithReporterName(std::string name) {
  selections_.reporter = std::move(name);
  return *this;
}

ReorganizePipelineBuilder &
ReorganizePipelineBuilder::WithRsyncBinary(std::string rsync_binary) {
  selections_.rsync_binary = std::move(rsync_binary);
  return *this;
}

DefaultReorganizePipeline ReorganizePipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.strategy) {
    StrategyOptions options;
    options.logger = components_.logger;
    options.rsync_binary = selections_.rsync_binary;
    components_.strategy =
        registry_->CreateStrategy(selections_.strategy, options);
  }
  components_.reporter = components_.reporter
                             ? std::move(components_.reporter)
                             : registry_->CreateReporter(selections_.reporter);
  if (!components_.cancellation) {
    components_.cancellation = std::make_shared<CancellationToken>();
  }
  return DefaultReorganizePipeline(std::move(components_));
}

} // namespace reorg
