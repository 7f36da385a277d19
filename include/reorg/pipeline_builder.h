#pragma once

#include <reorg/cancellation.h>
#include <reorg/component_registry.h>
#include <reorg/interfaces.h>
#include <reorg/logging.h>

#include <memory>
#include <string>

namespace reorg {

class DefaultReorganizePipeline;

struct PipelineComponents {
  // Optional; when empty the pipeline indexes with a FilesystemSourceIndexer
  // configured from the run's collision policy and output root.
  std::unique_ptr<SourceIndexer> indexer;
  std::unique_ptr<TransferStrategy> strategy;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<CancellationToken> cancellation;
};

class ReorganizePipelineBuilder {
public:
  explicit ReorganizePipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  ReorganizePipelineBuilder &WithIndexer(std::unique_ptr<SourceIndexer> indexer);
  ReorganizePipelineBuilder &
  WithStrategy(std::unique_ptr<TransferStrategy> strategy);
  ReorganizePipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  ReorganizePipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  ReorganizePipelineBuilder &
  WithCancellation(std::shared_ptr<CancellationToken> cancellation);
  ReorganizePipelineBuilder &WithStrategyName(std::string name);
  ReorganizePipelineBuilder &WithReporterName(std::string name);
  ReorganizePipelineBuilder &WithRsyncBinary(std::string rsync_binary);

  DefaultReorganizePipeline Build();

private:
  const ComponentRegistry *registry_;
  struct ComponentSelections {
    std::string strategy;
    std::string reporter;
    std::string rsync_binary = "rsync";
  } selections_;
  PipelineComponents components_;
};

} // namespace reorg
