#pragma once

#include <reorg/pipeline_builder.h>

#include <memory>

namespace reorg {

// Opens the metadata, indexes, plans, prepares the output root, builds the
// taxonomy, executes and reports. A dry run stops after planning. Cancellation
// is checked inside indexing and planning and between stages; an interrupted
// run still reports, with every unstarted job counted as cancelled.
class DefaultReorganizePipeline : public ReorganizePipeline {
public:
  explicit DefaultReorganizePipeline(PipelineComponents components);

  PipelineResult Run(const ReorganizeConfig &config) override;

private:
  bool StopRequested(const char *stage) const;

  std::unique_ptr<SourceIndexer> indexer_;
  std::unique_ptr<TransferStrategy> strategy_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<CancellationToken> cancellation_;
};

// Creates the output root when missing. Throws SetupError when it cannot be
// created, is not a directory or is not writable.
void PrepareOutputRoot(const std::filesystem::path &output_root);

} // namespace reorg
