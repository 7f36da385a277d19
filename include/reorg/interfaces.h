#pragma once

#include <reorg/models.h>

#include <filesystem>
#include <string>
#include <vector>

namespace reorg {

class SourceIndexer {
public:
  virtual ~SourceIndexer() = default;
  virtual SourceIndex BuildIndex(const std::filesystem::path &root) = 0;
};

// Implementations are shared by all workers and must be thread-safe.
class TransferStrategy {
public:
  virtual ~TransferStrategy() = default;
  virtual std::string Name() const = 0;
  // Returns one outcome per job, in batch order.
  virtual std::vector<TransferOutcome>
  TransferBatch(const std::vector<const CopyJob *> &batch) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const RunReport &summary,
                        const ReorganizeConfig &config) = 0;
};

class ReorganizePipeline {
public:
  virtual ~ReorganizePipeline() = default;
  virtual PipelineResult Run(const ReorganizeConfig &config) = 0;
};

} // namespace reorg
