#pragma once

#include <reorg/cancellation.h>
#include <reorg/logging.h>
#include <reorg/metadata_parser.h>
#include <reorg/models.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace reorg {

struct CopyPlannerOptions {
  std::filesystem::path output_root;
  LabelRoutes base_model_routes;
  LabelRoutes model_routes;
  bool copy_sidecars = false;
  // Checked before each record; a cancelled plan is partial and marked
  // interrupted.
  std::shared_ptr<CancellationToken> cancellation;
};

// Joins metadata records against the source index. Every record becomes
// either a job or an unresolved entry, so
// jobs.size() + unresolved.size() == parsed_records.
class CopyPlanner {
public:
  explicit CopyPlanner(CopyPlannerOptions options,
                       std::shared_ptr<Logger> logger = nullptr);

  CopyPlan Plan(MetadataReader &reader, const SourceIndex &index) const;
  CopyPlan Plan(const std::vector<MetadataRecord> &records,
                const SourceIndex &index) const;

  TaxonomyNode ResolveNode(const MetadataRecord &record) const;
  std::filesystem::path DestinationFor(const MetadataRecord &record) const;

private:
  class Accumulator;

  bool Cancelled() const;

  CopyPlannerOptions options_;
  std::shared_ptr<Logger> logger_;
};

// "<stem>.json" for a file that is not itself a JSON document.
std::string SidecarFilename(const std::string &filename);

} // namespace reorg
