#include <reorg/copy_planner.h>

#include <reorg/label_router.h>
#include <reorg/name_normalizer.h>
#include <reorg/taxonomy_builder.h>

#include <set>
#include <unordered_set>
#include <utility>

namespace reorg {

std::string SidecarFilename(const std::string &filename) {
  const std::filesystem::path path(filename);
  if (EqualsIgnoreCase(path.extension().string(), ".json")) {
    return {};
  }
  return path.stem().string() + ".json";
}

class CopyPlanner::Accumulator {
public:
  Accumulator(const CopyPlanner &planner, const SourceIndex &index)
      : planner_(planner), index_(index) {}

  void Add(const MetadataRecord &record) {
    ++plan_.parsed_records;
    const auto *source = index_.Find(record.filename);
    if (source == nullptr) {
      planner_.logger_->Log(LogLevel::kDebug, "plan.unresolved",
                            {{"filename", record.filename},
                             {"line", std::to_string(record.line)}});
      plan_.unresolved.push_back(record);
      return;
    }

    const auto node = planner_.ResolveNode(record);
    CopyJob job;
    job.source_path = *source;
    job.destination_path =
        TaxonomyDirectory(planner_.options_.output_root, node) / record.filename;
    job.record = record;
    if (planner_.options_.copy_sidecars) {
      const auto sidecar = SidecarFilename(record.filename);
      if (const auto *sidecar_path =
              sidecar.empty() ? nullptr : index_.Find(sidecar)) {
        job.sidecar_source = *sidecar_path;
      }
    }

    if (!destinations_.insert(job.destination_path.string()).second) {
      ++plan_.duplicate_destinations;
    }
    taxonomy_.insert(node);
    plan_.jobs.push_back(std::move(job));
  }

  CopyPlan Finish(std::size_t malformed_rows) {
    plan_.malformed_rows = malformed_rows;
    plan_.taxonomy.assign(taxonomy_.begin(), taxonomy_.end());
    return std::move(plan_);
  }

private:
  const CopyPlanner &planner_;
  const SourceIndex &index_;
  CopyPlan plan_;
  std::set<TaxonomyNode> taxonomy_;
  std::unordered_set<std::string> destinations_;
};

CopyPlanner::CopyPlanner(CopyPlannerOptions options,
                         std::shared_ptr<Logger> logger)
    : options_(std::move(options)), logger_(EnsureLogger(std::move(logger))) {}

TaxonomyNode CopyPlanner::ResolveNode(const MetadataRecord &record) const {
  TaxonomyNode node;
  node.base_label = Normalize(
      RouteLabel(options_.base_model_routes, Normalize(record.base_model)));
  node.model_label = Normalize(
      RouteLabel(options_.model_routes, Normalize(EffectiveModel(record))));
  return node;
}

bool CopyPlanner::Cancelled() const {
  return options_.cancellation && options_.cancellation->IsCancelled();
}

std::filesystem::path
CopyPlanner::DestinationFor(const MetadataRecord &record) const {
  return TaxonomyDirectory(options_.output_root, ResolveNode(record)) /
         record.filename;
}

CopyPlan CopyPlanner::Plan(MetadataReader &reader,
                           const SourceIndex &index) const {
  Accumulator accumulator(*this, index);
  bool interrupted = false;
  while (true) {
    if (Cancelled()) {
      interrupted = true;
      break;
    }
    auto record = reader.Next();
    if (!record) {
      break;
    }
    accumulator.Add(*record);
  }
  auto plan = accumulator.Finish(reader.MalformedRows());
  plan.interrupted = interrupted;
  logger_->Log(LogLevel::kInfo, "plan.complete",
               {{"records", std::to_string(plan.parsed_records)},
                {"jobs", std::to_string(plan.jobs.size())},
                {"unresolved", std::to_string(plan.unresolved.size())},
                {"malformed", std::to_string(plan.malformed_rows)},
                {"directories", std::to_string(plan.taxonomy.size())}});
  return plan;
}

CopyPlan CopyPlanner::Plan(const std::vector<MetadataRecord> &records,
                           const SourceIndex &index) const {
  Accumulator accumulator(*this, index);
  bool interrupted = false;
  for (const auto &record : records) {
    if (Cancelled()) {
      interrupted = true;
      break;
    }
    accumulator.Add(record);
  }
  auto plan = accumulator.Finish(0);
  plan.interrupted = interrupted;
  return plan;
}

} // namespace reorg
