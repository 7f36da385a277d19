#include <reorg/retry_manifest.h>

#include <reorg/csv.h>
#include <reorg/metadata_parser.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace reorg {
namespace {

std::string ManifestRow(const MetadataRecord &record) {
  return JoinCsvRow({record.filename, record.base_model, record.model_name,
                     record.model_type});
}

} // namespace

std::size_t WriteRetryManifest(std::ostream &stream, const CopyPlan &plan,
                               const ExecutionResult &execution) {
  stream << JoinCsvRow(std::vector<std::string>(kMetadataColumns.begin(),
                                                kMetadataColumns.end()))
         << "\n";

  std::size_t rows = 0;
  for (const auto &record : plan.unresolved) {
    stream << ManifestRow(record) << "\n";
    ++rows;
  }
  const auto count = std::min(plan.jobs.size(), execution.outcomes.size());
  for (std::size_t i = 0; i < count; ++i) {
    if (execution.outcomes[i].status == TransferStatus::kFailed) {
      stream << ManifestRow(plan.jobs[i].record) << "\n";
      ++rows;
    }
  }
  return rows;
}

std::size_t WriteRetryManifest(const std::filesystem::path &path,
                               const CopyPlan &plan,
                               const ExecutionResult &execution) {
  std::ofstream stream(path, std::ios::trunc);
  if (!stream) {
    throw std::runtime_error("Failed to open retry manifest: " + path.string());
  }
  const auto rows = WriteRetryManifest(stream, plan, execution);
  stream.flush();
  if (!stream) {
    throw std::runtime_error("Failed to write retry manifest: " +
                             path.string());
  }
  return rows;
}

} // namespace reorg
