#pragma once

#include <reorg/cancellation.h>
#include <reorg/interfaces.h>
#include <reorg/logging.h>

#include <filesystem>
#include <memory>

namespace reorg {

// Indexes every regular file below the root by its bare filename in one
// streaming recursive pass. Duplicate filenames are resolved by the policy:
// kKeepSmallestPath keeps the lexicographically smallest generic path,
// kReject throws SetupError listing the duplicates once the scan finishes.
// The excluded directory (typically an output root nested in the source tree)
// is not descended into. A cancelled token stops the scan before the next
// entry and returns the partial index marked interrupted.
class FilesystemSourceIndexer : public SourceIndexer {
public:
  explicit FilesystemSourceIndexer(
      CollisionPolicy policy = CollisionPolicy::kKeepSmallestPath,
      std::shared_ptr<Logger> logger = nullptr,
      std::filesystem::path excluded_directory = {},
      std::shared_ptr<CancellationToken> cancellation = nullptr);

  SourceIndex BuildIndex(const std::filesystem::path &root) override;

private:
  CollisionPolicy policy_;
  std::shared_ptr<Logger> logger_;
  std::filesystem::path excluded_directory_;
  std::shared_ptr<CancellationToken> cancellation_;
};

} // namespace reorg
