#pragma once

#include <reorg/logging.h>
#include <reorg/models.h>

#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace reorg {

std::filesystem::path TaxonomyDirectory(const std::filesystem::path &output_root,
                                        const TaxonomyNode &node);

// Create-if-missing for every node directory. An existing directory counts as
// success, so repeated and concurrent calls for the same node never fail.
// Directories that cannot be created are recorded, not thrown.
class TaxonomyBuilder {
public:
  explicit TaxonomyBuilder(std::shared_ptr<Logger> logger = nullptr);

  TaxonomyResult Build(const std::filesystem::path &output_root,
                       const std::vector<TaxonomyNode> &nodes) const;

private:
  std::shared_ptr<Logger> logger_;
};

bool EnsureDirectory(const std::filesystem::path &directory,
                     std::error_code &ec);

} // namespace reorg
