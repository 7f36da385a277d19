#include <reorg/taxonomy_builder.h>

#include <utility>

namespace reorg {

std::filesystem::path TaxonomyDirectory(const std::filesystem::path &output_root,
                                        const TaxonomyNode &node) {
  return output_root / node.base_label / node.model_label;
}

bool EnsureDirectory(const std::filesystem::path &directory,
                     std::error_code &ec) {
  ec.clear();
  std::filesystem::create_directories(directory, ec);
  if (!ec) {
    return true;
  }
  // Another caller may have created it between our check and mkdir.
  std::error_code status_error;
  if (std::filesystem::is_directory(directory, status_error)) {
    ec.clear();
    return true;
  }
  return false;
}

TaxonomyBuilder::TaxonomyBuilder(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

TaxonomyResult TaxonomyBuilder::Build(const std::filesystem::path &output_root,
                                      const std::vector<TaxonomyNode> &nodes) const {
  TaxonomyResult result;
  for (const auto &node : nodes) {
    const auto directory = TaxonomyDirectory(output_root, node);
    std::error_code ec;
    if (EnsureDirectory(directory, ec)) {
      ++result.directories_ensured;
      continue;
    }
    logger_->Log(LogLevel::kWarn, "taxonomy.directory.failed",
                 {{"directory", directory.string()}, {"error", ec.message()}});
    result.failed_directories.push_back(directory.string());
  }

  logger_->Log(LogLevel::kInfo, "taxonomy.complete",
               {{"root", output_root.string()},
                {"directories", std::to_string(result.directories_ensured)},
                {"failed", std::to_string(result.failed_directories.size())}});
  return result;
}

} // namespace reorg
