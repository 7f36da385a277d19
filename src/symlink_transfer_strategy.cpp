#include <reorg/symlink_transfer_strategy.h>

#include <reorg/scoped_path.h>

#include <utility>

namespace reorg {

bool ReplaceWithSymlink(const std::filesystem::path &source,
                        const std::filesystem::path &destination,
                        std::error_code &ec) {
  ec.clear();
  const auto target = std::filesystem::absolute(source, ec);
  if (ec) {
    return false;
  }
  if (!std::filesystem::exists(target, ec)) {
    if (!ec) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return false;
  }
  ScopedStagingFile staging(destination);
  std::filesystem::create_symlink(target, staging.path(), ec);
  if (ec) {
    return false;
  }
  return staging.Commit(ec);
}

SymlinkTransferStrategy::SymlinkTransferStrategy(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<TransferOutcome> SymlinkTransferStrategy::TransferBatch(
    const std::vector<const CopyJob *> &batch) {
  std::vector<TransferOutcome> outcomes;
  outcomes.reserve(batch.size());
  for (const auto *job : batch) {
    TransferOutcome outcome;
    std::error_code ec;
    if (!ReplaceWithSymlink(job->source_path, job->destination_path, ec)) {
      outcome.status = TransferStatus::kFailed;
      outcome.error = ec.message();
      outcomes.push_back(std::move(outcome));
      continue;
    }
    outcome.status = TransferStatus::kCopied;
    if (job->sidecar_source) {
      const auto sidecar_destination = job->destination_path.parent_path() /
                                       job->sidecar_source->filename();
      outcome.sidecar_copied =
          ReplaceWithSymlink(*job->sidecar_source, sidecar_destination, ec);
      if (!outcome.sidecar_copied) {
        logger_->Log(LogLevel::kWarn, "transfer.sidecar.failed",
                     {{"source", job->sidecar_source->string()},
                      {"destination", sidecar_destination.string()},
                      {"error", ec.message()}});
      }
    }
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

} // namespace reorg
