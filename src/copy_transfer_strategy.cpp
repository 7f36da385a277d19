#include <reorg/copy_transfer_strategy.h>

#include <reorg/scoped_path.h>

#include <utility>

namespace reorg {

bool CopyFilePreservingAttributes(const std::filesystem::path &source,
                                  const std::filesystem::path &destination,
                                  std::error_code &ec) {
  ec.clear();
  ScopedStagingFile staging(destination);
  std::filesystem::copy_file(source, staging.path(),
                             std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    return false;
  }

  const auto source_status = std::filesystem::status(source, ec);
  if (ec) {
    return false;
  }
  std::filesystem::permissions(staging.path(), source_status.permissions(),
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    return false;
  }
  const auto modified = std::filesystem::last_write_time(source, ec);
  if (ec) {
    return false;
  }
  std::filesystem::last_write_time(staging.path(), modified, ec);
  if (ec) {
    return false;
  }
  return staging.Commit(ec);
}

CopyTransferStrategy::CopyTransferStrategy(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<TransferOutcome>
CopyTransferStrategy::TransferBatch(const std::vector<const CopyJob *> &batch) {
  std::vector<TransferOutcome> outcomes;
  outcomes.reserve(batch.size());
  for (const auto *job : batch) {
    outcomes.push_back(TransferOne(*job));
  }
  return outcomes;
}

TransferOutcome CopyTransferStrategy::TransferOne(const CopyJob &job) const {
  TransferOutcome outcome;
  std::error_code ec;
  if (!CopyFilePreservingAttributes(job.source_path, job.destination_path,
                                    ec)) {
    outcome.status = TransferStatus::kFailed;
    outcome.error = ec.message();
    return outcome;
  }
  outcome.status = TransferStatus::kCopied;

  if (job.sidecar_source) {
    const auto sidecar_destination =
        job.destination_path.parent_path() / job.sidecar_source->filename();
    if (CopyFilePreservingAttributes(*job.sidecar_source, sidecar_destination,
                                     ec)) {
      outcome.sidecar_copied = true;
    } else {
      logger_->Log(LogLevel::kWarn, "transfer.sidecar.failed",
                   {{"source", job.sidecar_source->string()},
                    {"destination", sidecar_destination.string()},
                    {"error", ec.message()}});
    }
  }
  return outcome;
}

} // namespace reorg
