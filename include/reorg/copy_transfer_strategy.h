#pragma once

#include <reorg/interfaces.h>
#include <reorg/logging.h>

#include <filesystem>
#include <memory>
#include <system_error>

namespace reorg {

// Copies through a staging file next to the destination and renames it into
// place, so an interrupted copy never leaves a truncated destination.
// Permissions and modification time follow the source.
class CopyTransferStrategy : public TransferStrategy {
public:
  explicit CopyTransferStrategy(std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return "copy"; }
  std::vector<TransferOutcome>
  TransferBatch(const std::vector<const CopyJob *> &batch) override;

private:
  TransferOutcome TransferOne(const CopyJob &job) const;

  std::shared_ptr<Logger> logger_;
};

bool CopyFilePreservingAttributes(const std::filesystem::path &source,
                                  const std::filesystem::path &destination,
                                  std::error_code &ec);

} // namespace reorg
