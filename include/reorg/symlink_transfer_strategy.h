#pragma once

#include <reorg/interfaces.h>
#include <reorg/logging.h>

#include <filesystem>
#include <memory>
#include <system_error>

namespace reorg {

// Places an absolute symbolic link to the source at each destination instead
// of copying bytes. An existing destination is replaced atomically.
class SymlinkTransferStrategy : public TransferStrategy {
public:
  explicit SymlinkTransferStrategy(std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return "symlink"; }
  std::vector<TransferOutcome>
  TransferBatch(const std::vector<const CopyJob *> &batch) override;

private:
  std::shared_ptr<Logger> logger_;
};

bool ReplaceWithSymlink(const std::filesystem::path &source,
                        const std::filesystem::path &destination,
                        std::error_code &ec);

} // namespace reorg
