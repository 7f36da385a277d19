#pragma once

#include <reorg/interfaces.h>
#include <reorg/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace reorg {

struct ProcessResult {
  bool spawned = false;
  int exit_status = -1;
  std::string error;
};

// Runs argv[0] (looked up on PATH) with stdout and stderr appended to the
// given log file, and waits for it.
ProcessResult RunProcess(const std::vector<std::string> &argv,
                         const std::filesystem::path &output_log);

// Delegates transfers to rsync. A batch is grouped by destination directory;
// each group gets a --files-from list in a scratch directory and one rsync
// process. A group whose rsync could not run or exited with a fatal status
// fails as a whole. After a clean or partial transfer (exit 23 or 24) each
// job is judged by comparing the destination's size and modification time
// with its source, so one bad file does not fail its whole group.
class RsyncTransferStrategy : public TransferStrategy {
public:
  explicit RsyncTransferStrategy(std::shared_ptr<Logger> logger = nullptr,
                                 std::string rsync_binary = "rsync");

  std::string Name() const override { return "rsync"; }
  std::vector<TransferOutcome>
  TransferBatch(const std::vector<const CopyJob *> &batch) override;

private:
  std::shared_ptr<Logger> logger_;
  std::string rsync_binary_;
};

} // namespace reorg
