#pragma once

#include <reorg/cancellation.h>
#include <reorg/interfaces.h>
#include <reorg/logging.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace reorg {

constexpr std::size_t kMinDefaultWorkers = 16;
constexpr std::size_t kMaxDefaultWorkers = 128;

struct ExecutorOptions {
  // 0 selects DefaultWorkerCount().
  std::size_t worker_count = 0;
  std::size_t batch_size = 64;
  std::shared_ptr<CancellationToken> cancellation;
};

// Twice the hardware concurrency, clamped to [16, 128].
std::size_t DefaultWorkerCount();

// Runs copy jobs on a fixed pool of threads. Workers claim contiguous batches
// from a shared cursor and write outcomes into their own slots, so a failure
// or exception in one batch never touches another. Once cancellation is
// requested no new batch is claimed; unclaimed jobs stay kCancelled.
class ParallelExecutor {
public:
  explicit ParallelExecutor(ExecutorOptions options,
                            std::shared_ptr<Logger> logger = nullptr);

  ExecutionResult Execute(const std::vector<CopyJob> &jobs,
                          TransferStrategy &strategy) const;

  std::size_t WorkerCount() const { return worker_count_; }

private:
  ExecutorOptions options_;
  std::size_t worker_count_;
  std::shared_ptr<Logger> logger_;
};

} // namespace reorg
