#include <reorg/parallel_executor.h>

#include <reorg/errors.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace reorg {
namespace {

std::vector<TransferOutcome> RunBatch(TransferStrategy &strategy,
                                      const std::vector<const CopyJob *> &batch) {
  std::string failure;
  std::vector<TransferOutcome> produced;
  try {
    produced = strategy.TransferBatch(batch);
  } catch (const std::exception &error) {
    failure = error.what();
  } catch (...) {
    failure = "unknown error";
  }
  if (failure.empty() && produced.size() != batch.size()) {
    failure = "strategy returned " + std::to_string(produced.size()) +
              " outcomes for " + std::to_string(batch.size()) + " jobs";
  }
  if (failure.empty()) {
    return produced;
  }

  TransferOutcome failed;
  failed.status = TransferStatus::kFailed;
  failed.error = failure;
  return std::vector<TransferOutcome>(batch.size(), failed);
}

} // namespace

std::size_t DefaultWorkerCount() {
  const std::size_t hardware = std::thread::hardware_concurrency();
  return std::clamp<std::size_t>(hardware * 2, kMinDefaultWorkers,
                                 kMaxDefaultWorkers);
}

ParallelExecutor::ParallelExecutor(ExecutorOptions options,
                                   std::shared_ptr<Logger> logger)
    : options_(std::move(options)),
      worker_count_(options_.worker_count == 0 ? DefaultWorkerCount()
                                               : options_.worker_count),
      logger_(EnsureLogger(std::move(logger))) {
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
}

ExecutionResult ParallelExecutor::Execute(const std::vector<CopyJob> &jobs,
                                          TransferStrategy &strategy) const {
  ExecutionResult result;
  result.strategy = strategy.Name();
  result.worker_count = worker_count_;
  result.outcomes.resize(jobs.size());

  const auto started = std::chrono::steady_clock::now();
  const std::size_t batch_size = options_.batch_size;
  const std::size_t batch_count = (jobs.size() + batch_size - 1) / batch_size;
  const auto *token = options_.cancellation.get();
  std::atomic<std::size_t> cursor{0};

  auto worker = [&]() {
    while (token == nullptr || !token->IsCancelled()) {
      const auto batch_index = cursor.fetch_add(1);
      if (batch_index >= batch_count) {
        return;
      }
      const auto begin = batch_index * batch_size;
      const auto end = std::min(begin + batch_size, jobs.size());
      std::vector<const CopyJob *> batch;
      batch.reserve(end - begin);
      for (auto i = begin; i < end; ++i) {
        batch.push_back(&jobs[i]);
      }
      auto produced = RunBatch(strategy, batch);
      std::move(produced.begin(), produced.end(),
                result.outcomes.begin() + static_cast<std::ptrdiff_t>(begin));
    }
  };

  const auto thread_count = std::min(worker_count_, batch_count);
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    try {
      threads.emplace_back(worker);
    } catch (const std::system_error &error) {
      logger_->Log(LogLevel::kWarn, "execute.thread_start_failed",
                   {{"started", std::to_string(threads.size())},
                    {"requested", std::to_string(thread_count)},
                    {"error", error.what()}});
      break;
    }
  }
  if (threads.empty() && batch_count > 0) {
    throw SetupError("Failed to start any transfer worker");
  }
  for (auto &thread : threads) {
    thread.join();
  }

  result.transfer_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started)
          .count();
  result.cancelled = token != nullptr && token->IsCancelled();

  std::size_t copied = 0;
  std::size_t failed = 0;
  for (std::size_t i = 0; i < jobs.size(); ++i) {
    const auto &outcome = result.outcomes[i];
    if (outcome.status == TransferStatus::kCopied) {
      ++copied;
    } else if (outcome.status == TransferStatus::kFailed) {
      ++failed;
      logger_->Log(LogLevel::kWarn, "transfer.failed",
                   {{"filename", jobs[i].record.filename},
                    {"destination", jobs[i].destination_path.string()},
                    {"error", outcome.error}});
    }
  }
  logger_->Log(LogLevel::kInfo, "execute.complete",
               {{"strategy", result.strategy},
                {"workers", std::to_string(thread_count)},
                {"jobs", std::to_string(jobs.size())},
                {"copied", std::to_string(copied)},
                {"failed", std::to_string(failed)},
                {"cancelled", result.cancelled ? "true" : "false"}});
  return result;
}

} // namespace reorg
