#pragma once

#include <atomic>
#include <memory>

#include <csignal>

namespace reorg {

// Cooperative stop flag shared between the signal handler, the pipeline and
// the executor's workers.
class CancellationToken {
public:
  void Cancel() noexcept { cancelled_.store(true); }
  bool IsCancelled() const noexcept { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

// Routes SIGINT and SIGTERM to a token for its lifetime and restores the
// previous handlers afterwards. Only one instance may be active at a time.
class ScopedSignalCancellation {
public:
  explicit ScopedSignalCancellation(std::shared_ptr<CancellationToken> token);
  ~ScopedSignalCancellation();

  ScopedSignalCancellation(const ScopedSignalCancellation &) = delete;
  ScopedSignalCancellation &
  operator=(const ScopedSignalCancellation &) = delete;

private:
  std::shared_ptr<CancellationToken> token_;
  struct sigaction previous_interrupt_ {};
  struct sigaction previous_terminate_ {};
};

} // namespace reorg
