#include <reorg/cancellation.h>

#include <reorg/errors.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace reorg {
namespace {

std::atomic<CancellationToken *> active_token{nullptr};

extern "C" void HandleStopSignal(int) {
  if (auto *token = active_token.load()) {
    token->Cancel();
  }
}

void Install(int signal_number, struct sigaction &previous) {
  struct sigaction action {};
  action.sa_handler = HandleStopSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  if (::sigaction(signal_number, &action, &previous) != 0) {
    throw SetupError("Failed to install handler for signal " +
                     std::to_string(signal_number) + ": " +
                     std::strerror(errno));
  }
}

} // namespace

ScopedSignalCancellation::ScopedSignalCancellation(
    std::shared_ptr<CancellationToken> token)
    : token_(std::move(token)) {
  active_token.store(token_.get());
  try {
    Install(SIGINT, previous_interrupt_);
    Install(SIGTERM, previous_terminate_);
  } catch (...) {
    ::sigaction(SIGINT, &previous_interrupt_, nullptr);
    active_token.store(nullptr);
    throw;
  }
}

ScopedSignalCancellation::~ScopedSignalCancellation() {
  ::sigaction(SIGINT, &previous_interrupt_, nullptr);
  ::sigaction(SIGTERM, &previous_terminate_, nullptr);
  active_token.store(nullptr);
}

} // namespace reorg
