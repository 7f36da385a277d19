#include <reorg/cli_exit_codes.h>

namespace reorg {

int ExitCodeFor(const RunReport &summary) {
  if (summary.interrupted) {
    return kExitInterrupted;
  }
  return kExitSuccess;
}

} // namespace reorg
