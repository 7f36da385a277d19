#pragma once

#include <reorg/models.h>

namespace reorg {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFatal = 1;
inline constexpr int kExitInterrupted = 130;

// Skipped and failed jobs do not change the exit code; only an interrupted
// run does.
int ExitCodeFor(const RunReport &summary);

} // namespace reorg
