#pragma once

#include <reorg/models.h>

#include <cstddef>
#include <filesystem>
#include <ostream>

namespace reorg {

// Writes, in the metadata input format, every record that was left unresolved
// or whose transfer failed. Returns the number of rows written.
std::size_t WriteRetryManifest(std::ostream &stream, const CopyPlan &plan,
                               const ExecutionResult &execution);

// Throws std::runtime_error when the file cannot be written.
std::size_t WriteRetryManifest(const std::filesystem::path &path,
                               const CopyPlan &plan,
                               const ExecutionResult &execution);

} // namespace reorg
