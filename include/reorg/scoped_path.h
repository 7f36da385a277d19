#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace reorg {

// Unique sibling path "<target>.reorg-<pid>-<n>.part" used to stage a file
// before it is renamed over its final destination. The staged file is removed
// on destruction unless Commit() succeeded.
class ScopedStagingFile {
public:
  explicit ScopedStagingFile(std::filesystem::path target);
  ~ScopedStagingFile();

  ScopedStagingFile(const ScopedStagingFile &) = delete;
  ScopedStagingFile &operator=(const ScopedStagingFile &) = delete;

  const std::filesystem::path &path() const { return path_; }
  const std::filesystem::path &target() const { return target_; }

  // Atomically renames the staged file onto the target.
  bool Commit(std::error_code &ec);

private:
  std::filesystem::path target_;
  std::filesystem::path path_;
  bool committed_ = false;
};

// Private directory under the system temp directory, removed recursively on
// destruction.
class ScratchDirectory {
public:
  explicit ScratchDirectory(const std::string &prefix);
  ~ScratchDirectory();

  ScratchDirectory(const ScratchDirectory &) = delete;
  ScratchDirectory &operator=(const ScratchDirectory &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace reorg
