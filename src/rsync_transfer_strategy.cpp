#include <reorg/rsync_transfer_strategy.h>

#include <reorg/scoped_path.h>

#include <cerrno>
#include <chrono>
#include <fstream>
#include <map>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace reorg {
namespace {

std::string ErrnoMessage(int error) {
  return std::error_code(error, std::generic_category()).message();
}

std::string FirstLine(const std::filesystem::path &path) {
  std::ifstream stream(path);
  std::string line;
  std::getline(stream, line);
  return line;
}

// rsync -a preserves size and modification time; compare at whole seconds
// since not every filesystem keeps sub-second stamps.
bool SameRegularFile(const std::filesystem::path &source,
                     const std::filesystem::path &destination) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(destination, ec)) {
    return false;
  }
  const auto source_size = std::filesystem::file_size(source, ec);
  if (ec) {
    return false;
  }
  const auto destination_size = std::filesystem::file_size(destination, ec);
  if (ec || source_size != destination_size) {
    return false;
  }
  const auto source_time = std::filesystem::last_write_time(source, ec);
  if (ec) {
    return false;
  }
  const auto destination_time =
      std::filesystem::last_write_time(destination, ec);
  if (ec) {
    return false;
  }
  using std::chrono::duration_cast;
  using std::chrono::seconds;
  return duration_cast<seconds>(source_time.time_since_epoch()) ==
         duration_cast<seconds>(destination_time.time_since_epoch());
}

// 23 (partial transfer due to error) and 24 (vanished source files) still
// transfer everything else in the list.
bool IsPartialTransferStatus(int exit_status) {
  return exit_status == 23 || exit_status == 24;
}

std::string ListEntry(const std::filesystem::path &source) {
  return std::filesystem::absolute(source).relative_path().string();
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string> &argv,
                         const std::filesystem::path &output_log) {
  ProcessResult result;
  if (argv.empty()) {
    result.error = "empty command line";
    return result;
  }

  std::vector<std::string> arguments = argv;
  std::vector<char *> pointers;
  pointers.reserve(arguments.size() + 1);
  for (auto &argument : arguments) {
    pointers.push_back(argument.data());
  }
  pointers.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO,
                                   output_log.c_str(),
                                   O_WRONLY | O_CREAT | O_APPEND, 0644);
  posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);

  pid_t pid = 0;
  const int error = posix_spawnp(&pid, pointers.front(), &actions, nullptr,
                                 pointers.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  if (error != 0) {
    result.error = "failed to start " + argv.front() + ": " + ErrnoMessage(error);
    return result;
  }
  result.spawned = true;

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      result.error = "waitpid failed: " + ErrnoMessage(errno);
      return result;
    }
  }
  if (WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_status = 128 + WTERMSIG(status);
    result.error = argv.front() + " terminated by signal " +
                   std::to_string(WTERMSIG(status));
  }
  return result;
}

RsyncTransferStrategy::RsyncTransferStrategy(std::shared_ptr<Logger> logger,
                                             std::string rsync_binary)
    : logger_(EnsureLogger(std::move(logger))),
      rsync_binary_(std::move(rsync_binary)) {}

std::vector<TransferOutcome>
RsyncTransferStrategy::TransferBatch(const std::vector<const CopyJob *> &batch) {
  std::vector<TransferOutcome> outcomes(batch.size());
  if (batch.empty()) {
    return outcomes;
  }

  std::map<std::filesystem::path, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < batch.size(); ++i) {
    groups[batch[i]->destination_path.parent_path()].push_back(i);
  }

  const ScratchDirectory scratch("reorg-rsync");
  std::size_t group_number = 0;
  for (const auto &[directory, indices] : groups) {
    const auto suffix = std::to_string(group_number++);
    const auto list_path = scratch.path() / ("files-" + suffix + ".lst");
    const auto log_path = scratch.path() / ("rsync-" + suffix + ".log");

    std::string group_error;
    bool verify_files = false;
    {
      std::ofstream list(list_path, std::ios::binary | std::ios::trunc);
      for (const auto index : indices) {
        const auto &job = *batch[index];
        list << ListEntry(job.source_path) << '\0';
        if (job.sidecar_source) {
          list << ListEntry(*job.sidecar_source) << '\0';
        }
      }
      if (!list) {
        group_error = "failed to write rsync file list " + list_path.string();
      }
    }

    if (group_error.empty()) {
      const auto result = RunProcess(
          {rsync_binary_, "-a", "--no-relative", "--from0",
           "--files-from=" + list_path.string(), "/",
           directory.string() + "/"},
          log_path);
      if (!result.spawned || !result.error.empty()) {
        group_error = result.error.empty() ? "failed to run " + rsync_binary_
                                           : result.error;
      } else if (result.exit_status == 0) {
        verify_files = true;
      } else {
        group_error = rsync_binary_ + " exited with status " +
                      std::to_string(result.exit_status) + ": " +
                      FirstLine(log_path);
        verify_files = IsPartialTransferStatus(result.exit_status);
      }
    }

    if (!group_error.empty()) {
      logger_->Log(LogLevel::kWarn, "transfer.rsync.group_failed",
                   {{"directory", directory.string()},
                    {"jobs", std::to_string(indices.size())},
                    {"verify_files", verify_files ? "true" : "false"},
                    {"error", group_error}});
    }

    for (const auto index : indices) {
      const auto &job = *batch[index];
      auto &outcome = outcomes[index];
      if (!verify_files) {
        outcome.status = TransferStatus::kFailed;
        outcome.error = group_error;
        continue;
      }
      if (!SameRegularFile(job.source_path, job.destination_path)) {
        outcome.status = TransferStatus::kFailed;
        outcome.error = group_error.empty()
                            ? "destination does not match source after rsync"
                            : group_error;
        continue;
      }
      outcome.status = TransferStatus::kCopied;
      if (job.sidecar_source) {
        outcome.sidecar_copied = SameRegularFile(
            *job.sidecar_source, directory / job.sidecar_source->filename());
      }
    }
  }
  return outcomes;
}

} // namespace reorg
