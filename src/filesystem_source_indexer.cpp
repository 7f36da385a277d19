#include <reorg/filesystem_source_indexer.h>

#include <reorg/errors.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>

namespace reorg {

namespace {

constexpr std::size_t kMaxCollisionsInMessage = 10;

std::filesystem::path ResolveRootPath(const std::filesystem::path &root) {
  if (root.empty()) {
    throw SetupError("Source directory must not be empty.");
  }

  std::error_code ec;
  auto normalized_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    normalized_root = std::filesystem::absolute(root);
  }

  if (!std::filesystem::is_directory(normalized_root, ec)) {
    throw SetupError("Source directory does not exist or is not a "
                     "directory: " +
                     normalized_root.string());
  }
  return normalized_root;
}

// Returns true when the candidate should replace the indexed path.
bool PreferCandidate(const std::filesystem::path &indexed,
                     const std::filesystem::path &candidate) {
  return candidate.generic_string() < indexed.generic_string();
}

std::string JoinCollisions(const std::vector<std::string> &names) {
  std::string message;
  const auto shown = std::min(names.size(), kMaxCollisionsInMessage);
  for (std::size_t i = 0; i < shown; ++i) {
    message += names[i];
    if (i + 1 < shown) {
      message += ", ";
    }
  }
  if (names.size() > shown) {
    message += ", ... (" + std::to_string(names.size() - shown) + " more)";
  }
  return message;
}

} // namespace

FilesystemSourceIndexer::FilesystemSourceIndexer(
    CollisionPolicy policy, std::shared_ptr<Logger> logger,
    std::filesystem::path excluded_directory,
    std::shared_ptr<CancellationToken> cancellation)
    : policy_(policy), logger_(EnsureLogger(std::move(logger))),
      excluded_directory_(std::move(excluded_directory)),
      cancellation_(std::move(cancellation)) {}

SourceIndex FilesystemSourceIndexer::BuildIndex(
    const std::filesystem::path &root) {
  const auto resolved_root = ResolveRootPath(root);

  std::filesystem::path excluded;
  if (!excluded_directory_.empty()) {
    excluded = std::filesystem::weakly_canonical(
        std::filesystem::absolute(excluded_directory_));
    if (!excluded.has_filename()) {
      excluded = excluded.parent_path();
    }
  }

  SourceIndex index;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(
      resolved_root, std::filesystem::directory_options::skip_permission_denied,
      ec);
  if (ec) {
    throw SetupError("Unable to enumerate source directory " +
                     resolved_root.string() + ": " + ec.message());
  }

  const std::filesystem::recursive_directory_iterator end;
  while (it != end) {
    if (cancellation_ && cancellation_->IsCancelled()) {
      index.interrupted = true;
      logger_->Log(LogLevel::kWarn, "index.cancelled",
                   {{"root", resolved_root.string()},
                    {"files_seen", std::to_string(index.files_seen)}});
      break;
    }
    const auto &entry = *it;
    std::error_code entry_ec;
    if (!excluded.empty() && entry.path() == excluded) {
      it.disable_recursion_pending();
    } else if (entry.is_regular_file(entry_ec) && !entry_ec) {
      ++index.files_seen;
      const auto &path = entry.path();
      auto filename = path.filename().string();
      const auto existing = index.entries.find(filename);
      if (existing == index.entries.end()) {
        index.entries.emplace(std::move(filename), path);
      } else {
        index.collided_names.push_back(existing->first);
        ++index.collisions;
        logger_->Log(LogLevel::kDebug, "index.collision",
                     {{"filename", existing->first},
                      {"kept", existing->second.string()},
                      {"candidate", path.string()}});
        if (PreferCandidate(existing->second, path)) {
          existing->second = path;
        }
      }
    }

    it.increment(ec);
    if (ec) {
      logger_->Log(LogLevel::kWarn, "index.traversal.aborted",
                   {{"root", resolved_root.string()},
                    {"error", ec.message()},
                    {"files_seen", std::to_string(index.files_seen)}});
      break;
    }
  }

  std::sort(index.collided_names.begin(), index.collided_names.end());
  index.collided_names.erase(
      std::unique(index.collided_names.begin(), index.collided_names.end()),
      index.collided_names.end());

  if (!index.collided_names.empty()) {
    logger_->Log(LogLevel::kWarn, "index.collisions",
                 {{"count", std::to_string(index.collisions)},
                  {"names", JoinCollisions(index.collided_names)}});
    if (policy_ == CollisionPolicy::kReject && !index.interrupted) {
      throw SetupError("Duplicate filenames in source tree " +
                       resolved_root.string() + ": " +
                       JoinCollisions(index.collided_names));
    }
  }

  logger_->Log(LogLevel::kInfo, "index.complete",
               {{"root", resolved_root.string()},
                {"files_seen", std::to_string(index.files_seen)},
                {"indexed", std::to_string(index.entries.size())}});
  return index;
}

} // namespace reorg
