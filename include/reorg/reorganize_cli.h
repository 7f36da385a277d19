#pragma once

#include <reorg/label_router.h>
#include <reorg/logging.h>
#include <reorg/models.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace reorg {

struct ReorganizeOptions {
  std::optional<std::filesystem::path> metadata_file;
  std::optional<std::filesystem::path> source_root;
  std::optional<std::filesystem::path> output_root;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> report_json;
  std::optional<std::filesystem::path> retry_manifest;
  std::optional<std::size_t> worker_count;
  std::optional<std::size_t> batch_size;
  std::optional<std::string> strategy;
  std::optional<std::string> rsync_binary;
  std::optional<bool> dry_run;
  std::optional<bool> copy_sidecars;
  std::optional<CollisionPolicy> collision_policy;
  std::optional<LogLevel> log_level;
  MergeRules merge_rules;
  MergeRules base_model_merge_rules;
  bool show_help = false;
};

void PrintUsage(std::ostream &stream);

// Positive decimal integer; throws std::invalid_argument otherwise.
std::size_t ParsePositiveCount(const std::string &value,
                               const std::string &name);
CollisionPolicy ParseCollisionPolicy(const std::string &value);

ReorganizeOptions ParseReorganizeArguments(
    const std::vector<std::string> &arguments);
ReorganizeOptions ParseConfigFile(const std::filesystem::path &path);
ReorganizeOptions MergeOptions(const ReorganizeOptions &config_options,
                               const ReorganizeOptions &cli_options);
ReorganizeOptions ResolveReorganizeOptions(const ReorganizeOptions &cli_options);

LoggingConfig BuildLoggingConfig(const ReorganizeOptions &options);
ReorganizeConfig BuildReorganizeConfig(const ReorganizeOptions &options,
                                       std::shared_ptr<Logger> logger);

int RunReorganize(const std::vector<std::string> &arguments);

} // namespace reorg
