#pragma once

#include <reorg/logging.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reorg {

enum class CollisionPolicy { kKeepSmallestPath, kReject };

// Maps a normalized label to the normalized canonical label it merges into.
using LabelRoutes = std::unordered_map<std::string, std::string>;

struct ReorganizeConfig {
  std::filesystem::path metadata_file;
  std::filesystem::path source_root;
  std::filesystem::path output_root;
  std::size_t worker_count = 0;
  std::size_t batch_size = 64;
  bool dry_run = false;
  bool copy_sidecars = false;
  CollisionPolicy collision_policy = CollisionPolicy::kKeepSmallestPath;
  LabelRoutes base_model_routes;
  LabelRoutes model_routes;
  std::vector<std::string> formats;
  LoggingConfig logging;
  std::shared_ptr<Logger> logger;
};

struct MetadataRecord {
  std::string filename;
  std::string base_model;
  std::string model_name;
  std::string model_type;
  std::size_t line = 0;
};

struct SourceIndex {
  std::unordered_map<std::string, std::filesystem::path> entries;
  std::size_t files_seen = 0;
  std::size_t collisions = 0;
  std::vector<std::string> collided_names;
  // The scan stopped early on cancellation; entries are incomplete.
  bool interrupted = false;

  const std::filesystem::path *Find(const std::string &filename) const {
    const auto found = entries.find(filename);
    return found == entries.end() ? nullptr : &found->second;
  }
};

struct CopyJob {
  std::filesystem::path source_path;
  std::filesystem::path destination_path;
  std::optional<std::filesystem::path> sidecar_source;
  MetadataRecord record;
};

struct TaxonomyNode {
  std::string base_label;
  std::string model_label;

  bool operator<(const TaxonomyNode &other) const {
    if (base_label != other.base_label) {
      return base_label < other.base_label;
    }
    return model_label < other.model_label;
  }
  bool operator==(const TaxonomyNode &other) const {
    return base_label == other.base_label && model_label == other.model_label;
  }
};

struct CopyPlan {
  std::vector<CopyJob> jobs;
  std::vector<MetadataRecord> unresolved;
  std::vector<TaxonomyNode> taxonomy;
  std::size_t parsed_records = 0;
  std::size_t malformed_rows = 0;
  std::size_t duplicate_destinations = 0;
  bool interrupted = false;
};

struct TaxonomyResult {
  std::size_t directories_ensured = 0;
  std::vector<std::string> failed_directories;
};

enum class TransferStatus { kCopied, kFailed, kCancelled };

struct TransferOutcome {
  TransferStatus status = TransferStatus::kCancelled;
  std::string error;
  bool sidecar_copied = false;
};

struct ExecutionResult {
  std::vector<TransferOutcome> outcomes;
  std::string strategy;
  std::size_t worker_count = 0;
  double transfer_seconds = 0.0;
  bool cancelled = false;
};

struct JobFailure {
  std::string filename;
  std::string destination;
  std::string error;
};

struct RunReport {
  std::size_t total_records = 0;
  std::size_t malformed_rows = 0;
  std::size_t resolved = 0;
  std::size_t skipped_unresolved = 0;
  std::size_t copied = 0;
  std::size_t failed = 0;
  std::size_t cancelled = 0;
  std::size_t directories_ensured = 0;
  std::size_t directory_failures = 0;
  std::size_t source_files_seen = 0;
  std::size_t filename_collisions = 0;
  std::size_t duplicate_destinations = 0;
  std::size_t sidecars_copied = 0;
  double elapsed_seconds = 0.0;
  double transfer_seconds = 0.0;
  double throughput = 0.0;
  std::string strategy;
  std::size_t worker_count = 0;
  bool dry_run = false;
  bool interrupted = false;
  std::vector<JobFailure> failures;
};

struct Report {
  std::string text;
  std::string json;
};

struct PipelineResult {
  Report report;
  RunReport summary;
  CopyPlan plan;
  ExecutionResult execution;
};

} // namespace reorg
