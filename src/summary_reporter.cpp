#include <reorg/summary_reporter.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace reorg {
namespace {

constexpr std::size_t kMaxListedFailures = 20;

std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm local_time{};
  localtime_r(&now_time, &local_time);
  std::ostringstream stream;
  stream << std::put_time(&local_time, "%FT%T");
  return stream.str();
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string FormatSeconds(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << value;
  return stream.str();
}

void Row(std::ostringstream &output, const std::string &label,
         const std::string &value) {
  output << "  " << std::left << std::setw(28) << (label + ":") << value
         << "\n";
}

void Row(std::ostringstream &output, const std::string &label,
         std::size_t value) {
  Row(output, label, std::to_string(value));
}

std::string BuildTextSummary(const RunReport &summary,
                             const ReorganizeConfig &config,
                             const std::string &timestamp) {
  std::ostringstream output;
  output << "Reorganization summary (" << timestamp << ")\n";
  Row(output, "Metadata", config.metadata_file.string());
  Row(output, "Source", config.source_root.string());
  Row(output, "Output", config.output_root.string());
  Row(output, "Strategy", summary.strategy);
  Row(output, "Workers", summary.worker_count);
  Row(output, "Source files seen", summary.source_files_seen);
  Row(output, "Filename collisions", summary.filename_collisions);
  Row(output, "Records parsed", summary.total_records);
  Row(output, "Malformed rows", summary.malformed_rows);
  Row(output, "Jobs resolved", summary.resolved);
  Row(output, "Jobs skipped (unresolved)", summary.skipped_unresolved);
  Row(output, "Duplicate destinations", summary.duplicate_destinations);
  Row(output, "Directories ensured", summary.directories_ensured);
  Row(output, "Directory failures", summary.directory_failures);
  Row(output, "Jobs copied", summary.copied);
  Row(output, "Jobs failed", summary.failed);
  Row(output, "Jobs cancelled", summary.cancelled);
  Row(output, "Sidecars copied", summary.sidecars_copied);
  Row(output, "Elapsed time", FormatSeconds(summary.elapsed_seconds) + " s");
  Row(output, "Throughput",
      FormatSeconds(summary.throughput) + " files/s");

  if (summary.dry_run) {
    output << "\nDry run: no directories were created and no files were "
              "transferred.\n";
  }
  if (summary.interrupted) {
    output << "\nInterrupted: jobs not started were cancelled.\n";
  }
  if (!summary.failures.empty()) {
    output << "\nFailed jobs:\n";
    const auto listed = std::min(summary.failures.size(), kMaxListedFailures);
    for (std::size_t i = 0; i < listed; ++i) {
      const auto &failure = summary.failures[i];
      output << "  - " << failure.filename << " -> " << failure.destination
             << ": " << failure.error << "\n";
    }
    if (summary.failures.size() > listed) {
      output << "  ... and " << (summary.failures.size() - listed)
             << " more\n";
    }
  }
  return output.str();
}

std::string BuildFailuresJson(const std::vector<JobFailure> &failures) {
  std::ostringstream json;
  json << "\"failures\": [";
  for (std::size_t i = 0; i < failures.size(); ++i) {
    const auto &failure = failures[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"filename\": \"" << EscapeJsonString(failure.filename) << "\",";
    json << "\"destination\": \"" << EscapeJsonString(failure.destination)
         << "\",";
    json << "\"error\": \"" << EscapeJsonString(failure.error) << "\"}";
  }
  json << "]";
  return json.str();
}

std::string BuildJsonSummary(const RunReport &summary,
                             const ReorganizeConfig &config,
                             const std::string &timestamp) {
  std::ostringstream json;
  json << "{";
  json << "\"generated_on\": \"" << EscapeJsonString(timestamp) << "\",";
  json << "\"metadata\": \"" << EscapeJsonString(config.metadata_file.string())
       << "\",";
  json << "\"source\": \"" << EscapeJsonString(config.source_root.string())
       << "\",";
  json << "\"output\": \"" << EscapeJsonString(config.output_root.string())
       << "\",";
  json << "\"strategy\": \"" << EscapeJsonString(summary.strategy) << "\",";
  json << "\"worker_count\": " << summary.worker_count << ",";
  json << "\"dry_run\": " << (summary.dry_run ? "true" : "false") << ",";
  json << "\"interrupted\": " << (summary.interrupted ? "true" : "false")
       << ",";
  json << "\"source_files_seen\": " << summary.source_files_seen << ",";
  json << "\"filename_collisions\": " << summary.filename_collisions << ",";
  json << "\"total_records\": " << summary.total_records << ",";
  json << "\"malformed_rows\": " << summary.malformed_rows << ",";
  json << "\"resolved\": " << summary.resolved << ",";
  json << "\"skipped_unresolved\": " << summary.skipped_unresolved << ",";
  json << "\"duplicate_destinations\": " << summary.duplicate_destinations
       << ",";
  json << "\"directories_ensured\": " << summary.directories_ensured << ",";
  json << "\"directory_failures\": " << summary.directory_failures << ",";
  json << "\"copied\": " << summary.copied << ",";
  json << "\"failed\": " << summary.failed << ",";
  json << "\"cancelled\": " << summary.cancelled << ",";
  json << "\"sidecars_copied\": " << summary.sidecars_copied << ",";
  json << "\"elapsed_seconds\": " << FormatSeconds(summary.elapsed_seconds)
       << ",";
  json << "\"transfer_seconds\": " << FormatSeconds(summary.transfer_seconds)
       << ",";
  json << "\"throughput\": " << FormatSeconds(summary.throughput) << ",";
  json << BuildFailuresJson(summary.failures);
  json << "}";
  return json.str();
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      std::ostringstream code;
      code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
           << static_cast<int>(character);
      escaped.append(code.str());
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

RunReport BuildRunReport(const CopyPlan &plan, const SourceIndex &index,
                         const TaxonomyResult &taxonomy,
                         const ExecutionResult &execution,
                         double elapsed_seconds, bool dry_run) {
  RunReport summary;
  summary.total_records = plan.parsed_records;
  summary.malformed_rows = plan.malformed_rows;
  summary.resolved = plan.jobs.size();
  summary.skipped_unresolved = plan.unresolved.size();
  summary.duplicate_destinations = plan.duplicate_destinations;
  summary.source_files_seen = index.files_seen;
  summary.filename_collisions = index.collisions;
  summary.directories_ensured = taxonomy.directories_ensured;
  summary.directory_failures = taxonomy.failed_directories.size();
  summary.strategy = execution.strategy;
  summary.worker_count = execution.worker_count;
  summary.transfer_seconds = execution.transfer_seconds;
  summary.elapsed_seconds = elapsed_seconds;
  summary.dry_run = dry_run;
  summary.interrupted = execution.cancelled;

  const auto count = std::min(plan.jobs.size(), execution.outcomes.size());
  for (std::size_t i = 0; i < count; ++i) {
    const auto &outcome = execution.outcomes[i];
    switch (outcome.status) {
    case TransferStatus::kCopied:
      ++summary.copied;
      if (outcome.sidecar_copied) {
        ++summary.sidecars_copied;
      }
      break;
    case TransferStatus::kFailed:
      ++summary.failed;
      summary.failures.push_back(
          JobFailure{plan.jobs[i].record.filename,
                     plan.jobs[i].destination_path.string(), outcome.error});
      break;
    case TransferStatus::kCancelled:
      ++summary.cancelled;
      break;
    }
  }

  summary.throughput =
      elapsed_seconds > 0.0
          ? static_cast<double>(summary.copied) / elapsed_seconds
          : 0.0;
  return summary;
}

Report SummaryReporter::Render(const RunReport &summary,
                               const ReorganizeConfig &config) {
  const auto timestamp = Timestamp();
  Report report;
  report.text = BuildTextSummary(summary, config, timestamp);
  if (ShouldRenderFormat(config.formats, "json")) {
    report.json = BuildJsonSummary(summary, config, timestamp);
  }
  return report;
}

} // namespace reorg
