#pragma once

#include <reorg/interfaces.h>

#include <string>

namespace reorg {

// Folds the per-stage results of one run into its report.
RunReport BuildRunReport(const CopyPlan &plan, const SourceIndex &index,
                         const TaxonomyResult &taxonomy,
                         const ExecutionResult &execution,
                         double elapsed_seconds, bool dry_run);

std::string EscapeJsonString(const std::string &value);

// Renders the plain-text summary, and the JSON document when "json" is one of
// the configured formats.
class SummaryReporter : public Reporter {
public:
  Report Render(const RunReport &summary,
                const ReorganizeConfig &config) override;
};

} // namespace reorg
