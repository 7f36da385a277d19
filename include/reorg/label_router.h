#pragma once

#include <reorg/models.h>

#include <map>
#include <string>
#include <vector>

namespace reorg {

// Canonical label -> labels merged into it, as written in the config file.
using MergeRules = std::map<std::string, std::vector<std::string>>;

// Normalizes both sides of the rules. Throws std::invalid_argument when one
// label is merged into two different canonical labels.
LabelRoutes BuildLabelRoutes(const MergeRules &rules);

// Returns the canonical label for a normalized label, or the label itself.
const std::string &RouteLabel(const LabelRoutes &routes,
                              const std::string &normalized_label);

} // namespace reorg
