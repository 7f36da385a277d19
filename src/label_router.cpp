#include <reorg/label_router.h>

#include <reorg/name_normalizer.h>

#include <stdexcept>

namespace reorg {

LabelRoutes BuildLabelRoutes(const MergeRules &rules) {
  LabelRoutes routes;
  for (const auto &[canonical, merged_labels] : rules) {
    const auto target = Normalize(canonical);
    for (const auto &label : merged_labels) {
      const auto source = Normalize(label);
      if (source == target) {
        continue;
      }
      const auto [existing, inserted] = routes.emplace(source, target);
      if (!inserted && existing->second != target) {
        throw std::invalid_argument("Label '" + label +
                                    "' is merged into both '" +
                                    existing->second + "' and '" + target +
                                    "'");
      }
    }
  }
  return routes;
}

const std::string &RouteLabel(const LabelRoutes &routes,
                              const std::string &normalized_label) {
  const auto found = routes.find(normalized_label);
  if (found == routes.end()) {
    return normalized_label;
  }
  return found->second;
}

} // namespace reorg
