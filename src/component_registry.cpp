#include <reorg/component_registry.h>

#include <reorg/copy_transfer_strategy.h>
#include <reorg/rsync_transfer_strategy.h>
#include <reorg/summary_reporter.h>
#include <reorg/symlink_transfer_strategy.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultStrategy[] = "copy";
constexpr const char kDefaultReporter[] = "summary";

} // namespace

namespace reorg {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
const Factory &ComponentRegistry::FindFactory(const std::string &name,
                                              const ComponentSet<Factory> &set,
                                              const std::string &kind,
                                              std::string &resolved_name) {
  resolved_name = name.empty() ? set.default_name : name;
  if (resolved_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(resolved_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + resolved_name +
                                "'. Registered: " + JoinNames(set));
  }
  return found->second;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterStrategy(const std::string &name,
                                         StrategyFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, strategies_);
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, reporters_);
}

std::unique_ptr<TransferStrategy>
ComponentRegistry::CreateStrategy(const std::string &name,
                                  const StrategyOptions &options) const {
  std::string resolved_name;
  const auto &factory =
      FindFactory(name, strategies_, "transfer strategy", resolved_name);
  auto instance = factory(options);
  if (!instance) {
    throw std::runtime_error("Factory for transfer strategy '" +
                             resolved_name + "' returned null");
  }
  return instance;
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name) const {
  std::string resolved_name;
  const auto &factory = FindFactory(name, reporters_, "reporter", resolved_name);
  auto instance = factory();
  if (!instance) {
    throw std::runtime_error("Factory for reporter '" + resolved_name +
                             "' returned null");
  }
  return instance;
}

std::vector<std::string> ComponentRegistry::StrategyNames() const {
  return RegisteredNames(strategies_);
}

std::vector<std::string> ComponentRegistry::ReporterNames() const {
  return RegisteredNames(reporters_);
}

const std::string &ComponentRegistry::DefaultStrategyName() const {
  return strategies_.default_name;
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return reporters_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterStrategy(
      kDefaultStrategy,
      [](const StrategyOptions &options) {
        return std::make_unique<CopyTransferStrategy>(options.logger);
      },
      true);
  registry.RegisterStrategy("rsync", [](const StrategyOptions &options) {
    return std::make_unique<RsyncTransferStrategy>(options.logger,
                                                   options.rsync_binary);
  });
  registry.RegisterStrategy("symlink", [](const StrategyOptions &options) {
    return std::make_unique<SymlinkTransferStrategy>(options.logger);
  });
  registry.RegisterReporter(
      kDefaultReporter, []() { return std::make_unique<SummaryReporter>(); },
      true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace reorg
