#pragma once

#include <reorg/interfaces.h>
#include <reorg/logging.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace reorg {

// Construction inputs shared by every transfer strategy factory.
struct StrategyOptions {
  std::shared_ptr<Logger> logger;
  std::string rsync_binary = "rsync";
};

class ComponentRegistry {
public:
  using StrategyFactory = std::function<std::unique_ptr<TransferStrategy>(
      const StrategyOptions &)>;
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  void RegisterStrategy(const std::string &name, StrategyFactory factory,
                        bool set_as_default = false);
  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);

  std::unique_ptr<TransferStrategy>
  CreateStrategy(const std::string &name = "",
                 const StrategyOptions &options = {}) const;
  std::unique_ptr<Reporter> CreateReporter(const std::string &name = "") const;

  std::vector<std::string> StrategyNames() const;
  std::vector<std::string> ReporterNames() const;

  const std::string &DefaultStrategyName() const;
  const std::string &DefaultReporterName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static const Factory &FindFactory(const std::string &name,
                                    const ComponentSet<Factory> &set,
                                    const std::string &kind,
                                    std::string &resolved_name);

  template <typename Factory>
  static void RegisterComponent(const std::string &name, Factory factory,
                                bool set_as_default,
                                ComponentSet<Factory> &set);

  ComponentSet<StrategyFactory> strategies_;
  ComponentSet<ReporterFactory> reporters_;
};

// Registers "copy" (default), "rsync" and "symlink" strategies and the
// "summary" reporter.
ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace reorg
