#include <reorg/cancellation.h>
#include <reorg/cli_exit_codes.h>
#include <reorg/default_reorganize_pipeline.h>
#include <reorg/name_normalizer.h>
#include <reorg/pipeline_builder.h>
#include <reorg/reorganize_cli.h>
#include <reorg/retry_manifest.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using reorg::ReorganizeOptions;

constexpr std::size_t kMaxPositionals = 5;

bool ParseBool(const std::string &value) {
  const auto normalized = reorg::ToLowerAscii(reorg::Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

void HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, ReorganizeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        reorg::ParseLogLevel(RequireValue(arguments, index, argument));
    return;
  }
  if (argument == "--verbose") {
    options.log_level = reorg::LogLevel::kInfo;
    return;
  }
  if (argument == "--debug") {
    options.log_level = reorg::LogLevel::kDebug;
    return;
  }
}

void HandleOutputOption(const std::vector<std::string> &arguments,
                        std::size_t &index, ReorganizeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--report-json") {
    options.report_json = RequireValue(arguments, index, argument);
    return;
  }
  if (argument == "--retry-manifest") {
    options.retry_manifest = RequireValue(arguments, index, argument);
    return;
  }
}

void HandleTransferOption(const std::vector<std::string> &arguments,
                          std::size_t &index, ReorganizeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--workers") {
    options.worker_count = reorg::ParsePositiveCount(
        RequireValue(arguments, index, argument), "worker count");
    return;
  }
  if (argument == "--batch-size") {
    options.batch_size = reorg::ParsePositiveCount(
        RequireValue(arguments, index, argument), "batch size");
    return;
  }
  if (argument == "--strategy") {
    options.strategy = RequireValue(arguments, index, argument);
    return;
  }
  if (argument == "--rsync-binary") {
    options.rsync_binary = RequireValue(arguments, index, argument);
    return;
  }
}

bool DispatchOption(const std::vector<std::string> &arguments,
                    std::size_t &index, ReorganizeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--dry-run") {
    options.dry_run = true;
    return true;
  }
  if (argument == "--sidecars") {
    options.copy_sidecars = true;
    return true;
  }
  if (argument == "--collision-policy") {
    options.collision_policy = reorg::ParseCollisionPolicy(
        RequireValue(arguments, index, argument));
    return true;
  }

  HandleTransferOption(arguments, index, options);
  if (argument == "--workers" || argument == "--batch-size" ||
      argument == "--strategy" || argument == "--rsync-binary") {
    return true;
  }

  HandleOutputOption(arguments, index, options);
  if (argument == "--report-json" || argument == "--retry-manifest") {
    return true;
  }

  HandleLoggingOption(arguments, index, options);
  if (argument == "--log-level" || argument == "--verbose" ||
      argument == "--debug") {
    return true;
  }

  return false;
}

void AssignPositional(const std::string &value, std::size_t position,
                      ReorganizeOptions &options) {
  switch (position) {
  case 0:
    options.metadata_file = value;
    return;
  case 1:
    options.source_root = value;
    return;
  case 2:
    options.output_root = value;
    return;
  case 3:
    options.worker_count = reorg::ParsePositiveCount(value, "worker count");
    return;
  case 4:
    options.strategy = value;
    return;
  default:
    throw std::invalid_argument("Unexpected argument: " + value);
  }
}

void ValidateOptions(const ReorganizeOptions &options) {
  if (!options.metadata_file || !options.source_root || !options.output_root) {
    throw std::invalid_argument(
        "<metadata_file> <source_dir> <output_dir> are required (as "
        "arguments or in the config file)");
  }
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content << "\n";
}

using ConfigValue = std::variant<std::string, bool, reorg::MergeRules>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"metadata",
                                                "source",
                                                "output",
                                                "workers",
                                                "strategy",
                                                "batch_size",
                                                "dry_run",
                                                "copy_sidecars",
                                                "collision_policy",
                                                "log_level",
                                                "report_json",
                                                "retry_manifest",
                                                "rsync_binary",
                                                "merge_rules",
                                                "base_model_merge_rules"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = reorg::ToLowerAscii(reorg::Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"metadata_file", "metadata"},
      {"source_dir", "source"},
      {"source_root", "source"},
      {"output_dir", "output"},
      {"output_root", "output"},
      {"worker_count", "workers"},
      {"sidecars", "copy_sidecars"},
      {"model_merge_rules", "merge_rules"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

// canonical: [label, ...] or canonical: label
reorg::MergeRules ExtractMergeRules(const YAML::Node &node,
                                    const std::string &key_name) {
  if (node.IsNull()) {
    return {};
  }
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must map canonical labels to label lists");
  }
  reorg::MergeRules rules;
  for (const auto &entry : node) {
    const auto canonical = ExtractStringScalar(entry.first, key_name);
    auto &labels = rules[canonical];
    if (entry.second.IsScalar()) {
      labels.push_back(entry.second.as<std::string>());
      continue;
    }
    if (!entry.second.IsSequence()) {
      throw std::invalid_argument("Config key '" + key_name + "' entry '" +
                                  canonical + "' must be a list of labels");
    }
    for (const auto &label : entry.second) {
      labels.push_back(ExtractStringScalar(label, key_name));
    }
  }
  return rules;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "merge_rules" || key == "base_model_merge_rules") {
    return ExtractMergeRules(node, key);
  }
  if (key == "dry_run" || key == "copy_sidecars") {
    return ConfigValue{ExtractBool(node, key)};
  }
  return ConfigValue{ExtractStringScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, ReorganizeOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "metadata") {
      options.metadata_file = std::get<std::string>(value);
      continue;
    }
    if (key == "source") {
      options.source_root = std::get<std::string>(value);
      continue;
    }
    if (key == "output") {
      options.output_root = std::get<std::string>(value);
      continue;
    }
    if (key == "workers") {
      options.worker_count =
          reorg::ParsePositiveCount(std::get<std::string>(value), key);
      continue;
    }
    if (key == "batch_size") {
      options.batch_size =
          reorg::ParsePositiveCount(std::get<std::string>(value), key);
      continue;
    }
    if (key == "strategy") {
      options.strategy = std::get<std::string>(value);
      continue;
    }
    if (key == "rsync_binary") {
      options.rsync_binary = std::get<std::string>(value);
      continue;
    }
    if (key == "dry_run") {
      options.dry_run = std::get<bool>(value);
      continue;
    }
    if (key == "copy_sidecars") {
      options.copy_sidecars = std::get<bool>(value);
      continue;
    }
    if (key == "collision_policy") {
      options.collision_policy =
          reorg::ParseCollisionPolicy(std::get<std::string>(value));
      continue;
    }
    if (key == "log_level") {
      options.log_level = reorg::ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    if (key == "report_json") {
      options.report_json = std::get<std::string>(value);
      continue;
    }
    if (key == "retry_manifest") {
      options.retry_manifest = std::get<std::string>(value);
      continue;
    }
    if (key == "merge_rules") {
      options.merge_rules = std::get<reorg::MergeRules>(value);
      continue;
    }
    if (key == "base_model_merge_rules") {
      options.base_model_merge_rules = std::get<reorg::MergeRules>(value);
      continue;
    }
    ThrowUnknownKey(key);
  }
}

} // namespace

namespace reorg {

void PrintUsage(std::ostream &stream) {
  stream
      << "Usage: reorganize <metadata_file> <source_dir> <output_dir> "
         "[worker_count] [strategy] [options]\n"
      << "Copies every file listed in the metadata CSV (columns filename,\n"
      << "base_model, model_name, model_type) from the source tree to\n"
      << "<output_dir>/<base_model>/<model>/<filename>.\n"
      << "Options:\n"
      << "  --config <file>            Optional YAML config file\n"
      << "  --workers <n>              Number of transfer workers\n"
      << "  --strategy <name>          Transfer strategy (copy,rsync,symlink)\n"
      << "  --batch-size <n>           Jobs claimed per worker batch "
         "(default: 64)\n"
      << "  --dry-run                  Index and plan only; transfer nothing\n"
      << "  --sidecars                 Also copy <stem>.json next to each "
         "file\n"
      << "  --collision-policy <name>  Duplicate source filenames "
         "(smallest,reject)\n"
      << "  --report-json <path>       Write the run report as JSON\n"
      << "  --retry-manifest <path>    Write unresolved and failed rows as "
         "CSV\n"
      << "  --rsync-binary <path>      rsync executable (default: rsync)\n"
      << "  --log-level <level>        Logging verbosity "
         "(error,warn,info,debug)\n"
      << "  --verbose                  Shortcut for --log-level info\n"
      << "  --debug                    Shortcut for --log-level debug\n"
      << "  --help                     Show this message\n";
}

std::size_t ParsePositiveCount(const std::string &value,
                               const std::string &name) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char c) { return c >= '0' && c <= '9'; })) {
    throw std::invalid_argument("Invalid " + name + ": " + value);
  }
  std::size_t parsed = 0;
  try {
    parsed = static_cast<std::size_t>(std::stoull(trimmed));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("Invalid " + name + ": " + value);
  }
  if (parsed == 0) {
    throw std::invalid_argument("Invalid " + name + ": " + value +
                                " (must be positive)");
  }
  return parsed;
}

CollisionPolicy ParseCollisionPolicy(const std::string &value) {
  const auto normalized = ToLowerAscii(Trim(value));
  if (normalized == "smallest" || normalized == "keep-smallest" ||
      normalized == "keep_smallest") {
    return CollisionPolicy::kKeepSmallestPath;
  }
  if (normalized == "reject") {
    return CollisionPolicy::kReject;
  }
  throw std::invalid_argument("Unknown collision policy: " + value);
}

ReorganizeOptions
ParseReorganizeArguments(const std::vector<std::string> &arguments) {
  ReorganizeOptions options;
  std::size_t positionals = 0;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument.size() > 1 && argument.front() == '-') {
      if (!DispatchOption(arguments, i, options)) {
        throw std::invalid_argument("Unknown argument: " + argument);
      }
      if (options.show_help) {
        break;
      }
      continue;
    }
    if (positionals >= kMaxPositionals) {
      throw std::invalid_argument("Unexpected argument: " + argument);
    }
    AssignPositional(argument, positionals++, options);
  }

  return options;
}

ReorganizeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLowerAscii(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  ReorganizeOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

ReorganizeOptions MergeOptions(const ReorganizeOptions &config_options,
                               const ReorganizeOptions &cli_options) {
  ReorganizeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.metadata_file, cli_options.metadata_file);
  override_value(merged.source_root, cli_options.source_root);
  override_value(merged.output_root, cli_options.output_root);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.report_json, cli_options.report_json);
  override_value(merged.retry_manifest, cli_options.retry_manifest);
  override_value(merged.worker_count, cli_options.worker_count);
  override_value(merged.batch_size, cli_options.batch_size);
  override_value(merged.strategy, cli_options.strategy);
  override_value(merged.rsync_binary, cli_options.rsync_binary);
  override_value(merged.dry_run, cli_options.dry_run);
  override_value(merged.copy_sidecars, cli_options.copy_sidecars);
  override_value(merged.collision_policy, cli_options.collision_policy);
  override_value(merged.log_level, cli_options.log_level);

  if (!cli_options.merge_rules.empty()) {
    merged.merge_rules = cli_options.merge_rules;
  }
  if (!cli_options.base_model_merge_rules.empty()) {
    merged.base_model_merge_rules = cli_options.base_model_merge_rules;
  }
  return merged;
}

ReorganizeOptions
ResolveReorganizeOptions(const ReorganizeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  ReorganizeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateOptions(merged);
  return merged;
}

LoggingConfig BuildLoggingConfig(const ReorganizeOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

ReorganizeConfig BuildReorganizeConfig(const ReorganizeOptions &options,
                                       std::shared_ptr<Logger> logger) {
  ReorganizeConfig config;
  config.metadata_file = options.metadata_file.value_or("");
  config.source_root = options.source_root.value_or("");
  config.output_root = options.output_root.value_or("");
  config.worker_count = options.worker_count.value_or(0);
  config.batch_size = options.batch_size.value_or(config.batch_size);
  config.dry_run = options.dry_run.value_or(false);
  config.copy_sidecars = options.copy_sidecars.value_or(false);
  config.collision_policy =
      options.collision_policy.value_or(CollisionPolicy::kKeepSmallestPath);
  config.base_model_routes = BuildLabelRoutes(options.base_model_merge_rules);
  config.model_routes = BuildLabelRoutes(options.merge_rules);
  config.formats = {"text"};
  if (options.report_json) {
    config.formats.push_back("json");
  }
  config.logging = BuildLoggingConfig(options);
  config.logger = std::move(logger);
  return config;
}

int RunReorganize(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseReorganizeArguments(arguments);
  if (cli_options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  const auto merged = ResolveReorganizeOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);
  const auto config = BuildReorganizeConfig(merged, logger);

  auto cancellation = std::make_shared<CancellationToken>();
  ReorganizePipelineBuilder builder;
  builder.WithLogger(logger).WithCancellation(cancellation);
  if (merged.strategy) {
    builder.WithStrategyName(ToLowerAscii(Trim(*merged.strategy)));
  }
  if (merged.rsync_binary) {
    builder.WithRsyncBinary(*merged.rsync_binary);
  }
  auto pipeline = builder.Build();

  const ScopedSignalCancellation signals(cancellation);
  const auto result = pipeline.Run(config);

  std::cout << result.report.text;
  // Report files are auxiliary; failing to write one never changes the exit
  // code of a run that already finished.
  if (merged.report_json) {
    try {
      WriteFileIfContent(*merged.report_json, result.report.json);
    } catch (const std::exception &error) {
      logger->Log(LogLevel::kWarn, "report.write_failed",
                  {{"path", merged.report_json->string()},
                   {"error", error.what()}});
    }
  }
  if (merged.retry_manifest) {
    try {
      const auto rows = WriteRetryManifest(*merged.retry_manifest,
                                           result.plan, result.execution);
      logger->Log(LogLevel::kInfo, "retry_manifest.written",
                  {{"path", merged.retry_manifest->string()},
                   {"rows", std::to_string(rows)}});
    } catch (const std::exception &error) {
      logger->Log(LogLevel::kWarn, "report.write_failed",
                  {{"path", merged.retry_manifest->string()},
                   {"error", error.what()}});
    }
  }
  return ExitCodeFor(result.summary);
}

} // namespace reorg
