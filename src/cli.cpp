#include <codestat/cli.h>
#include <codestat/language_registry.h>
#include <codestat/tree_walker.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace codestat {
namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Expected a boolean value, got: " + value);
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      values.push_back(Trim(current));
      current.clear();
    } else {
      current.push_back(character);
    }
  }
  values.push_back(Trim(current));
  values.erase(std::remove(values.begin(), values.end(), std::string{}),
               values.end());
  return values;
}

void AppendUnique(std::string value, std::vector<std::string> &target) {
  if (std::find(target.begin(), target.end(), value) == target.end()) {
    target.push_back(std::move(value));
  }
}

void AppendExtensions(const std::string &raw_extensions,
                      std::vector<std::string> &target) {
  for (const auto &extension : SplitList(raw_extensions)) {
    AppendUnique(NormalizeExtension(extension), target);
  }
}

void AppendDirectoryNames(const std::string &raw_names,
                          std::vector<std::string> &target) {
  for (const auto &name : SplitList(raw_names)) {
    AppendUnique(name, target);
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleFilterOption(const std::vector<std::string> &arguments,
                        std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "-e" || argument == "--ext") {
    AppendExtensions(RequireValue(arguments, index, argument),
                     options.extensions);
    return true;
  }
  if (argument == "-i" || argument == "--ignore") {
    AppendDirectoryNames(RequireValue(arguments, index, argument),
                         options.ignored_directories);
    return true;
  }
  return false;
}

bool HandleOutputOption(const std::vector<std::string> &arguments,
                        std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "-q" || argument == "--quiet") {
    options.quiet = true;
    return true;
  }
  if (argument == "-v" || argument == "--verbose") {
    options.quiet = false;
    return true;
  }
  if (argument == "--format") {
    options.format =
        ParseReportFormat(Trim(RequireValue(arguments, index, argument)));
    return true;
  }
  if (argument == "--out") {
    options.output_file = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--debug") {
    options.log_level = LogLevel::kDebug;
    return true;
  }
  return false;
}

bool DispatchOption(const std::vector<std::string> &arguments,
                    std::size_t &index, CliOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--version") {
    options.show_version = true;
    return true;
  }
  if (argument == "--list-extensions") {
    options.list_extensions = true;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  return HandleFilterOption(arguments, index, options) ||
         HandleOutputOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options);
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "root", "extensions", "ignore", "quiet", "format", "out", "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"ext", "extensions"},
      {"ignore_dirs", "ignore"},
      {"ignored_directories", "ignore"},
      {"output", "out"}};

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

std::string ExtractPathLike(const YAML::Node &node,
                            const std::string &key_name) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (node.IsMap()) {
    for (const auto &candidate : {"path", "dir", "directory"}) {
      if (node[candidate]) {
        return ExtractStringScalar(node[candidate], key_name);
      }
    }
    throw std::invalid_argument("Config key '" + key_name +
                                "' map must contain 'path', 'dir', or "
                                "'directory'");
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or mapping");
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "extensions") {
    return ExtractList(node, key, AppendExtensions);
  }
  if (key == "ignore") {
    return ExtractList(node, key, AppendDirectoryNames);
  }
  if (key == "quiet") {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (key == "root" || key == "out") {
    return ConfigValue{ExtractPathLike(node, key)};
  }
  if (key == "format" || key == "log_level") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
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

void ApplyConfig(const RawConfig &config, CliOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "root") {
      options.root = std::get<std::string>(value);
      continue;
    }
    if (key == "extensions") {
      options.extensions = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "ignore") {
      options.ignored_directories = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "quiet") {
      options.quiet = std::get<bool>(value);
      continue;
    }
    if (key == "format") {
      options.format = ParseReportFormat(Trim(std::get<std::string>(value)));
      continue;
    }
    if (key == "out") {
      options.output_file = std::get<std::string>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    ThrowUnknownKey(key);
  }
}

struct ExtensionFamily {
  const char *name;
  std::vector<std::string> extensions;
};

const std::vector<ExtensionFamily> &ExtensionFamilies() {
  static const std::vector<ExtensionFamily> families = {
      {"Python", {".py", ".pyw", ".pyi"}},
      {"JavaScript/TypeScript", {".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs"}},
      {"Web", {".html", ".htm", ".css", ".scss", ".sass", ".less"}},
      {"C/C++", {".c", ".h", ".cpp", ".cc", ".cxx", ".hpp", ".hh", ".hxx"}},
      {"Java/JVM", {".java", ".kt", ".kts", ".scala", ".groovy"}},
      {"Markdown", {".md", ".markdown"}}};
  return families;
}

std::string JoinList(const std::vector<std::string> &values) {
  std::string joined;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += values[i];
  }
  return joined;
}

LoggingConfig BuildLoggingConfig(const CliOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

WalkOptions BuildWalkOptions(const CliOptions &options) {
  WalkOptions walk;
  if (!options.extensions.empty()) {
    walk.extensions = std::set<std::string>(options.extensions.begin(),
                                            options.extensions.end());
  }
  walk.ignored_directories = std::set<std::string>(
      options.ignored_directories.begin(), options.ignored_directories.end());
  return walk;
}

void PrintBanner(std::ostream &out, const std::filesystem::path &root,
                 const CliOptions &options) {
  out << "Analyzing project...\n";
  out << "   Path: " << root.string() << "\n";
  if (!options.extensions.empty()) {
    auto sorted = options.extensions;
    std::sort(sorted.begin(), sorted.end());
    out << "   Extensions: " << JoinList(sorted) << "\n";
  }
  out << "\n";
}

void PrintNoFilesAdvice(std::ostream &out) {
  out << "No files analyzed.\n"
      << "   Suggestions:\n"
      << "   - Check that the directory contains source files\n"
      << "   - Use --ext to select specific extensions\n"
      << "   - Use --list-extensions to see the supported types\n";
}

void WriteReport(const std::optional<std::filesystem::path> &output_file,
                 const std::string &report, std::ostream &out) {
  if (!output_file) {
    out << report;
    return;
  }
  std::ofstream stream(*output_file);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " +
                             output_file->string());
  }
  stream << report;
}

} // namespace

LogLevel ParseLogLevel(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "error") {
    return LogLevel::kError;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::kWarn;
  }
  if (normalized == "info") {
    return LogLevel::kInfo;
  }
  if (normalized == "debug") {
    return LogLevel::kDebug;
  }
  throw std::invalid_argument("Unknown log level: " + value);
}

CliOptions ParseArguments(const std::vector<std::string> &arguments) {
  CliOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (DispatchOption(arguments, i, options)) {
      continue;
    }
    if (argument.size() > 1 && argument.front() == '-') {
      throw std::invalid_argument("Unknown argument: " + argument);
    }
    if (options.root) {
      throw std::invalid_argument("Unexpected argument: " + argument);
    }
    options.root = argument;
  }
  return options;
}

CliOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  CliOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

CliOptions MergeOptions(const CliOptions &config_options,
                        const CliOptions &cli_options) {
  CliOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.quiet, cli_options.quiet);
  override_value(merged.format, cli_options.format);
  override_value(merged.output_file, cli_options.output_file);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.log_level, cli_options.log_level);

  if (!cli_options.extensions.empty()) {
    merged.extensions = cli_options.extensions;
  }
  if (!cli_options.ignored_directories.empty()) {
    merged.ignored_directories = cli_options.ignored_directories;
  }
  merged.show_help = cli_options.show_help;
  merged.show_version = cli_options.show_version;
  merged.list_extensions = cli_options.list_extensions;
  return merged;
}

CliOptions ResolveOptions(const CliOptions &cli_options) {
  if (cli_options.show_help || cli_options.show_version ||
      cli_options.list_extensions) {
    return cli_options;
  }

  CliOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }
  return MergeOptions(config_options, cli_options);
}

void PrintUsage(std::ostream &out) {
  out << "Usage: codestat [PATH] [options]\n"
      << "Count code, comment and blank lines in a source tree.\n\n"
      << "Arguments:\n"
      << "  PATH                  Project directory to analyze (default: .)\n\n"
      << "Options:\n"
      << "  -e, --ext <list>      Extensions to analyze, repeatable or\n"
      << "                        comma-separated (e.g. --ext py,.js)\n"
      << "  -i, --ignore <list>   Extra directory names to ignore\n"
      << "  -q, --quiet           Print a compact summary only\n"
      << "  -v, --verbose         Print the full tree report (default)\n"
      << "  --format <format>     Report format: text or json (default: text)\n"
      << "  --out <file>          Write the report to a file\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --list-extensions     List the supported extensions and exit\n"
      << "  --version             Print the version and exit\n"
      << "  -h, --help            Show this message\n";
}

void PrintSupportedExtensions(std::ostream &out) {
  const LanguageRegistry registry;
  const TreeWalker walker(registry);
  const auto extensions = walker.SupportedExtensions();

  out << "\nSupported extensions:\n" << std::string(40, '=') << "\n";

  std::set<std::string> categorized;
  for (const auto &family : ExtensionFamilies()) {
    std::vector<std::string> matching;
    for (const auto &extension : extensions) {
      if (std::find(family.extensions.begin(), family.extensions.end(),
                    extension) != family.extensions.end()) {
        matching.push_back(extension);
      }
    }
    if (matching.empty()) {
      continue;
    }
    out << "\n" << family.name << ":\n  " << JoinList(matching) << "\n";
    categorized.insert(matching.begin(), matching.end());
  }

  std::vector<std::string> others;
  for (const auto &extension : extensions) {
    if (categorized.count(extension) == 0) {
      others.push_back(extension);
    }
  }
  if (!others.empty()) {
    constexpr std::size_t kColumns = 6;
    out << "\nOther languages:\n";
    for (std::size_t i = 0; i < others.size(); i += kColumns) {
      const auto end = std::min(others.size(), i + kColumns);
      out << "  "
          << JoinList(std::vector<std::string>(
                 others.begin() + static_cast<std::ptrdiff_t>(i),
                 others.begin() + static_cast<std::ptrdiff_t>(end)))
          << "\n";
    }
  }

  out << "\nTotal: " << extensions.size() << " supported extensions\n"
      << std::string(40, '=') << "\n\n";
}

int RunCli(const std::vector<std::string> &arguments, std::ostream &out,
           std::ostream &log) {
  const auto cli_options = ParseArguments(arguments);
  if (cli_options.show_help) {
    PrintUsage(out);
    return kExitSuccess;
  }
  if (cli_options.show_version) {
    out << "codestat " << kVersion << "\n";
    return kExitSuccess;
  }
  if (cli_options.list_extensions) {
    PrintSupportedExtensions(out);
    return kExitSuccess;
  }

  const auto options = ResolveOptions(cli_options);
  const auto root = std::filesystem::weakly_canonical(
      options.root.value_or(std::filesystem::path(".")));
  const auto format = options.format.value_or(ReportFormat::kText);
  const bool verbose = !options.quiet.value_or(false);
  auto logger = MakeLogger(BuildLoggingConfig(options), log);

  if (verbose && format == ReportFormat::kText) {
    PrintBanner(out, root, options);
  }

  const LanguageRegistry registry;
  const TreeWalker walker(registry, logger);
  const auto statistics = walker.Analyze(root, BuildWalkOptions(options));

  if (statistics.TotalFiles() == 0) {
    PrintNoFilesAdvice(out);
    return kExitSuccess;
  }

  const auto reporter = MakeReporter(format, verbose);
  WriteReport(options.output_file,
              reporter->Render(statistics, ReportContext{root}), out);
  return kExitSuccess;
}

} // namespace codestat
