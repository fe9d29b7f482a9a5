#pragma once

#include <codestat/logging.h>
#include <codestat/reporter.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace codestat {

inline constexpr const char *kVersion = "0.1.0";

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;

struct CliOptions {
  std::optional<std::filesystem::path> root;
  // Normalized to lowercase with a leading dot.
  std::vector<std::string> extensions;
  std::vector<std::string> ignored_directories;
  std::optional<bool> quiet;
  std::optional<ReportFormat> format;
  std::optional<std::filesystem::path> output_file;
  std::optional<std::filesystem::path> config_file;
  std::optional<LogLevel> log_level;
  bool show_help = false;
  bool show_version = false;
  bool list_extensions = false;
};

LogLevel ParseLogLevel(const std::string &value);

// Throws std::invalid_argument for unknown flags and missing values.
CliOptions ParseArguments(const std::vector<std::string> &arguments);
// Throws std::runtime_error when the file is missing and
// std::invalid_argument for unsupported formats, keys or values.
CliOptions ParseConfigFile(const std::filesystem::path &path);
// Values given on the command line win over the config file.
CliOptions MergeOptions(const CliOptions &config_options,
                        const CliOptions &cli_options);
CliOptions ResolveOptions(const CliOptions &cli_options);

void PrintUsage(std::ostream &out);
void PrintSupportedExtensions(std::ostream &out);

// Runs one invocation. Fatal conditions propagate as exceptions for the
// caller to map onto kExitFailure.
int RunCli(const std::vector<std::string> &arguments, std::ostream &out,
           std::ostream &log);

} // namespace codestat
