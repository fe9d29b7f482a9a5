#include <codestat/file_analyzer.h>
#include <codestat/tree_walker.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <string_view>
#include <system_error>
#include <utility>

namespace codestat {
namespace {

constexpr std::string_view kEggInfoSuffix = ".egg-info";

bool IsHidden(const std::string &name) {
  return !name.empty() && name.front() == '.';
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.substr(value.size() - suffix.size()) == suffix;
}

std::filesystem::path ValidateRoot(const std::filesystem::path &root) {
  std::error_code error;
  const auto status = std::filesystem::status(root, error);
  if (!std::filesystem::exists(status)) {
    throw std::filesystem::filesystem_error(
        "Path does not exist", root,
        std::make_error_code(std::errc::no_such_file_or_directory));
  }
  if (!std::filesystem::is_directory(status)) {
    throw std::filesystem::filesystem_error(
        "Path is not a directory", root,
        std::make_error_code(std::errc::not_a_directory));
  }
  return root;
}

std::optional<std::set<std::string>>
NormalizeExtensions(const std::optional<std::set<std::string>> &extensions) {
  if (!extensions) {
    return std::nullopt;
  }
  std::set<std::string> normalized;
  for (const auto &extension : *extensions) {
    normalized.insert(NormalizeExtension(extension));
  }
  return normalized;
}

} // namespace

const std::set<std::string> &BuiltinIgnoredDirectories() {
  static const std::set<std::string> directories = {
      // Python
      "venv", "env", ".venv", "__pycache__", ".eggs", "build", "dist",
      ".pytest_cache", ".tox", ".mypy_cache",
      // JavaScript
      "node_modules", ".npm",
      // Version control
      ".git", ".svn", ".hg", ".bzr",
      // Editors and IDEs
      ".idea", ".vscode", ".vs", ".eclipse", ".settings",
      // Build output
      "target", "out", "bin", "obj",
      // Scratch
      ".cache", "tmp", "temp", "logs", "coverage"};
  return directories;
}

bool IsIgnoredDirectory(const std::string &name,
                        const std::set<std::string> &extra_ignored) {
  return IsHidden(name) || BuiltinIgnoredDirectories().count(name) > 0 ||
         EndsWith(name, kEggInfoSuffix) || extra_ignored.count(name) > 0;
}

std::vector<std::filesystem::directory_entry>
FilesystemDirectoryLister::List(const std::filesystem::path &directory,
                                std::error_code &error) const {
  std::vector<std::filesystem::directory_entry> entries;
  std::filesystem::directory_iterator iterator(directory, error);
  const std::filesystem::directory_iterator end{};
  for (; !error && iterator != end; iterator.increment(error)) {
    entries.push_back(*iterator);
  }
  return entries;
}

TreeWalker::TreeWalker(const LanguageRegistry &registry,
                       std::shared_ptr<Logger> logger,
                       std::shared_ptr<const DirectoryLister> lister)
    : registry_(registry), logger_(EnsureLogger(std::move(logger))),
      lister_(std::move(lister)) {
  if (!lister_) {
    lister_ = std::make_shared<FilesystemDirectoryLister>();
  }
}

DirectoryStatistics TreeWalker::Analyze(const std::filesystem::path &root,
                                        const WalkOptions &options) const {
  const auto validated = ValidateRoot(root);
  WalkOptions normalized = options;
  normalized.extensions = NormalizeExtensions(options.extensions);

  logger_->Log(LogLevel::kInfo, events::kWalkStart,
               {{"root", validated.string()}});
  const auto start = std::chrono::steady_clock::now();

  auto statistics = WalkDirectory(validated, normalized);
  statistics.SortFilesBySize();

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  logger_->Log(LogLevel::kInfo, events::kWalkComplete,
               {{"root", validated.string()},
                {"files", std::to_string(statistics.TotalFiles())},
                {"duration_ms", std::to_string(elapsed.count())}});
  return statistics;
}

std::vector<std::string> TreeWalker::SupportedExtensions() const {
  std::vector<std::string> supported;
  for (const auto &extension : registry_.Extensions()) {
    if (SelectAnalyzer(registry_, std::filesystem::path("file" + extension))) {
      supported.push_back(extension);
    }
  }
  return supported;
}

DirectoryStatistics
TreeWalker::WalkDirectory(const std::filesystem::path &directory,
                          const WalkOptions &options) const {
  DirectoryStatistics node;
  node.path = directory;

  std::error_code error;
  auto entries = lister_->List(directory, error);
  if (error) {
    logger_->Log(LogLevel::kWarn, events::kDirectoryUnreadable,
                 {{"path", directory.string()}, {"reason", error.message()}});
    return node;
  }

  std::sort(entries.begin(), entries.end(),
            [](const auto &left, const auto &right) {
              return left.path().filename() < right.path().filename();
            });

  for (const auto &entry : entries) {
    const auto name = entry.path().filename().string();
    std::error_code status_error;
    if (entry.is_symlink(status_error) &&
        entry.is_directory(status_error)) {
      continue;
    }
    if (entry.is_directory(status_error)) {
      if (IsIgnoredDirectory(name, options.ignored_directories)) {
        continue;
      }
      auto child = WalkDirectory(entry.path(), options);
      if (child.TotalFiles() > 0) {
        node.subdirectories.push_back(std::move(child));
      }
      continue;
    }
    if (!entry.is_regular_file(status_error) || IsHidden(name)) {
      continue;
    }
    if (auto file = AnalyzeCandidate(entry.path(), options)) {
      node.files.push_back(std::move(*file));
    }
  }
  return node;
}

std::optional<FileStatistics>
TreeWalker::AnalyzeCandidate(const std::filesystem::path &path,
                             const WalkOptions &options) const {
  if (options.extensions &&
      options.extensions->count(ExtensionOf(path)) == 0) {
    return std::nullopt;
  }
  const auto analyzer = SelectAnalyzer(registry_, path);
  if (!analyzer) {
    return std::nullopt;
  }

  try {
    auto statistics = AnalyzeFile(*analyzer, path, registry_, logger_);
    logger_->Log(LogLevel::kDebug, events::kFileAnalyzed,
                 {{"path", path.string()},
                  {"language", statistics.language()},
                  {"lines", std::to_string(statistics.total_lines())}});
    return statistics;
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kWarn, events::kFileAnalysisFailed,
                 {{"path", path.string()}, {"reason", error.what()}});
    return std::nullopt;
  }
}

} // namespace codestat
