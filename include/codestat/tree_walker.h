#pragma once

#include <codestat/language_registry.h>
#include <codestat/logging.h>
#include <codestat/models.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace codestat {

struct WalkOptions {
  // Allow-list of extensions; std::nullopt analyzes every claimed file.
  std::optional<std::set<std::string>> extensions;
  // Directory names skipped in addition to the built-in list.
  std::set<std::string> ignored_directories;
};

const std::set<std::string> &BuiltinIgnoredDirectories();

bool IsIgnoredDirectory(const std::string &name,
                        const std::set<std::string> &extra_ignored);

class DirectoryLister {
public:
  virtual ~DirectoryLister() = default;
  // Immediate children of directory, in any order. Failures set error.
  virtual std::vector<std::filesystem::directory_entry>
  List(const std::filesystem::path &directory,
       std::error_code &error) const = 0;
};

class FilesystemDirectoryLister : public DirectoryLister {
public:
  std::vector<std::filesystem::directory_entry>
  List(const std::filesystem::path &directory,
       std::error_code &error) const override;
};

class TreeWalker {
public:
  // A null lister reads the real filesystem.
  explicit TreeWalker(const LanguageRegistry &registry,
                      std::shared_ptr<Logger> logger = nullptr,
                      std::shared_ptr<const DirectoryLister> lister = nullptr);

  // Throws std::filesystem::filesystem_error when root is missing or is not
  // a directory. Everything below the root is best effort.
  DirectoryStatistics Analyze(const std::filesystem::path &root,
                              const WalkOptions &options = {}) const;

  std::vector<std::string> SupportedExtensions() const;

private:
  DirectoryStatistics WalkDirectory(const std::filesystem::path &directory,
                                    const WalkOptions &options) const;
  std::optional<FileStatistics>
  AnalyzeCandidate(const std::filesystem::path &path,
                   const WalkOptions &options) const;

  const LanguageRegistry &registry_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<const DirectoryLister> lister_;
};

} // namespace codestat
