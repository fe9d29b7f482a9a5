#pragma once

#include <codestat/language_registry.h>
#include <codestat/line_reader.h>
#include <codestat/logging.h>
#include <codestat/models.h>

#include <filesystem>
#include <memory>

namespace codestat {

// Comment lines come from the syntax tree's comment nodes. When no tree can be
// built, lines starting with the registry's Python marker are counted
// instead. Structural metadata needs an error-free tree from a UTF-8 source.
FileStatistics AnalyzePythonSource(const std::filesystem::path &path,
                                   const SourceText &source,
                                   const LanguageRegistry &registry,
                                   const std::shared_ptr<Logger> &logger);

FileStatistics AnalyzePythonFile(const std::filesystem::path &path,
                                 const LanguageRegistry &registry,
                                 const std::shared_ptr<Logger> &logger);

} // namespace codestat
