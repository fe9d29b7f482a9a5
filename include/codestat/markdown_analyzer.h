#pragma once

#include <codestat/line_reader.h>
#include <codestat/logging.h>
#include <codestat/models.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace codestat {

// Fenced blocks open and close on lines starting with three backticks. Their
// contents are not scanned for headings, links, images or tables.
MarkdownMetadata ScanMarkdown(const std::vector<std::string> &lines);

FileStatistics AnalyzeMarkdownSource(const std::filesystem::path &path,
                                     const SourceText &source);

FileStatistics AnalyzeMarkdownFile(const std::filesystem::path &path,
                                   const std::shared_ptr<Logger> &logger);

} // namespace codestat
