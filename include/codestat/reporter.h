#pragma once

#include <codestat/models.h>

#include <filesystem>
#include <memory>
#include <string>

namespace codestat {

enum class ReportFormat { kText, kJson };

struct ReportContext {
  std::filesystem::path project_path;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual std::string Render(const DirectoryStatistics &statistics,
                             const ReportContext &context) const = 0;
};

// Accepts "text" and "json", ignoring case. Throws std::invalid_argument.
ReportFormat ParseReportFormat(const std::string &value);
std::string ReportFormatName(ReportFormat format);

std::unique_ptr<Reporter> MakeReporter(ReportFormat format, bool verbose);

} // namespace codestat
