#include <codestat/console_reporter.h>
#include <codestat/json_reporter.h>
#include <codestat/reporter.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace codestat {

ReportFormat ParseReportFormat(const std::string &value) {
  std::string normalized = value;
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (normalized == "text") {
    return ReportFormat::kText;
  }
  if (normalized == "json") {
    return ReportFormat::kJson;
  }
  throw std::invalid_argument("Unsupported format: " + value);
}

std::string ReportFormatName(ReportFormat format) {
  switch (format) {
  case ReportFormat::kText:
    return "text";
  case ReportFormat::kJson:
    return "json";
  }
  return "unknown";
}

std::unique_ptr<Reporter> MakeReporter(ReportFormat format, bool verbose) {
  switch (format) {
  case ReportFormat::kText:
    return std::make_unique<ConsoleReporter>(verbose);
  case ReportFormat::kJson:
    return std::make_unique<JsonReporter>();
  }
  throw std::invalid_argument("Unsupported report format");
}

} // namespace codestat
