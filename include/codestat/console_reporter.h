#pragma once

#include <codestat/reporter.h>

namespace codestat {

// Verbose mode renders the header, the file tree, the directory-only tree
// and the summary. Quiet mode renders a compact summary.
class ConsoleReporter : public Reporter {
public:
  explicit ConsoleReporter(bool verbose = true);

  std::string Render(const DirectoryStatistics &statistics,
                     const ReportContext &context) const override;

private:
  bool verbose_;
};

} // namespace codestat
