#pragma once

#include <codestat/reporter.h>

namespace codestat {

class JsonReporter : public Reporter {
public:
  std::string Render(const DirectoryStatistics &statistics,
                     const ReportContext &context) const override;
};

} // namespace codestat
