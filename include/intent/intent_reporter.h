#pragma once

#include <intent/models.h>

#include <string>
#include <vector>

namespace intent {

struct Report {
  std::string markdown;
  std::string json;
};

struct ReportOptions {
  std::string source;
  // "markdown" and/or "json"; empty renders markdown only.
  std::vector<std::string> formats;
};

class IntentReporter {
public:
  Report Render(const CodeIntent &intent, const ReportOptions &options) const;
};

} // namespace intent
