#pragma once

#include <map>
#include <string>
#include <string_view>

namespace chatsan::analysis {

// Input of an analysis: the text projection of a cleaned chat, plus free-form
// string parameters. Plugins only ever see sanitized output.
struct AnalysisRequest {
  std::string chat_text;
  std::map<std::string, std::string> params;
};

struct AnalysisResult {
  std::string result;
  std::string format;  // "markdown" or "text"
  std::map<std::string, std::string> metadata;
};

class IAnalysisPlugin {
 public:
  virtual ~IAnalysisPlugin() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual AnalysisResult analyze(const AnalysisRequest& request) const = 0;

 protected:
  IAnalysisPlugin() = default;
  IAnalysisPlugin(const IAnalysisPlugin&) = default;
  IAnalysisPlugin& operator=(const IAnalysisPlugin&) = default;
  IAnalysisPlugin(IAnalysisPlugin&&) = default;
  IAnalysisPlugin& operator=(IAnalysisPlugin&&) = default;
};

}  // namespace chatsan::analysis
