#pragma once

#include "chatsan/analysis/analysis_plugin.h"
#include "chatsan/core/result.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chatsan::analysis {

// PluginRegistry owns analysis plugins, keyed by their unique name.
class PluginRegistry {
 public:
  // Fails when a plugin with the same name is already registered.
  [[nodiscard]] core::Result<bool, std::string> add(std::unique_ptr<IAnalysisPlugin> plugin);

  [[nodiscard]] const IAnalysisPlugin* find(std::string_view name) const;

  // Registered names, sorted.
  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] core::Result<AnalysisResult, std::string> run(std::string_view name,
                                                              const AnalysisRequest& request) const;

 private:
  std::vector<std::unique_ptr<IAnalysisPlugin>> plugins_;
};

// Registry pre-loaded with the built-in plugins.
[[nodiscard]] PluginRegistry make_default_registry();

}  // namespace chatsan::analysis
