#include "chatsan/analysis/plugin_registry.h"

#include "chatsan/analysis/builtin_plugins.h"

#include <algorithm>

namespace chatsan::analysis {

core::Result<bool, std::string> PluginRegistry::add(std::unique_ptr<IAnalysisPlugin> plugin) {
  if (plugin == nullptr) {
    return core::Result<bool, std::string>::err("cannot register a null plugin");
  }
  if (find(plugin->name()) != nullptr) {
    return core::Result<bool, std::string>::err("plugin already registered: " +
                                                std::string(plugin->name()));
  }
  plugins_.push_back(std::move(plugin));
  return core::Result<bool, std::string>::ok(true);
}

const IAnalysisPlugin* PluginRegistry::find(const std::string_view name) const {
  for (const auto& plugin : plugins_) {
    if (plugin->name() == name) {
      return plugin.get();
    }
  }
  return nullptr;
}

std::vector<std::string> PluginRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(plugins_.size());
  for (const auto& plugin : plugins_) {
    out.emplace_back(plugin->name());
  }
  std::sort(out.begin(), out.end());
  return out;
}

core::Result<AnalysisResult, std::string> PluginRegistry::run(
    const std::string_view name, const AnalysisRequest& request) const {
  const IAnalysisPlugin* plugin = find(name);
  if (plugin == nullptr) {
    return core::Result<AnalysisResult, std::string>::err("unknown analysis plugin: " +
                                                          std::string(name));
  }
  AnalysisResult result = plugin->analyze(request);
  result.metadata.emplace("plugin", std::string(plugin->name()));
  return core::Result<AnalysisResult, std::string>::ok(std::move(result));
}

PluginRegistry make_default_registry() {
  PluginRegistry registry;
  // Built-in names are distinct, so these cannot fail.
  (void)registry.add(std::make_unique<ParticipantActivityPlugin>());
  (void)registry.add(std::make_unique<HourlyTimelinePlugin>());
  return registry;
}

}  // namespace chatsan::analysis
