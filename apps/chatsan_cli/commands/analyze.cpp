#include "analyze.h"

#include "chatsan/analysis/plugin_registry.h"
#include "chatsan/app/export_files.h"
#include "chatsan/app/sanitize_pipeline.h"
#include "chatsan/core/clock.h"
#include "chatsan/core/salt_source.h"

#include "commands/common_options.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

using chatsan::cli::CliConfig;

std::vector<chatsan::apps::Option<CliConfig>> analyze_options() {
  auto options = chatsan::cli::policy_options();
  options.push_back({"--plugin", true, "Analysis plugin name (see 'plugins')",
                     [](CliConfig& config, const std::string& value) {
                       config.plugin = value;
                       return true;
                     }});
  options.push_back({"--param", true, "Plugin parameter key=value (repeatable)",
                     [](CliConfig& config, const std::string& value) {
                       const auto eq = value.find('=');
                       if (eq == std::string::npos || eq == 0) {
                         std::cerr << "Invalid --param: " << value << " (expected key=value)\n";
                         return false;
                       }
                       config.params[value.substr(0, eq)] = value.substr(eq + 1);
                       return true;
                     }});
  return options;
}

}  // namespace

int cmd_plugins() {
  const auto registry = chatsan::analysis::make_default_registry();
  for (const auto& name : registry.names()) {
    std::cout << name << "  " << registry.find(name)->description() << "\n";
  }
  return 0;
}

int cmd_analyze(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = analyze_options();
  auto defaults = chatsan::cli::load_defaults();
  if (!defaults.has_value()) {
    return 1;
  }
  auto parsed = chatsan::apps::parse_options(argc, argv, options, 2, std::move(*defaults));
  if (parsed.config.show_help || !parsed.ok || parsed.positionals.size() != 1 ||
      !parsed.config.plugin.has_value()) {
    std::cerr << "Usage: chatsan_cli analyze <export.json> --plugin <name> [options]\n";
    chatsan::apps::print_options(std::cerr, options);
    return parsed.config.show_help ? 0 : 2;
  }
  const CliConfig& config = parsed.config;

  auto bytes = chatsan::app::read_export_file(parsed.positionals.front());
  if (!bytes.has_value()) {
    std::cerr << "Error: " << bytes.error() << "\n";
    return 1;
  }

  // Plugins consume the text projection, whatever --format says.
  auto request = chatsan::cli::to_request(config);
  request.format = "text";

  chatsan::core::RandomSaltSource salt_source;
  chatsan::core::SystemClock clock;
  auto sanitized =
      chatsan::app::run_sanitize_pipeline(bytes.value(), request, salt_source, clock);
  if (!sanitized.has_value()) {
    std::cerr << "Error: " << chatsan::core::describe(sanitized.error()) << "\n";
    return 1;
  }

  const auto registry = chatsan::analysis::make_default_registry();
  chatsan::analysis::AnalysisRequest analysis{sanitized.value().rendered, config.params};
  auto result = registry.run(*config.plugin, analysis);
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return 1;
  }

  std::cout << result.value().result;
  for (const auto& [key, value] : result.value().metadata) {
    std::cerr << key << ": " << value << "\n";
  }
  return 0;
}
