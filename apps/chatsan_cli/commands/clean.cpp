#include "clean.h"

#include "chatsan/app/batch_processor.h"
#include "chatsan/app/export_files.h"
#include "chatsan/app/sanitize_pipeline.h"
#include "chatsan/core/clock.h"
#include "chatsan/core/salt_source.h"
#include "chatsan/storage/output_store.h"

#include "commands/common_options.h"
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

using chatsan::cli::CliConfig;

std::vector<chatsan::apps::Option<CliConfig>> clean_options() {
  auto options = chatsan::cli::policy_options();
  options.push_back({"--stdout", false, "Print the result instead of writing a file",
                     [](CliConfig& config, const std::string&) {
                       config.to_stdout = true;
                       return true;
                     }});
  options.push_back({"--metadata", true, "Also write run metadata JSON to this path",
                     [](CliConfig& config, const std::string& value) {
                       config.metadata_path = value;
                       return true;
                     }});
  return options;
}

void print_usage(const std::vector<chatsan::apps::Option<CliConfig>>& options) {
  std::cerr << "Usage: chatsan_cli clean <export.json> [options]\n";
  chatsan::apps::print_options(std::cerr, options);
}

bool write_text_file(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return false;
  }
  out << content;
  return static_cast<bool>(out);
}

// --stdout: run the pipeline directly, nothing is stored.
int clean_to_stdout(const std::string& input, const CliConfig& config) {
  auto bytes = chatsan::app::read_export_file(input);
  if (!bytes.has_value()) {
    std::cerr << "Error: " << bytes.error() << "\n";
    return 1;
  }

  chatsan::core::RandomSaltSource salt_source;
  chatsan::core::SystemClock clock;
  auto result = chatsan::app::run_sanitize_pipeline(
      bytes.value(), chatsan::cli::to_request(config), salt_source, clock);
  if (!result.has_value()) {
    std::cerr << "Error: " << chatsan::core::describe(result.error()) << "\n";
    return 1;
  }

  std::cout << result.value().rendered;
  if (config.metadata_path.has_value() &&
      !write_text_file(*config.metadata_path, result.value().metadata_json)) {
    std::cerr << "Error: failed to write metadata to " << *config.metadata_path << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int cmd_clean(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = clean_options();
  auto defaults = chatsan::cli::load_defaults();
  if (!defaults.has_value()) {
    return 1;
  }
  auto parsed = chatsan::apps::parse_options(argc, argv, options, 2, std::move(*defaults));
  if (parsed.config.show_help) {
    print_usage(options);
    return 0;
  }
  if (!parsed.ok || parsed.positionals.size() != 1) {
    print_usage(options);
    return 2;
  }
  const CliConfig& config = parsed.config;
  const std::string& input = parsed.positionals.front();

  if (config.to_stdout) {
    return clean_to_stdout(input, config);
  }

  auto run_log = chatsan::cli::open_run_log(config);
  if (!run_log.has_value()) {
    std::cerr << "Failed to open run log: " << run_log.error() << "\n";
    return 1;
  }
  auto log = std::move(run_log).value();

  chatsan::core::RandomSaltSource salt_source;
  chatsan::core::SystemClock clock;
  chatsan::storage::FileOutputStore store(config.run.output_dir);

  auto outcome = chatsan::app::process_export(input, chatsan::cli::to_request(config),
                                              salt_source, clock, store);
  auto appended = chatsan::app::record_run(*log, outcome.record);
  if (!appended.has_value()) {
    std::cerr << "Warning: run not recorded: " << appended.error() << "\n";
  }

  if (!outcome.ok()) {
    std::cerr << "Error: " << *outcome.error << "\n";
    return 1;
  }

  if (config.metadata_path.has_value() &&
      !write_text_file(*config.metadata_path, outcome.metadata_json)) {
    std::cerr << "Error: failed to write metadata to " << *config.metadata_path << "\n";
    return 1;
  }
  for (const auto& warning : outcome.record.warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }
  std::cout << "Wrote " << outcome.record.message_count << " messages to "
            << outcome.output->string() << "\n";
  return 0;
}
