#include "batch.h"

#include "chatsan/app/batch_processor.h"
#include "chatsan/app/export_files.h"
#include "chatsan/config/run_config.h"
#include "chatsan/core/clock.h"
#include "chatsan/core/salt_source.h"
#include "chatsan/storage/output_store.h"

#include "commands/common_options.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

using chatsan::cli::CliConfig;

std::vector<chatsan::apps::Option<CliConfig>> batch_options() {
  auto options = chatsan::cli::policy_options();
  options.push_back({"--workers", true, "Worker threads (default 4)",
                     [](CliConfig& config, const std::string& value) {
                       const auto workers = chatsan::config::parse_int(value);
                       if (!workers.has_value() || *workers < 1) {
                         std::cerr << "Invalid --workers: " << value << "\n";
                         return false;
                       }
                       config.run.workers = static_cast<std::size_t>(*workers);
                       return true;
                     }});
  return options;
}

}  // namespace

int cmd_batch(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = batch_options();
  auto defaults = chatsan::cli::load_defaults();
  if (!defaults.has_value()) {
    return 1;
  }
  auto parsed = chatsan::apps::parse_options(argc, argv, options, 2, std::move(*defaults));
  if (parsed.config.show_help || !parsed.ok || parsed.positionals.size() != 1) {
    std::cerr << "Usage: chatsan_cli batch <input-dir> [options]\n";
    chatsan::apps::print_options(std::cerr, options);
    return parsed.config.show_help ? 0 : 2;
  }
  const CliConfig& config = parsed.config;

  auto inputs = chatsan::app::list_export_files(parsed.positionals.front());
  if (!inputs.has_value()) {
    std::cerr << "Error: " << inputs.error() << "\n";
    return 1;
  }
  if (inputs.value().empty()) {
    std::cerr << "No .json exports found in " << parsed.positionals.front() << "\n";
    return 0;
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

  chatsan::app::BatchOptions batch;
  batch.request = chatsan::cli::to_request(config);
  batch.max_workers = config.run.workers;

  std::cout << "Processing " << inputs.value().size() << " export(s) with up to "
            << batch.max_workers << " worker(s)\n";
  const auto summary =
      chatsan::app::run_batch(inputs.value(), batch, salt_source, clock, store, *log);

  for (const auto& outcome : summary.outcomes) {
    if (outcome.ok()) {
      std::cout << "  ok      " << outcome.input.filename().string() << " -> "
                << outcome.output->filename().string() << " (" << outcome.record.message_count
                << " messages)\n";
      for (const auto& warning : outcome.record.warnings) {
        std::cerr << "  warning " << outcome.input.filename().string() << ": " << warning
                  << "\n";
      }
    } else {
      std::cerr << "  failed  " << outcome.input.filename().string() << ": " << *outcome.error
                << "\n";
    }
  }
  for (const auto& error : summary.log_errors) {
    std::cerr << "Warning: run not recorded: " << error << "\n";
  }

  std::cout << "Done: " << summary.succeeded << " succeeded, " << summary.failed << " failed\n";
  return summary.failed == 0 ? 0 : 1;
}
