#pragma once

#include "chatsan/app/sanitize_pipeline.h"
#include "chatsan/config/run_config.h"
#include "chatsan/core/result.h"
#include "chatsan/storage/run_log.h"

#include "shared/arg_parser.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatsan::cli {

// CliConfig is the effective configuration of a subcommand: environment
// defaults from RunConfig, then flags on top.
struct CliConfig {
  config::RunConfig run;                      // NOLINT(readability-identifier-naming)
  bool to_stdout{false};                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> metadata_path;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> plugin;          // NOLINT(readability-identifier-naming)
  std::map<std::string, std::string> params;  // NOLINT(readability-identifier-naming)
  bool show_help{false};                      // NOLINT(readability-identifier-naming)
};

// Flags shared by clean, batch and analyze.
[[nodiscard]] std::vector<apps::Option<CliConfig>> policy_options();

// Environment defaults, reported to stderr on failure.
[[nodiscard]] std::optional<CliConfig> load_defaults();

[[nodiscard]] app::SanitizeRequest to_request(const CliConfig& config);

// In-memory when no database is configured, SQLite otherwise.
[[nodiscard]] core::Result<std::unique_ptr<storage::IRunLog>, std::string> open_run_log(
    const CliConfig& config);

}  // namespace chatsan::cli
