#pragma once

#include "chatsan/core/result.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace chatsan::config {

// RunConfig holds the defaults every command starts from.
// Precedence: command-line flags > environment > the defaults below.
//
// Environment variables:
//   CHATSAN_DEFAULT_APPROACH  privacy | size | context
//   CHATSAN_DEFAULT_LEVEL     1 | 2 | 3
//   CHATSAN_DEFAULT_FORMAT    text | json | markdown | csv
//   CHATSAN_SALT              fixed pseudonym salt (reproducible runs)
//   CHATSAN_OUTPUT_DIR        directory for written artifacts
//   CHATSAN_DB                SQLite run-log database path
//   CHATSAN_WORKERS           batch worker threads
struct RunConfig {
  std::string approach{"privacy"};
  int level{2};
  std::string format{"text"};
  std::optional<std::string> salt;
  std::string output_dir{"data/output"};
  std::optional<std::string> db_path;
  std::size_t workers{4};
  bool persist_salt{false};
  std::size_t pseudonym_length{12};
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

// Reads the process environment.
[[nodiscard]] EnvLookup process_env();

// Applies environment overrides to the defaults. Values are only checked for
// type here (a level must be an integer); policy validity is checked by the
// engine so that flags and environment fail the same way.
[[nodiscard]] core::Result<RunConfig, std::string> load_run_config(const EnvLookup& env);

// Parses a base-10 integer; the whole string must be consumed.
[[nodiscard]] std::optional<int> parse_int(std::string_view text);

}  // namespace chatsan::config
