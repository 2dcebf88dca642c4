#include "common_options.h"

#include "chatsan/storage/sqlite/sqlite_db.h"
#include "chatsan/storage/sqlite/sqlite_run_log.h"

#include <iostream>

namespace chatsan::cli {

namespace {

bool handle_approach(CliConfig& config, const std::string& value) {
  config.run.approach = value;
  return true;
}

bool handle_level(CliConfig& config, const std::string& value) {
  const auto level = config::parse_int(value);
  if (!level.has_value()) {
    std::cerr << "Invalid --level: " << value << " (valid: 1, 2, 3)\n";
    return false;
  }
  config.run.level = *level;
  return true;
}

bool handle_format(CliConfig& config, const std::string& value) {
  config.run.format = value;
  return true;
}

bool handle_salt(CliConfig& config, const std::string& value) {
  if (value.empty()) {
    std::cerr << "Invalid --salt: must not be empty\n";
    return false;
  }
  config.run.salt = value;
  return true;
}

bool handle_persist_salt(CliConfig& config, const std::string& /*value*/) {
  config.run.persist_salt = true;
  return true;
}

bool handle_pseudonym_length(CliConfig& config, const std::string& value) {
  const auto length = config::parse_int(value);
  if (!length.has_value() || *length < 1 || *length > 64) {
    std::cerr << "Invalid --pseudonym-length: " << value << " (valid: 1..64)\n";
    return false;
  }
  config.run.pseudonym_length = static_cast<std::size_t>(*length);
  return true;
}

bool handle_out_dir(CliConfig& config, const std::string& value) {
  config.run.output_dir = value;
  return true;
}

bool handle_db(CliConfig& config, const std::string& value) {
  config.run.db_path = value;
  return true;
}

bool handle_help(CliConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return true;
}

}  // namespace

std::vector<apps::Option<CliConfig>> policy_options() {
  return {
      {"--approach", true, "Cleaning approach (privacy|size|context)", handle_approach},
      {"--level", true, "Cleaning level (1|2|3)", handle_level},
      {"--format", true, "Output format (text|json|markdown|csv)", handle_format},
      {"--salt", true, "Fixed pseudonym salt for reproducible output", handle_salt},
      {"--persist-salt", false, "Record the salt in run metadata", handle_persist_salt},
      {"--pseudonym-length", true, "Hex digits per pseudonym (default 12)",
       handle_pseudonym_length},
      {"--out-dir", true, "Directory for written artifacts", handle_out_dir},
      {"--db", true, "SQLite run-log database path", handle_db},
      {"--help", false, "Show usage", handle_help},
  };
}

std::optional<CliConfig> load_defaults() {
  auto run = config::load_run_config(config::process_env());
  if (!run.has_value()) {
    std::cerr << "Invalid environment: " << run.error() << "\n";
    return std::nullopt;
  }
  CliConfig config;
  config.run = std::move(run).value();
  return config;
}

app::SanitizeRequest to_request(const CliConfig& config) {
  app::SanitizeRequest request;
  request.approach = config.run.approach;
  request.level = config.run.level;
  request.format = config.run.format;
  if (config.run.salt.has_value()) {
    request.salt = core::Salt{*config.run.salt};
  }
  request.persist_salt = config.run.persist_salt;
  request.pseudonym_length = config.run.pseudonym_length;
  return request;
}

core::Result<std::unique_ptr<storage::IRunLog>, std::string> open_run_log(
    const CliConfig& config) {
  using R = core::Result<std::unique_ptr<storage::IRunLog>, std::string>;
  if (!config.run.db_path.has_value()) {
    return R::ok(std::make_unique<storage::InMemoryRunLog>());
  }

  auto db_result = storage::sqlite::SqliteDb::open(*config.run.db_path);
  if (!db_result.has_value()) {
    return R::err(db_result.error());
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    return R::err(schema_result.error());
  }
  return R::ok(std::make_unique<storage::sqlite::SqliteRunLog>(db));
}

}  // namespace chatsan::cli
