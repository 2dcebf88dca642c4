#include "chatsan/config/run_config.h"

#include "chatsan/core/text.h"

#include <charconv>
#include <cstdlib>

namespace chatsan::config {

EnvLookup process_env() {
  return [](const std::string_view name) -> std::optional<std::string> {
    const std::string key(name);
    const char* value = std::getenv(key.c_str());  // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

std::optional<int> parse_int(const std::string_view text) {
  const std::string trimmed = core::trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  int value = 0;
  const auto* end = trimmed.data() + trimmed.size();
  const auto [ptr, ec] = std::from_chars(trimmed.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

core::Result<RunConfig, std::string> load_run_config(const EnvLookup& env) {
  using R = core::Result<RunConfig, std::string>;
  RunConfig config;

  // Empty values count as unset.
  auto read = [&env](const char* name) -> std::optional<std::string> {
    auto value = env(name);
    if (value.has_value() && core::trim(*value).empty()) {
      return std::nullopt;
    }
    return value;
  };

  if (auto approach = read("CHATSAN_DEFAULT_APPROACH")) {
    config.approach = core::trim(*approach);
  }
  if (auto level = read("CHATSAN_DEFAULT_LEVEL")) {
    const auto parsed = parse_int(*level);
    if (!parsed.has_value()) {
      return R::err("CHATSAN_DEFAULT_LEVEL must be an integer, got '" + *level + "'");
    }
    config.level = *parsed;
  }
  if (auto format = read("CHATSAN_DEFAULT_FORMAT")) {
    config.format = core::trim(*format);
  }
  if (auto salt = read("CHATSAN_SALT")) {
    config.salt = *salt;
  }
  if (auto dir = read("CHATSAN_OUTPUT_DIR")) {
    config.output_dir = core::trim(*dir);
  }
  if (auto db = read("CHATSAN_DB")) {
    config.db_path = core::trim(*db);
  }
  if (auto workers = read("CHATSAN_WORKERS")) {
    const auto parsed = parse_int(*workers);
    if (!parsed.has_value() || *parsed < 1) {
      return R::err("CHATSAN_WORKERS must be a positive integer, got '" + *workers + "'");
    }
    config.workers = static_cast<std::size_t>(*parsed);
  }
  return R::ok(std::move(config));
}

}  // namespace chatsan::config
