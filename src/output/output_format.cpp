#include "chatsan/output/output_format.h"

#include "chatsan/core/text.h"

#include <string>

namespace chatsan::output {

std::string_view format_name(const OutputFormat format) {
  switch (format) {
    case OutputFormat::kText:
      return "text";
    case OutputFormat::kJson:
      return "json";
    case OutputFormat::kMarkdown:
      return "markdown";
    case OutputFormat::kCsv:
      return "csv";
  }
  return "text";
}

std::string_view file_extension(const OutputFormat format) {
  switch (format) {
    case OutputFormat::kText:
      return ".txt";
    case OutputFormat::kJson:
      return ".json";
    case OutputFormat::kMarkdown:
      return ".md";
    case OutputFormat::kCsv:
      return ".csv";
  }
  return ".txt";
}

core::Result<OutputFormat, core::EngineError> parse_output_format(const std::string_view name) {
  using R = core::Result<OutputFormat, core::EngineError>;
  const std::string key = core::normalize_ascii_lower(core::trim(name));
  if (key == "text" || key == "txt") {
    return R::ok(OutputFormat::kText);
  }
  if (key == "json") {
    return R::ok(OutputFormat::kJson);
  }
  if (key == "markdown" || key == "md") {
    return R::ok(OutputFormat::kMarkdown);
  }
  if (key == "csv") {
    return R::ok(OutputFormat::kCsv);
  }
  return R::err(core::make_error(
      core::ErrorCode::kUnsupportedFormatError,
      "unknown output format '" + std::string(name) + "' (expected text, json, markdown or csv)"));
}

core::Result<bool, core::EngineError> check_compatibility(const cleaning::PolicySpec& spec,
                                                          const OutputFormat format) {
  if (format == OutputFormat::kCsv && !spec.is_flat()) {
    return core::Result<bool, core::EngineError>::err(core::make_error(
        core::ErrorCode::kUnsupportedFormatError,
        "policy " + domain::policy_label(spec.policy) +
            " produces nested fields that CSV cannot represent; use json or markdown"));
  }
  return core::Result<bool, core::EngineError>::ok(true);
}

}  // namespace chatsan::output
