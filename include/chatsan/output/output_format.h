#pragma once

#include "chatsan/cleaning/policy_table.h"
#include "chatsan/core/errors.h"
#include "chatsan/core/result.h"

#include <string_view>

namespace chatsan::output {

enum class OutputFormat {
  kText,
  kJson,
  kMarkdown,
  kCsv,
};

[[nodiscard]] std::string_view format_name(OutputFormat format);

// File extension including the dot: ".txt", ".json", ".md", ".csv".
[[nodiscard]] std::string_view file_extension(OutputFormat format);

// Accepts "text"/"txt", "json", "markdown"/"md", "csv", case-insensitively.
[[nodiscard]] core::Result<OutputFormat, core::EngineError> parse_output_format(
    std::string_view name);

// CSV cannot carry nested fields; every other format accepts every cell.
[[nodiscard]] core::Result<bool, core::EngineError> check_compatibility(
    const cleaning::PolicySpec& spec, OutputFormat format);

}  // namespace chatsan::output
