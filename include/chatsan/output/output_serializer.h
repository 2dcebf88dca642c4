#pragma once

#include "chatsan/cleaning/cleaned_document.h"
#include "chatsan/core/errors.h"
#include "chatsan/core/result.h"
#include "chatsan/output/output_format.h"

#include <nlohmann/json.hpp>

#include <string>

namespace chatsan::output {

using RenderResult = core::Result<std::string, core::EngineError>;

/// OutputSerializer renders a cleaned document.
///
/// The JSON tree is canonical: an array of message objects whose keys follow
/// the policy's field order, with null for absent values. Text, Markdown and CSV
/// are projections of that tree, so every format shows the same content.
/// Rendering is deterministic: identical documents give identical bytes.
/// Run metadata is rendered separately by render_metadata_json().
class OutputSerializer {
 public:
  [[nodiscard]] RenderResult render(const cleaning::CleanedDocument& document,
                                    OutputFormat format) const;

  [[nodiscard]] nlohmann::ordered_json to_json(const cleaning::CleanedDocument& document) const;

  [[nodiscard]] nlohmann::ordered_json metadata_json(
      const cleaning::CleanedDocument& document) const;
  [[nodiscard]] std::string render_metadata_json(const cleaning::CleanedDocument& document) const;
};

}  // namespace chatsan::output
