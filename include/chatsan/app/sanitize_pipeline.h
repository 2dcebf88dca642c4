#pragma once

#include "chatsan/cleaning/cleaned_document.h"
#include "chatsan/core/clock.h"
#include "chatsan/core/errors.h"
#include "chatsan/core/result.h"
#include "chatsan/core/salt_source.h"
#include "chatsan/ingest/export_loader.h"
#include "chatsan/output/output_format.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace chatsan::app {

/// SanitizeRequest selects one cell of the cleaning matrix and an output format.
struct SanitizeRequest {
  std::string approach{"privacy"};
  int level{2};
  std::string format{"text"};
  std::optional<core::Salt> salt;  // Explicit salt for reproducible pseudonyms
  bool persist_salt{false};        // Record the salt in document metadata
  std::size_t pseudonym_length{12};
  ingest::LoadOptions load_options;
};

struct SanitizeResponse {
  cleaning::CleanedDocument document;
  output::OutputFormat format{output::OutputFormat::kText};
  std::string rendered;
  std::string metadata_json;
};

using SanitizeResult = core::Result<SanitizeResponse, core::EngineError>;

/// Runs load -> graph -> clean -> render over one export document.
///
/// Policy and format are validated, and their compatibility checked, before
/// the export is parsed. A fresh salt is drawn from salt_source unless the
/// request carries one. The engine itself never logs or writes files.
[[nodiscard]] SanitizeResult run_sanitize_pipeline(std::string_view export_bytes,
                                                   const SanitizeRequest& request,
                                                   core::ISaltSource& salt_source,
                                                   core::IClock& clock);

}  // namespace chatsan::app
