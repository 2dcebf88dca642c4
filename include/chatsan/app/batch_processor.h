#pragma once

#include "chatsan/app/sanitize_pipeline.h"
#include "chatsan/core/clock.h"
#include "chatsan/core/salt_source.h"
#include "chatsan/storage/output_store.h"
#include "chatsan/storage/run_log.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chatsan::app {

/// Outcome of sanitizing one export file. The matching RunRecord is in `record`.
struct ExportOutcome {
  std::filesystem::path input;
  std::optional<std::filesystem::path> output;
  std::optional<std::string> error;
  std::string metadata_json;  // empty on failure
  storage::RunRecord record;

  [[nodiscard]] bool ok() const { return !error.has_value(); }
};

/// Read, sanitize and store one export file. Never throws; every failure,
/// engine or I/O, lands in ExportOutcome::error.
[[nodiscard]] ExportOutcome process_export(const std::filesystem::path& input,
                                           const SanitizeRequest& request,
                                           core::ISaltSource& salt_source, core::IClock& clock,
                                           storage::IOutputStore& store);

/// Append a run record. A run_id already in the log gets a "-2", "-3", ...
/// suffix first; record.run_id holds the id that was stored.
[[nodiscard]] core::Result<bool, std::string> record_run(storage::IRunLog& run_log,
                                                         storage::RunRecord& record);

struct BatchOptions {
  SanitizeRequest request;
  std::size_t max_workers{4};
};

struct BatchSummary {
  std::vector<ExportOutcome> outcomes;  // same order as the inputs
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::vector<std::string> log_errors;  // run-log append failures
};

/// Sanitizes many exports with a bounded pool of worker threads.
///
/// A failing export never stops the batch. Salts are drawn up front on the
/// calling thread, one per export unless the request fixes one. Run records are
/// appended to run_log from the calling thread after all workers finish, in
/// input order.
[[nodiscard]] BatchSummary run_batch(const std::vector<std::filesystem::path>& inputs,
                                     const BatchOptions& options, core::ISaltSource& salt_source,
                                     core::IClock& clock, storage::IOutputStore& store,
                                     storage::IRunLog& run_log);

}  // namespace chatsan::app
