#include "chatsan/app/batch_processor.h"

#include "chatsan/app/export_files.h"
#include "chatsan/core/sha256.h"
#include "chatsan/core/time_format.h"
#include "chatsan/domain/cleaning_policy.h"

#include <algorithm>
#include <atomic>
#include <thread>

namespace chatsan::app {

namespace {

std::string make_run_id(const std::int64_t now, const core::Salt& salt,
                        const storage::RunRecord& record) {
  const std::string material =
      salt.value + "|" + record.input_path + "|" + record.policy + "|" + record.format;
  return "run-" + core::format_compact(now) + "-" + core::sha256_hex(material).substr(0, 8);
}

std::vector<std::string> collect_warnings(const cleaning::DocumentMetadata& meta) {
  std::vector<std::string> warnings;
  if (!meta.orphan_references.empty()) {
    warnings.push_back(std::to_string(meta.orphan_references.size()) +
                       " reply reference(s) could not be resolved");
  }
  if (!meta.collisions.empty()) {
    warnings.push_back(std::to_string(meta.collisions.size()) + " pseudonym collision(s)");
  }
  if (!meta.skipped_records.empty()) {
    warnings.push_back(std::to_string(meta.skipped_records.size()) + " record(s) skipped");
  }
  if (meta.encoding_fallback.has_value()) {
    warnings.push_back("decoded as " + *meta.encoding_fallback);
  }
  return warnings;
}

}  // namespace

ExportOutcome process_export(const std::filesystem::path& input, const SanitizeRequest& request,
                             core::ISaltSource& salt_source, core::IClock& clock,
                             storage::IOutputStore& store) {
  const std::int64_t now = clock.now_unix_seconds();
  SanitizeRequest resolved = request;
  if (!resolved.salt.has_value()) {
    resolved.salt = salt_source.generate();
  }

  ExportOutcome outcome;
  outcome.input = input;
  auto& record = outcome.record;
  record.input_path = input.string();
  record.policy = request.approach + "/" + std::to_string(request.level);
  record.format = request.format;
  record.run_id = make_run_id(now, *resolved.salt, record);
  record.created_at = core::format_iso8601(now);

  auto fail = [&](std::string message) {
    record.status = "failed";
    record.error = message;
    outcome.error = std::move(message);
    return outcome;
  };

  auto bytes = read_export_file(input);
  if (!bytes.has_value()) {
    return fail(bytes.error());
  }

  auto sanitized = run_sanitize_pipeline(bytes.value(), resolved, salt_source, clock);
  if (!sanitized.has_value()) {
    record.chat_name = sanitized.error().chat_name;
    return fail(core::describe(sanitized.error()));
  }

  const auto& response = sanitized.value();
  const auto& meta = response.document.metadata;
  record.chat_name = meta.chat.name;
  record.policy = domain::policy_label(response.document.spec.policy);
  record.format = std::string(output::format_name(response.format));
  record.message_count = meta.message_count;
  record.orphan_count = meta.orphan_references.size();
  record.collision_count = meta.collisions.size();
  record.skipped_count = meta.skipped_records.size();
  record.warnings = collect_warnings(meta);

  const storage::OutputTarget target{meta.chat.name, response.document.spec.policy,
                                     response.format, now};
  auto written = store.write(target, response.rendered);
  if (!written.has_value()) {
    return fail(written.error());
  }

  outcome.output = written.value();
  outcome.metadata_json = response.metadata_json;
  record.output_path = written.value().string();
  record.status = "ok";
  return outcome;
}

core::Result<bool, std::string> record_run(storage::IRunLog& run_log,
                                           storage::RunRecord& record) {
  const std::string base = record.run_id;
  for (int suffix = 2; run_log.find(record.run_id).has_value(); ++suffix) {
    record.run_id = base + "-" + std::to_string(suffix);
  }
  return run_log.append(record);
}

BatchSummary run_batch(const std::vector<std::filesystem::path>& inputs,
                       const BatchOptions& options, core::ISaltSource& salt_source,
                       core::IClock& clock, storage::IOutputStore& store,
                       storage::IRunLog& run_log) {
  BatchSummary summary;
  summary.outcomes.resize(inputs.size());

  // RandomSaltSource is single-threaded; hand each worker a fixed salt.
  std::vector<SanitizeRequest> requests(inputs.size(), options.request);
  for (auto& request : requests) {
    if (!request.salt.has_value()) {
      request.salt = salt_source.generate();
    }
  }

  const std::size_t worker_count =
      std::max<std::size_t>(1, std::min(options.max_workers, inputs.size()));
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (std::size_t i = next.fetch_add(1); i < inputs.size(); i = next.fetch_add(1)) {
      core::FixedSaltSource fixed(*requests[i].salt);
      summary.outcomes[i] = process_export(inputs[i], requests[i], fixed, clock, store);
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(worker_count);
  for (std::size_t w = 0; w < worker_count; ++w) {
    pool.emplace_back(worker);
  }
  for (auto& thread : pool) {
    thread.join();
  }

  for (auto& outcome : summary.outcomes) {
    if (outcome.ok()) {
      ++summary.succeeded;
    } else {
      ++summary.failed;
    }
    auto appended = record_run(run_log, outcome.record);
    if (!appended.has_value()) {
      summary.log_errors.push_back(appended.error());
    }
  }
  return summary;
}

}  // namespace chatsan::app
