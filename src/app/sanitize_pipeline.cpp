#include "chatsan/app/sanitize_pipeline.h"

#include "chatsan/anonymize/anonymization_service.h"
#include "chatsan/cleaning/cleaning_strategy_matrix.h"
#include "chatsan/cleaning/policy_table.h"
#include "chatsan/graph/conversation_graph_builder.h"
#include "chatsan/output/output_serializer.h"

namespace chatsan::app {

SanitizeResult run_sanitize_pipeline(const std::string_view export_bytes,
                                     const SanitizeRequest& request,
                                     core::ISaltSource& salt_source, core::IClock& clock) {
  auto policy = domain::make_policy(request.approach, request.level);
  if (!policy.has_value()) {
    return SanitizeResult::err(policy.error());
  }
  auto format = output::parse_output_format(request.format);
  if (!format.has_value()) {
    return SanitizeResult::err(format.error());
  }
  auto spec = cleaning::lookup_policy(policy.value());
  if (!spec.has_value()) {
    return SanitizeResult::err(spec.error());
  }
  auto compatible = output::check_compatibility(spec.value(), format.value());
  if (!compatible.has_value()) {
    return SanitizeResult::err(compatible.error());
  }

  const ingest::ExportLoader loader(request.load_options);
  auto raw = loader.load(export_bytes);
  if (!raw.has_value()) {
    return SanitizeResult::err(raw.error());
  }

  const graph::ConversationGraphBuilder builder;
  auto graph = builder.build(std::move(raw).value());
  if (!graph.has_value()) {
    return SanitizeResult::err(graph.error());
  }

  const core::Salt salt = request.salt.has_value() ? *request.salt : salt_source.generate();
  anonymize::AnonymizationService anonymizer(salt, request.pseudonym_length);

  const cleaning::CleaningStrategyMatrix matrix;
  auto cleaned = matrix.apply(graph.value(), policy.value(), anonymizer, clock);
  if (!cleaned.has_value()) {
    return SanitizeResult::err(cleaned.error());
  }

  SanitizeResponse response;
  response.document = std::move(cleaned).value();
  response.format = format.value();
  if (request.persist_salt && response.document.spec.anonymize_senders) {
    response.document.metadata.salt = salt.value;
  }

  const output::OutputSerializer serializer;
  auto rendered = serializer.render(response.document, response.format);
  if (!rendered.has_value()) {
    return SanitizeResult::err(rendered.error());
  }
  response.rendered = std::move(rendered).value();
  response.metadata_json = serializer.render_metadata_json(response.document);
  return SanitizeResult::ok(std::move(response));
}

}  // namespace chatsan::app
