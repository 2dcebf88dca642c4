#pragma once

#include "chatsan/anonymize/anonymization_service.h"
#include "chatsan/cleaning/cleaned_document.h"
#include "chatsan/core/clock.h"
#include "chatsan/core/errors.h"
#include "chatsan/core/result.h"
#include "chatsan/domain/cleaning_policy.h"
#include "chatsan/graph/conversation_graph.h"

namespace chatsan::cleaning {

using CleanResult = core::Result<CleanedDocument, core::EngineError>;

// CleaningStrategyMatrix applies one (approach, level) cell to a graph.
//
// Every message of the graph becomes exactly one unit: stubs, service events
// and tombstones are never dropped. Ordering is chronological or a depth-first
// walk of the reply forest, per the cell. When the cell anonymizes, every
// registry participant is mapped up front, in registry order, so pseudonym
// suffixes do not depend on message order.
class CleaningStrategyMatrix {
 public:
  [[nodiscard]] CleanResult apply(const graph::ConversationGraph& graph,
                                  const domain::CleaningPolicy& policy,
                                  anonymize::AnonymizationService& anonymizer,
                                  core::IClock& clock) const;
};

// Top three reactions by count, "👍(3) ❤(1)".
[[nodiscard]] std::string summarize_reactions(const std::vector<domain::Reaction>& reactions);

// Short human description, "Video (12s)", "Document: report.pdf".
[[nodiscard]] std::string summarize_media(const domain::MediaDescriptor& media);

}  // namespace chatsan::cleaning
