#pragma once

#include "chatsan/core/errors.h"
#include "chatsan/core/result.h"
#include "chatsan/domain/raw_export.h"
#include "chatsan/graph/conversation_graph.h"

namespace chatsan::graph {

using BuildResult = core::Result<ConversationGraph, core::EngineError>;

// ConversationGraphBuilder resolves a RawExport into a ConversationGraph.
//
// - Participants are registered in first-appearance order; the first non-empty
//   name seen for an id is canonical, later names are only recorded.
// - A reply whose target is absent is kept as a root and reported with an
//   OrphanReferenceNotice. The same happens to a link that would close a cycle
//   (including a self-reply).
// - A duplicate message id is a SchemaError.
class ConversationGraphBuilder {
 public:
  [[nodiscard]] BuildResult build(domain::RawExport raw) const;
};

}  // namespace chatsan::graph
