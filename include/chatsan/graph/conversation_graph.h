#pragma once

#include "chatsan/core/ids.h"
#include "chatsan/domain/message.h"
#include "chatsan/domain/notices.h"
#include "chatsan/domain/participant.h"
#include "chatsan/domain/raw_export.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chatsan::graph {

// ThreadForest is the reply structure: every message without a resolved parent
// is a root. Roots follow the chronological view; each child list is ordered by
// timestamp with ingestion order breaking ties.
struct ThreadForest {
  std::vector<core::MessageId> roots;
  std::map<core::MessageId, std::vector<core::MessageId>> children;

  [[nodiscard]] const std::vector<core::MessageId>& children_of(core::MessageId id) const;
};

struct ThreadVisit {
  const domain::Message* message{nullptr};
  std::size_t depth{0};
};

// ConversationGraph is the immutable, read-only structure produced by
// ConversationGraphBuilder. All reply links in it are resolved and acyclic.
class ConversationGraph {
 public:
  [[nodiscard]] const domain::ChatMetadata& chat() const { return chat_; }
  [[nodiscard]] std::size_t size() const { return messages_.size(); }

  // Messages in ingestion order.
  [[nodiscard]] const std::vector<domain::Message>& messages() const { return messages_; }

  // Participant registry in first-appearance order.
  [[nodiscard]] const std::vector<domain::Participant>& participants() const {
    return participants_;
  }
  [[nodiscard]] const domain::Participant* find_participant(const core::ParticipantId& id) const;

  [[nodiscard]] const domain::Message* find(core::MessageId id) const;

  [[nodiscard]] const std::vector<domain::OrphanReferenceNotice>& orphan_references() const {
    return orphan_references_;
  }
  [[nodiscard]] const std::vector<domain::SkippedRecordNotice>& skipped_records() const {
    return skipped_records_;
  }
  [[nodiscard]] const std::optional<std::string>& encoding_fallback() const {
    return encoding_fallback_;
  }

  // Messages sorted by timestamp; equal timestamps keep ingestion order.
  [[nodiscard]] std::vector<const domain::Message*> chronological() const;

  [[nodiscard]] ThreadForest thread_forest() const;

  // Pre-order depth-first walk of the forest. Iterative, so reply chains of any
  // depth are safe.
  [[nodiscard]] std::vector<ThreadVisit> depth_first(const ThreadForest& forest) const;

 private:
  friend class ConversationGraphBuilder;

  domain::ChatMetadata chat_;
  std::vector<domain::Message> messages_;
  std::map<core::MessageId, std::size_t> index_;
  std::vector<domain::Participant> participants_;
  std::map<core::ParticipantId, std::size_t> participant_index_;
  std::vector<domain::OrphanReferenceNotice> orphan_references_;
  std::vector<domain::SkippedRecordNotice> skipped_records_;
  std::optional<std::string> encoding_fallback_;
};

}  // namespace chatsan::graph
