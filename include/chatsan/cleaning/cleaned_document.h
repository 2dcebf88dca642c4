#pragma once

#include "chatsan/cleaning/policy_table.h"
#include "chatsan/core/ids.h"
#include "chatsan/domain/message.h"
#include "chatsan/domain/notices.h"
#include "chatsan/domain/raw_export.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatsan::cleaning {

// MessageUnit is one cleaned message. It carries every projectable value; the
// document's PolicySpec decides which of them a serializer emits.
struct MessageUnit {
  core::MessageId id;
  std::int64_t timestamp{0};
  std::string sender;  // pseudonym or display label
  std::optional<std::string> sender_id;
  domain::MessageKind kind{domain::MessageKind::kRegular};
  std::string text;
  std::vector<std::string> links;
  std::optional<core::MessageId> reply_to;
  std::size_t depth{0};
  bool edited{false};
  std::optional<std::string> forwarded_from;
  std::optional<domain::MediaDescriptor> media;
  std::vector<domain::Reaction> reactions;
  std::vector<core::MessageId> replies;
};

// InteractionEdge counts who answers or reacts to whom, keyed by participant id.
struct InteractionEdge {
  std::string from;
  std::string to;
  std::size_t replies{0};
  std::size_t reactions{0};
};

struct DocumentMetadata {
  domain::ChatMetadata chat;
  std::string generated_at;
  std::size_t message_count{0};
  std::size_t participant_count{0};
  std::vector<domain::OrphanReferenceNotice> orphan_references;
  std::vector<domain::CollisionNotice> collisions;
  std::vector<domain::SkippedRecordNotice> skipped_records;
  std::optional<std::string> encoding_fallback;
  std::optional<std::string> salt;  // only when the caller opted in to persisting it
  std::vector<InteractionEdge> interactions;
};

// CleanedDocument is the output of the cleaning matrix: units in final order,
// the cell that produced them and run metadata.
struct CleanedDocument {
  PolicySpec spec;
  DocumentMetadata metadata;
  std::vector<MessageUnit> units;
};

}  // namespace chatsan::cleaning
