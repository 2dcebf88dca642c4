#pragma once

#include "chatsan/core/errors.h"
#include "chatsan/core/result.h"
#include "chatsan/domain/cleaning_policy.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chatsan::cleaning {

// Field is an output column. Declaration order IS the canonical key order used
// by every serializer. Media and reactions each have a flat and a nested
// rendition that share one key.
enum class Field : std::uint8_t {
  kId,
  kTimestamp,
  kSender,
  kSenderId,
  kKind,
  kText,
  kLinks,
  kReplyTo,
  kDepth,
  kEdited,
  kForwardedFrom,
  kMediaSummary,     // "media": short description string
  kMediaDetail,      // "media": object
  kReactionSummary,  // "reactions": top-3 summary string
  kReactionDetail,   // "reactions": array of objects with actor ids
  kReplies,          // ids of direct replies
};

enum class StructureMode {
  kChronological,
  kThreaded,
};

[[nodiscard]] std::string_view field_key(Field field);

// Nested fields cannot be represented in a flat tabular projection.
[[nodiscard]] bool is_nested(Field field);

[[nodiscard]] std::string_view structure_name(StructureMode mode);

// PolicySpec is one cell of the approach x level matrix.
// Within an approach, each level's field set contains the previous level's keys.
struct PolicySpec {
  domain::CleaningPolicy policy;
  std::vector<Field> fields;  // canonical order
  StructureMode structure{StructureMode::kChronological};
  bool anonymize_senders{false};
  bool interaction_summary{false};
  // Text and markdown lines lead with HH:MM. Off where timestamps are not
  // part of the reading view; JSON and CSV still carry the key.
  bool clock_in_projection{true};

  [[nodiscard]] bool has(Field field) const;
  [[nodiscard]] bool has_key(std::string_view key) const;
  [[nodiscard]] std::vector<std::string> keys() const;
  [[nodiscard]] bool is_flat() const;
};

// All nine cells, privacy 1..3, size 1..3, context 1..3.
[[nodiscard]] const std::vector<PolicySpec>& policy_table();

// lookup_policy re-validates the policy and returns its cell.
[[nodiscard]] core::Result<PolicySpec, core::EngineError> lookup_policy(
    const domain::CleaningPolicy& policy);

}  // namespace chatsan::cleaning
