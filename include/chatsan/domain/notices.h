#pragma once

#include "chatsan/core/ids.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace chatsan::domain {

// Non-fatal diagnostics. They travel with the cleaned document's metadata so a
// caller can decide how loud to be about them.

enum class OrphanReason {
  kMissingTarget,  // reply_to names an id not present in the export
  kCycle,          // following the link would close a reply cycle
};

[[nodiscard]] std::string_view orphan_reason_name(OrphanReason reason);

struct OrphanReferenceNotice {
  core::MessageId message_id;
  core::MessageId target_id;
  OrphanReason reason{OrphanReason::kMissingTarget};
};

// Records pseudonyms only; a collision notice never names the real identity.
struct CollisionNotice {
  std::string base_pseudonym;
  std::string assigned_pseudonym;
};

struct SkippedRecordNotice {
  std::size_t record_index{0};
  std::optional<std::int64_t> message_id;
  std::string reason;
};

}  // namespace chatsan::domain
