#include "chatsan/anonymize/anonymization_service.h"

#include "chatsan/core/sha256.h"

#include <algorithm>

namespace chatsan::anonymize {

AnonymizationService::AnonymizationService(core::Salt salt, const std::size_t digest_length)
    : salt_(std::move(salt)), digest_length_(std::clamp<std::size_t>(digest_length, 1, 64)) {}

std::string AnonymizationService::base_pseudonym(const std::string& id) const {
  core::Sha256 hasher;
  hasher.update(salt_.value);
  hasher.update(id);
  return kPrefix + core::to_hex(hasher.finish()).substr(0, digest_length_);
}

std::string AnonymizationService::pseudonym(const core::ParticipantId& id) {
  if (id.value.empty()) {
    return kAnonymous;
  }
  const auto it = by_id_.find(id.value);
  if (it != by_id_.end()) {
    return it->second;
  }

  const std::string base = base_pseudonym(id.value);
  std::string assigned = base;
  if (issued_.count(assigned) != 0) {
    // Bases contain only hex after the prefix, so suffixed names cannot clash with them.
    std::size_t suffix = 2;
    do {
      assigned = base + "_" + std::to_string(suffix++);
    } while (issued_.count(assigned) != 0);
    collisions_.push_back(domain::CollisionNotice{base, assigned});
  }

  issued_.insert(assigned);
  by_id_.emplace(id.value, assigned);
  return assigned;
}

}  // namespace chatsan::anonymize
