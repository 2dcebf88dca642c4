#pragma once

#include "chatsan/core/ids.h"
#include "chatsan/core/salt_source.h"
#include "chatsan/domain/notices.h"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace chatsan::anonymize {

// AnonymizationService maps participant ids to stable pseudonyms for one run.
//
// pseudonym = "User_" + first N hex characters of SHA-256(salt || id)
//
// The mapping is memoized, so an id always gets the same pseudonym within a
// run, and two distinct ids never share one: on a digest-prefix collision the
// later id receives a "_2", "_3", ... suffix and a CollisionNotice is recorded.
// An empty id maps to "Anonymous".
class AnonymizationService {
 public:
  static constexpr std::size_t kDefaultDigestLength = 12;
  static constexpr const char* kPrefix = "User_";
  static constexpr const char* kAnonymous = "Anonymous";

  // digest_length is clamped to 1..64.
  explicit AnonymizationService(core::Salt salt, std::size_t digest_length = kDefaultDigestLength);

  [[nodiscard]] std::string pseudonym(const core::ParticipantId& id);

  [[nodiscard]] const core::Salt& salt() const { return salt_; }
  [[nodiscard]] std::size_t digest_length() const { return digest_length_; }
  [[nodiscard]] std::size_t mapped_count() const { return by_id_.size(); }
  [[nodiscard]] const std::vector<domain::CollisionNotice>& collisions() const {
    return collisions_;
  }

 private:
  [[nodiscard]] std::string base_pseudonym(const std::string& id) const;

  core::Salt salt_;
  std::size_t digest_length_;
  std::map<std::string, std::string> by_id_;
  std::set<std::string> issued_;
  std::vector<domain::CollisionNotice> collisions_;
};

}  // namespace chatsan::anonymize
