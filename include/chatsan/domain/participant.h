#pragma once

#include "chatsan/core/ids.h"

#include <cstdint>
#include <string>
#include <vector>

namespace chatsan::domain {

// Participant is an entry of the participant registry.
// display_name is the first non-empty name observed for the id; renames are
// recorded in observed_names in first-seen order and never change the canonical name.
struct Participant {
  core::ParticipantId id;
  std::string display_name;
  std::vector<std::string> observed_names;
  std::int64_t first_seen{0};
  std::int64_t last_seen{0};
  std::size_t message_count{0};
};

}  // namespace chatsan::domain
