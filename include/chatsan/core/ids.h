#pragma once

#include <cstdint>
#include <string>

namespace chatsan::core {

// Strong ID types: a message id is numeric in exports, a participant id is an
// opaque string such as "user123" or "channel456".

struct MessageId {
  std::int64_t value{0};
  auto operator<=>(const MessageId&) const = default;
};

struct ParticipantId {
  std::string value;
  auto operator<=>(const ParticipantId&) const = default;
};

}  // namespace chatsan::core
