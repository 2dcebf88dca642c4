#include "chatsan/domain/message.h"

namespace chatsan::domain {

std::string_view kind_name(const MessageKind kind) {
  switch (kind) {
    case MessageKind::kRegular:
      return "message";
    case MessageKind::kService:
      return "service";
    case MessageKind::kTombstone:
      return "tombstone";
  }
  return "message";
}

std::string sender_label(const Message& message) {
  if (!message.sender_name.empty()) {
    return message.sender_name;
  }
  if (!message.sender_id.value.empty()) {
    return message.sender_id.value;
  }
  return "Unknown";
}

}  // namespace chatsan::domain
