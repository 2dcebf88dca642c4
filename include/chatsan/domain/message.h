#pragma once

#include "chatsan/core/ids.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatsan::domain {

// MessageKind distinguishes ordinary messages from service events (joins,
// pins, title changes) and tombstones left behind by deleted messages.
// Tombstones are retained so reply chains that point at them stay intact.
enum class MessageKind {
  kRegular,
  kService,
  kTombstone,
};

[[nodiscard]] std::string_view kind_name(MessageKind kind);

struct Reaction {
  std::string emoji;
  std::int64_t count{0};
  std::vector<core::ParticipantId> actors;  // recent actors, may be shorter than count
};

struct MediaDescriptor {
  std::string media_type;  // "photo", "video_file", "voice_message", "sticker", ...
  std::optional<std::string> mime_type;
  std::optional<std::string> file_name;
  std::optional<std::int64_t> duration_seconds;
  std::optional<std::int64_t> width;
  std::optional<std::int64_t> height;
  std::optional<std::string> title;      // audio files
  std::optional<std::string> performer;  // audio files
};

// RawMessageRecord is one validated record of an export, before graph resolution.
// reply_to is the id the record claims to answer; it may not exist.
struct RawMessageRecord {
  core::MessageId id;
  MessageKind kind{MessageKind::kRegular};
  std::int64_t timestamp{0};  // seconds since epoch, UTC
  core::ParticipantId sender_id;
  std::string sender_name;
  std::string text;
  std::vector<std::string> links;
  std::optional<core::MessageId> reply_to;
  std::vector<Reaction> reactions;
  bool edited{false};
  std::optional<std::int64_t> edited_at;
  std::optional<std::string> forwarded_from;
  std::optional<MediaDescriptor> media;
  std::optional<std::string> service_action;
};

// Message is a node of the conversation graph.
// reply_to holds only resolved links: the parent exists and the link creates no cycle.
struct Message {
  core::MessageId id;
  std::size_t ingest_index{0};
  MessageKind kind{MessageKind::kRegular};
  std::int64_t timestamp{0};
  core::ParticipantId sender_id;
  std::string sender_name;
  std::string text;
  std::vector<std::string> links;
  std::optional<core::MessageId> reply_to;
  std::vector<Reaction> reactions;
  bool edited{false};
  std::optional<std::int64_t> edited_at;
  std::optional<std::string> forwarded_from;
  std::optional<MediaDescriptor> media;
  std::optional<std::string> service_action;
};

// sender_label is the display name used when senders are not pseudonymized:
// the sender name, else the participant id, else "Unknown".
[[nodiscard]] std::string sender_label(const Message& message);

}  // namespace chatsan::domain
