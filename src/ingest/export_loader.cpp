#include "chatsan/ingest/export_loader.h"

#include "chatsan/core/time_format.h"
#include "chatsan/ingest/encoding.h"
#include "chatsan/ingest/text_normalizer.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <set>

namespace chatsan::ingest {

namespace {

using nlohmann::json;

const json kNull = json();

const json& field(const json& object, const char* key) {
  const auto it = object.find(key);
  return it == object.end() ? kNull : *it;
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

/// Integer field, accepting JSON integers and digit strings ("1692665293").
std::optional<std::int64_t> integer_field(const json& object, const char* key) {
  const json& value = field(object, key);
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_string()) {
    return parse_integer(value.get<std::string>());
  }
  return std::nullopt;
}

std::optional<std::string> string_field(const json& object, const char* key) {
  const json& value = field(object, key);
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return std::nullopt;
}

/// Identifier-ish values: strings are kept, integers are rendered in decimal.
std::string id_string(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  return {};
}

/// date_unixtime takes precedence over the ISO date field.
std::optional<std::int64_t> record_timestamp(const json& record) {
  if (auto unix_time = integer_field(record, "date_unixtime")) {
    return unix_time;
  }
  const json& date = field(record, "date");
  if (date.is_number_integer()) {
    return date.get<std::int64_t>();
  }
  if (date.is_string()) {
    return core::parse_iso8601(date.get<std::string>());
  }
  return std::nullopt;
}

domain::MessageKind record_kind(const json& record) {
  const auto type = string_field(record, "type").value_or("message");
  const json& deleted = field(record, "deleted");
  if (type == "deleted" || (deleted.is_boolean() && deleted.get<bool>())) {
    return domain::MessageKind::kTombstone;
  }
  if (type == "service") {
    return domain::MessageKind::kService;
  }
  return domain::MessageKind::kRegular;
}

std::vector<domain::Reaction> parse_reactions(const json& reactions) {
  std::vector<domain::Reaction> out;
  if (!reactions.is_array()) {
    return out;
  }
  for (const auto& entry : reactions) {
    if (!entry.is_object()) {
      continue;
    }
    domain::Reaction reaction;
    if (auto emoji = string_field(entry, "emoji")) {
      reaction.emoji = *emoji;
    } else {
      // Custom emoji carry a document id instead of a glyph.
      reaction.emoji = string_field(entry, "type").value_or("emoji");
    }
    reaction.count = integer_field(entry, "count").value_or(0);
    const json& recent = field(entry, "recent");
    if (recent.is_array()) {
      for (const auto& actor : recent) {
        if (!actor.is_object()) {
          continue;
        }
        auto actor_id = id_string(field(actor, "from_id"));
        if (!actor_id.empty()) {
          reaction.actors.push_back(core::ParticipantId{std::move(actor_id)});
        }
      }
    }
    out.push_back(std::move(reaction));
  }
  return out;
}

std::optional<domain::MediaDescriptor> parse_media(const json& record) {
  domain::MediaDescriptor media;
  if (auto media_type = string_field(record, "media_type")) {
    media.media_type = *media_type;
  } else if (record.contains("photo")) {
    media.media_type = "photo";
  } else if (record.contains("file")) {
    media.media_type = "document";
  } else {
    return std::nullopt;
  }
  media.mime_type = string_field(record, "mime_type");
  media.file_name = string_field(record, "file_name");
  media.duration_seconds = integer_field(record, "duration_seconds");
  media.width = integer_field(record, "width");
  media.height = integer_field(record, "height");
  media.title = string_field(record, "title");
  media.performer = string_field(record, "performer");
  return media;
}

domain::RawMessageRecord build_record(const json& record, const std::int64_t id,
                                      const std::int64_t timestamp) {
  domain::RawMessageRecord out;
  out.id = core::MessageId{id};
  out.kind = record_kind(record);
  out.timestamp = timestamp;

  // Service events name their actor instead of a sender.
  const bool is_service = out.kind == domain::MessageKind::kService;
  out.sender_id = core::ParticipantId{id_string(field(record, is_service ? "actor_id" : "from_id"))};
  out.sender_name = string_field(record, is_service ? "actor" : "from").value_or("");

  auto text = normalize_text(field(record, "text"), field(record, "text_entities"));
  out.text = std::move(text.body);
  out.links = std::move(text.links);

  if (auto reply = integer_field(record, "reply_to_message_id")) {
    out.reply_to = core::MessageId{*reply};
  }
  out.reactions = parse_reactions(field(record, "reactions"));

  if (auto edited_unix = integer_field(record, "edited_unixtime")) {
    out.edited_at = edited_unix;
  } else if (auto edited = string_field(record, "edited")) {
    out.edited_at = core::parse_iso8601(*edited);
  }
  const json& edited_flag = field(record, "edited");
  out.edited = out.edited_at.has_value() || (edited_flag.is_boolean() && edited_flag.get<bool>()) ||
               edited_flag.is_string();

  out.forwarded_from = string_field(record, "forwarded_from");
  out.media = parse_media(record);
  if (is_service) {
    out.service_action = string_field(record, "action");
  }
  return out;
}

LoadResult schema_error(std::string message, std::string chat_name = {},
                        std::optional<std::int64_t> message_id = std::nullopt) {
  return LoadResult::err(core::make_error(core::ErrorCode::kSchemaError, std::move(message),
                                          std::move(chat_name), message_id));
}

}  // namespace

LoadResult ExportLoader::load(const std::string_view bytes) const {
  auto decoded = decode_to_utf8(bytes, options_.allow_utf16_fallback);
  if (!decoded.has_value()) {
    return LoadResult::err(core::make_error(core::ErrorCode::kEncodingError, decoded.error()));
  }

  const json document = json::parse(decoded.value().utf8, nullptr, /*allow_exceptions=*/false);
  if (document.is_discarded()) {
    return schema_error("input is not a JSON document");
  }
  if (!document.is_object()) {
    return schema_error("top-level value must be an object");
  }

  for (const char* key : {"name", "type", "id", "messages"}) {
    if (!document.contains(key)) {
      return schema_error(std::string("missing required key '") + key + "'");
    }
  }

  domain::RawExport out;
  const json& name = document["name"];
  out.chat.name = name.is_string() ? name.get<std::string>() : id_string(name);
  out.chat.type = id_string(document["type"]);
  out.chat.id = id_string(document["id"]);

  const json& messages = document["messages"];
  if (!messages.is_array()) {
    return schema_error("'messages' must be an array", out.chat.name);
  }

  if (decoded.value().source != SourceEncoding::kUtf8) {
    out.encoding_fallback = std::string(encoding_name(decoded.value().source));
  }

  std::set<std::int64_t> seen_ids;
  out.records.reserve(messages.size());
  for (std::size_t index = 0; index < messages.size(); ++index) {
    const json& record = messages[index];
    if (!record.is_object()) {
      out.skipped_records.push_back({index, std::nullopt, "record is not an object"});
      continue;
    }

    const json& id_value = field(record, "id");
    if (!id_value.is_number_integer()) {
      out.skipped_records.push_back({index, std::nullopt, "record has no integer id"});
      continue;
    }
    const auto id = id_value.get<std::int64_t>();

    const auto timestamp = record_timestamp(record);
    if (!timestamp.has_value()) {
      out.skipped_records.push_back({index, id, "record has no usable timestamp"});
      continue;
    }

    if (!seen_ids.insert(id).second) {
      return schema_error("duplicate message id " + std::to_string(id), out.chat.name, id);
    }

    out.records.push_back(build_record(record, id, *timestamp));
    out.chat.date_from = std::min(out.chat.date_from.value_or(*timestamp), *timestamp);
    out.chat.date_to = std::max(out.chat.date_to.value_or(*timestamp), *timestamp);
  }

  return LoadResult::ok(std::move(out));
}

}  // namespace chatsan::ingest
