#include "chatsan/output/output_serializer.h"

#include "chatsan/cleaning/cleaning_strategy_matrix.h"
#include "chatsan/core/text.h"
#include "chatsan/core/time_format.h"
#include "chatsan/core/version.h"

#include <string_view>

namespace chatsan::output {

namespace {

using nlohmann::ordered_json;
using cleaning::Field;

ordered_json optional_string(const std::optional<std::string>& value) {
  return value.has_value() ? ordered_json(*value) : ordered_json(nullptr);
}

ordered_json media_json(const domain::MediaDescriptor& media) {
  ordered_json out = ordered_json::object();
  out["type"] = media.media_type;
  out["mime_type"] = optional_string(media.mime_type);
  out["file_name"] = optional_string(media.file_name);
  out["duration_seconds"] =
      media.duration_seconds ? ordered_json(*media.duration_seconds) : ordered_json(nullptr);
  out["width"] = media.width ? ordered_json(*media.width) : ordered_json(nullptr);
  out["height"] = media.height ? ordered_json(*media.height) : ordered_json(nullptr);
  return out;
}

ordered_json reactions_json(const std::vector<domain::Reaction>& reactions) {
  ordered_json out = ordered_json::array();
  for (const auto& reaction : reactions) {
    ordered_json entry = ordered_json::object();
    entry["emoji"] = reaction.emoji;
    entry["count"] = reaction.count;
    ordered_json actors = ordered_json::array();
    for (const auto& actor : reaction.actors) {
      actors.push_back(actor.value);
    }
    entry["actors"] = std::move(actors);
    out.push_back(std::move(entry));
  }
  return out;
}

ordered_json field_value(const cleaning::MessageUnit& unit, const Field field) {
  switch (field) {
    case Field::kId:
      return unit.id.value;
    case Field::kTimestamp:
      return core::format_iso8601(unit.timestamp);
    case Field::kSender:
      return unit.sender;
    case Field::kSenderId:
      return optional_string(unit.sender_id);
    case Field::kKind:
      return std::string(domain::kind_name(unit.kind));
    case Field::kText:
      return unit.text;
    case Field::kLinks:
      return unit.links;
    case Field::kReplyTo:
      return unit.reply_to ? ordered_json(unit.reply_to->value) : ordered_json(nullptr);
    case Field::kDepth:
      return unit.depth;
    case Field::kEdited:
      return unit.edited;
    case Field::kForwardedFrom:
      return optional_string(unit.forwarded_from);
    case Field::kMediaSummary:
      return unit.media ? ordered_json(cleaning::summarize_media(*unit.media))
                        : ordered_json(nullptr);
    case Field::kMediaDetail:
      return unit.media ? media_json(*unit.media) : ordered_json(nullptr);
    case Field::kReactionSummary: {
      const std::string summary = cleaning::summarize_reactions(unit.reactions);
      return summary.empty() ? ordered_json(nullptr) : ordered_json(summary);
    }
    case Field::kReactionDetail:
      return reactions_json(unit.reactions);
    case Field::kReplies: {
      ordered_json replies = ordered_json::array();
      for (const auto& id : unit.replies) {
        replies.push_back(id.value);
      }
      return replies;
    }
  }
  return nullptr;
}

const ordered_json& member(const ordered_json& object, const char* key) {
  static const ordered_json kNull;
  const auto it = object.find(key);
  return it == object.end() ? kNull : *it;
}

std::string string_member(const ordered_json& object, const char* key) {
  const auto& value = member(object, key);
  return value.is_string() ? value.get<std::string>() : std::string();
}

std::size_t depth_of(const ordered_json& message) {
  const auto& depth = member(message, "depth");
  return depth.is_number_unsigned() || depth.is_number_integer() ? depth.get<std::size_t>() : 0;
}

// "2024-01-01T10:15:00" -> "10:15"
std::string clock_time(const ordered_json& message) {
  const std::string timestamp = string_member(message, "timestamp");
  return timestamp.size() >= 16 ? timestamp.substr(11, 5) : timestamp;
}

std::string body_of(const ordered_json& message) {
  std::string body = string_member(message, "text");
  const std::string kind = string_member(message, "kind");
  if (kind == "tombstone" && body.empty()) {
    return "[deleted]";
  }
  if (kind == "service" && body.empty()) {
    return "[service]";
  }
  return body;
}

std::string reaction_list(const ordered_json& reactions) {
  std::vector<std::string> parts;
  for (const auto& reaction : reactions) {
    parts.push_back(string_member(reaction, "emoji") + "(" +
                    std::to_string(member(reaction, "count").get<std::int64_t>()) + ")");
  }
  return core::join(parts, " ");
}

// Trailing annotations shared by the text and markdown projections.
std::string annotations(const ordered_json& message) {
  std::string out;

  const auto& media = member(message, "media");
  if (media.is_string()) {
    out += " [media: " + media.get<std::string>() + "]";
  } else if (media.is_object()) {
    out += " [media: " + string_member(media, "type") + "]";
  }

  const auto& reactions = member(message, "reactions");
  if (reactions.is_string()) {
    out += " [reactions: " + reactions.get<std::string>() + "]";
  } else if (reactions.is_array() && !reactions.empty()) {
    out += " [reactions: " + reaction_list(reactions) + "]";
  }

  const auto& edited = member(message, "edited");
  if (edited.is_boolean() && edited.get<bool>()) {
    out += " (edited)";
  }

  const auto& forwarded = member(message, "forwarded_from");
  if (forwarded.is_string()) {
    out += " (forwarded from " + forwarded.get<std::string>() + ")";
  }
  return out;
}

// Prefix for the continuation lines of a multi-line text body. A message line
// starts with a clock or a sender after its indent, never with '|'.
std::string continuation_prefix(const std::string& indent) {
  return indent + "  | ";
}

std::string indent_continuations(const std::string& body, const std::string& prefix) {
  std::string out;
  out.reserve(body.size());
  for (const char ch : body) {
    out.push_back(ch);
    if (ch == '\n') {
      out += prefix;
    }
  }
  return out;
}

std::string clock_prefix(const cleaning::CleanedDocument& document,
                         const ordered_json& message) {
  return document.spec.clock_in_projection ? clock_time(message) + " " : std::string();
}

std::string render_text(const cleaning::CleanedDocument& document, const ordered_json& messages) {
  std::string out;
  for (const auto& message : messages) {
    const std::string indent(depth_of(message) * 2, ' ');
    out += indent + clock_prefix(document, message) + string_member(message, "sender") + ": " +
           indent_continuations(body_of(message), continuation_prefix(indent)) +
           annotations(message) + "\n";
  }
  return out;
}

std::string render_markdown(const cleaning::CleanedDocument& document,
                            const ordered_json& messages) {
  const auto& policy = document.spec.policy;
  std::string out = "# " + document.metadata.chat.name + "\n\n";
  out += "_Policy: " + domain::policy_label(policy) + " (" +
         std::string(domain::level_name(policy.level)) + "), " +
         std::to_string(document.metadata.message_count) + " messages_\n";

  for (const auto& message : messages) {
    std::string quote;
    for (std::size_t d = 0; d < depth_of(message); ++d) {
      quote += "> ";
    }
    out += "\n" + quote + clock_prefix(document, message) + "**" +
           string_member(message, "sender") + "**: " + indent_continuations(body_of(message), quote) +
           annotations(message) + "\n";
  }
  return out;
}

std::string csv_escape(const std::string& value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) {
    return value;
  }
  std::string out = "\"";
  for (const char ch : value) {
    if (ch == '"') {
      out += "\"\"";
    } else {
      out.push_back(ch);
    }
  }
  out += "\"";
  return out;
}

std::string csv_cell(const ordered_json& value) {
  if (value.is_null()) {
    return "";
  }
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_boolean()) {
    return value.get<bool>() ? "true" : "false";
  }
  if (value.is_array()) {
    std::vector<std::string> parts;
    for (const auto& item : value) {
      parts.push_back(csv_cell(item));
    }
    return core::join(parts, " | ");
  }
  return value.dump();
}

std::string render_csv(const cleaning::CleanedDocument& document, const ordered_json& messages) {
  const auto keys = document.spec.keys();
  std::string out;

  std::vector<std::string> header;
  for (const auto& key : keys) {
    header.push_back(csv_escape(key));
  }
  out += core::join(header, ",") + "\n";

  for (const auto& message : messages) {
    std::vector<std::string> row;
    row.reserve(keys.size());
    for (const auto& key : keys) {
      row.push_back(csv_escape(csv_cell(member(message, key.c_str()))));
    }
    out += core::join(row, ",") + "\n";
  }
  return out;
}

ordered_json optional_time(const std::optional<std::int64_t>& value) {
  return value ? ordered_json(core::format_iso8601(*value)) : ordered_json(nullptr);
}

}  // namespace

ordered_json OutputSerializer::to_json(const cleaning::CleanedDocument& document) const {
  ordered_json messages = ordered_json::array();
  for (const auto& unit : document.units) {
    ordered_json object = ordered_json::object();
    for (const Field field : document.spec.fields) {
      object[std::string(cleaning::field_key(field))] = field_value(unit, field);
    }
    messages.push_back(std::move(object));
  }
  return messages;
}

RenderResult OutputSerializer::render(const cleaning::CleanedDocument& document,
                                      const OutputFormat format) const {
  // Reject before doing any traversal work.
  auto compatible = check_compatibility(document.spec, format);
  if (!compatible.has_value()) {
    auto error = compatible.error();
    error.chat_name = document.metadata.chat.name;
    return RenderResult::err(std::move(error));
  }

  const ordered_json messages = to_json(document);
  switch (format) {
    case OutputFormat::kJson:
      return RenderResult::ok(messages.dump(2) + "\n");
    case OutputFormat::kText:
      return RenderResult::ok(render_text(document, messages));
    case OutputFormat::kMarkdown:
      return RenderResult::ok(render_markdown(document, messages));
    case OutputFormat::kCsv:
      return RenderResult::ok(render_csv(document, messages));
  }
  return RenderResult::err(core::make_error(core::ErrorCode::kUnsupportedFormatError,
                                            "unknown output format",
                                            document.metadata.chat.name));
}

ordered_json OutputSerializer::metadata_json(const cleaning::CleanedDocument& document) const {
  const auto& meta = document.metadata;
  const auto& spec = document.spec;

  ordered_json out = ordered_json::object();
  out["schema_version"] = core::kOutputSchemaVersion;
  out["generator"] = std::string("chatsan ") + core::kBuildVersion;
  out["generated_at"] = meta.generated_at;

  ordered_json chat = ordered_json::object();
  chat["name"] = meta.chat.name;
  chat["type"] = meta.chat.type;
  chat["id"] = meta.chat.id;
  chat["date_from"] = optional_time(meta.chat.date_from);
  chat["date_to"] = optional_time(meta.chat.date_to);
  out["chat"] = std::move(chat);

  ordered_json policy = ordered_json::object();
  policy["approach"] = std::string(domain::approach_name(spec.policy.approach));
  policy["level"] = spec.policy.level;
  policy["level_name"] = std::string(domain::level_name(spec.policy.level));
  policy["structure"] = std::string(cleaning::structure_name(spec.structure));
  policy["anonymized"] = spec.anonymize_senders;
  policy["fields"] = spec.keys();
  out["policy"] = std::move(policy);

  out["message_count"] = meta.message_count;
  out["participant_count"] = meta.participant_count;

  ordered_json notices = ordered_json::object();
  ordered_json orphans = ordered_json::array();
  for (const auto& notice : meta.orphan_references) {
    orphans.push_back({{"message_id", notice.message_id.value},
                       {"target_id", notice.target_id.value},
                       {"reason", std::string(domain::orphan_reason_name(notice.reason))}});
  }
  notices["orphan_references"] = std::move(orphans);

  ordered_json collisions = ordered_json::array();
  for (const auto& notice : meta.collisions) {
    collisions.push_back(
        {{"base", notice.base_pseudonym}, {"assigned", notice.assigned_pseudonym}});
  }
  notices["collisions"] = std::move(collisions);

  ordered_json skipped = ordered_json::array();
  for (const auto& notice : meta.skipped_records) {
    skipped.push_back({{"record_index", notice.record_index},
                       {"message_id", notice.message_id ? ordered_json(*notice.message_id)
                                                        : ordered_json(nullptr)},
                       {"reason", notice.reason}});
  }
  notices["skipped_records"] = std::move(skipped);
  notices["encoding_fallback"] = optional_string(meta.encoding_fallback);
  out["notices"] = std::move(notices);

  if (meta.salt.has_value()) {
    out["salt"] = *meta.salt;
  }

  if (spec.interaction_summary) {
    ordered_json interactions = ordered_json::array();
    for (const auto& edge : meta.interactions) {
      interactions.push_back({{"from", edge.from},
                              {"to", edge.to},
                              {"replies", edge.replies},
                              {"reactions", edge.reactions}});
    }
    out["interactions"] = std::move(interactions);
  }
  return out;
}

std::string OutputSerializer::render_metadata_json(
    const cleaning::CleanedDocument& document) const {
  return metadata_json(document).dump(2) + "\n";
}

}  // namespace chatsan::output
