#include "chatsan/cleaning/cleaning_strategy_matrix.h"

#include "chatsan/core/text.h"

#include <algorithm>
#include <map>
#include <utility>

namespace chatsan::cleaning {

namespace {

constexpr std::size_t kTopReactions = 3;
constexpr std::size_t kMaxMediaNameLength = 20;

// Display label under the participant's canonical (first-seen) name.
std::string display_sender(const graph::ConversationGraph& graph, const domain::Message& message) {
  const domain::Participant* participant = graph.find_participant(message.sender_id);
  if (participant != nullptr && !participant->display_name.empty()) {
    return participant->display_name;
  }
  return domain::sender_label(message);
}

MessageUnit make_unit(const graph::ConversationGraph& graph, const domain::Message& message,
                      const std::size_t depth, const PolicySpec& spec,
                      const graph::ThreadForest& forest,
                      anonymize::AnonymizationService& anonymizer) {
  MessageUnit unit;
  unit.id = message.id;
  unit.timestamp = message.timestamp;
  unit.sender = spec.anonymize_senders ? anonymizer.pseudonym(message.sender_id)
                                       : display_sender(graph, message);
  if (!message.sender_id.value.empty()) {
    unit.sender_id = message.sender_id.value;
  }
  unit.kind = message.kind;
  unit.text = message.text;
  unit.links = message.links;
  unit.reply_to = message.reply_to;
  unit.depth = depth;
  unit.edited = message.edited;
  unit.forwarded_from = message.forwarded_from;
  unit.media = message.media;
  unit.reactions = message.reactions;
  unit.replies = forest.children_of(message.id);
  return unit;
}

std::vector<InteractionEdge> summarize_interactions(const graph::ConversationGraph& graph) {
  std::map<std::pair<std::string, std::string>, InteractionEdge> edges;
  auto edge = [&edges](const std::string& from, const std::string& to) -> InteractionEdge& {
    auto [it, inserted] = edges.try_emplace({from, to});
    if (inserted) {
      it->second.from = from;
      it->second.to = to;
    }
    return it->second;
  };

  for (const auto& message : graph.messages()) {
    const std::string& author = message.sender_id.value;
    if (author.empty()) {
      continue;
    }
    if (message.reply_to.has_value()) {
      const domain::Message* parent = graph.find(*message.reply_to);
      if (parent != nullptr && !parent->sender_id.value.empty()) {
        ++edge(author, parent->sender_id.value).replies;
      }
    }
    for (const auto& reaction : message.reactions) {
      for (const auto& actor : reaction.actors) {
        ++edge(actor.value, author).reactions;
      }
    }
  }

  std::vector<InteractionEdge> out;
  out.reserve(edges.size());
  for (auto& [key, value] : edges) {
    out.push_back(std::move(value));
  }
  return out;
}

}  // namespace

std::string summarize_reactions(const std::vector<domain::Reaction>& reactions) {
  std::vector<const domain::Reaction*> ranked;
  for (const auto& reaction : reactions) {
    if (!reaction.emoji.empty() && reaction.count > 0) {
      ranked.push_back(&reaction);
    }
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const domain::Reaction* a, const domain::Reaction* b) {
                     return a->count > b->count;
                   });
  if (ranked.size() > kTopReactions) {
    ranked.resize(kTopReactions);
  }

  std::vector<std::string> parts;
  parts.reserve(ranked.size());
  for (const auto* reaction : ranked) {
    parts.push_back(reaction->emoji + "(" + std::to_string(reaction->count) + ")");
  }
  return core::join(parts, " ");
}

std::string summarize_media(const domain::MediaDescriptor& media) {
  auto with_duration = [&media](const std::string& label) {
    if (media.duration_seconds.has_value() && *media.duration_seconds > 0) {
      return label + " (" + std::to_string(*media.duration_seconds) + "s)";
    }
    return label;
  };
  auto short_name = [](const std::string& name) {
    if (core::utf8_length(name) <= kMaxMediaNameLength) {
      return name;
    }
    return core::utf8_prefix(name, kMaxMediaNameLength - 3) + "...";
  };

  const std::string& type = media.media_type;
  if (type == "video_file" || type == "video_message") {
    return with_duration("Video");
  }
  if (type == "voice_message") {
    return with_duration("Voice message");
  }
  if (type == "photo") {
    return "Photo";
  }
  if (type == "sticker") {
    return "Sticker";
  }
  if (type == "animation") {
    return "GIF";
  }
  if (type == "audio_file") {
    const std::string title = media.title.value_or("");
    const std::string performer = media.performer.value_or("");
    if (!title.empty() && !performer.empty()) {
      return "Audio: " + short_name(performer + " - " + title);
    }
    if (!title.empty()) {
      return "Audio: " + short_name(title);
    }
    return with_duration("Audio");
  }
  if (type == "document") {
    if (media.file_name.has_value() && !media.file_name->empty()) {
      return "Document: " + short_name(*media.file_name);
    }
    return "Document";
  }
  return type;
}

CleanResult CleaningStrategyMatrix::apply(const graph::ConversationGraph& graph,
                                          const domain::CleaningPolicy& policy,
                                          anonymize::AnonymizationService& anonymizer,
                                          core::IClock& clock) const {
  auto looked_up = lookup_policy(policy);
  if (!looked_up.has_value()) {
    auto error = looked_up.error();
    error.chat_name = graph.chat().name;
    return CleanResult::err(std::move(error));
  }

  CleanedDocument document;
  document.spec = std::move(looked_up).value();
  const PolicySpec& spec = document.spec;

  if (spec.anonymize_senders) {
    for (const auto& participant : graph.participants()) {
      (void)anonymizer.pseudonym(participant.id);
    }
  }

  const graph::ThreadForest forest = graph.thread_forest();
  document.units.reserve(graph.size());
  if (spec.structure == StructureMode::kThreaded) {
    for (const auto& visit : graph.depth_first(forest)) {
      document.units.push_back(
          make_unit(graph, *visit.message, visit.depth, spec, forest, anonymizer));
    }
  } else {
    for (const domain::Message* message : graph.chronological()) {
      document.units.push_back(make_unit(graph, *message, 0, spec, forest, anonymizer));
    }
  }

  auto& meta = document.metadata;
  meta.chat = graph.chat();
  meta.generated_at = clock.now_iso8601();
  meta.message_count = document.units.size();
  meta.participant_count = graph.participants().size();
  meta.orphan_references = graph.orphan_references();
  meta.skipped_records = graph.skipped_records();
  meta.encoding_fallback = graph.encoding_fallback();
  if (spec.anonymize_senders) {
    meta.collisions = anonymizer.collisions();
  }
  if (spec.interaction_summary) {
    meta.interactions = summarize_interactions(graph);
  }

  return CleanResult::ok(std::move(document));
}

}  // namespace chatsan::cleaning
