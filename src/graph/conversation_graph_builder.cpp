#include "chatsan/graph/conversation_graph_builder.h"

#include <algorithm>

namespace chatsan::graph {

namespace {

domain::Message to_message(domain::RawMessageRecord&& record, const std::size_t ingest_index) {
  domain::Message message;
  message.id = record.id;
  message.ingest_index = ingest_index;
  message.kind = record.kind;
  message.timestamp = record.timestamp;
  message.sender_id = std::move(record.sender_id);
  message.sender_name = std::move(record.sender_name);
  message.text = std::move(record.text);
  message.links = std::move(record.links);
  message.reactions = std::move(record.reactions);
  message.edited = record.edited;
  message.edited_at = record.edited_at;
  message.forwarded_from = std::move(record.forwarded_from);
  message.media = std::move(record.media);
  message.service_action = std::move(record.service_action);
  // reply_to is resolved in a second pass.
  return message;
}

void observe_participant(const domain::Message& message,
                         std::vector<domain::Participant>& participants,
                         std::map<core::ParticipantId, std::size_t>& index) {
  if (message.sender_id.value.empty()) {
    return;
  }
  const auto it = index.find(message.sender_id);
  if (it == index.end()) {
    domain::Participant participant;
    participant.id = message.sender_id;
    participant.display_name = message.sender_name;
    if (!message.sender_name.empty()) {
      participant.observed_names.push_back(message.sender_name);
    }
    participant.first_seen = message.timestamp;
    participant.last_seen = message.timestamp;
    participant.message_count = 1;
    index.emplace(message.sender_id, participants.size());
    participants.push_back(std::move(participant));
    return;
  }

  auto& participant = participants[it->second];
  participant.first_seen = std::min(participant.first_seen, message.timestamp);
  participant.last_seen = std::max(participant.last_seen, message.timestamp);
  ++participant.message_count;
  if (!message.sender_name.empty()) {
    if (participant.display_name.empty()) {
      participant.display_name = message.sender_name;
    }
    auto& names = participant.observed_names;
    if (std::find(names.begin(), names.end(), message.sender_name) == names.end()) {
      names.push_back(message.sender_name);
    }
  }
}

}  // namespace

BuildResult ConversationGraphBuilder::build(domain::RawExport raw) const {
  ConversationGraph graph;
  graph.chat_ = std::move(raw.chat);
  graph.skipped_records_ = std::move(raw.skipped_records);
  graph.encoding_fallback_ = std::move(raw.encoding_fallback);

  std::vector<std::optional<core::MessageId>> requested_parents;
  requested_parents.reserve(raw.records.size());
  graph.messages_.reserve(raw.records.size());

  for (auto& record : raw.records) {
    const core::MessageId id = record.id;
    if (graph.index_.count(id) != 0) {
      return BuildResult::err(core::make_error(core::ErrorCode::kSchemaError,
                                               "duplicate message id " + std::to_string(id.value),
                                               graph.chat_.name, id.value));
    }
    requested_parents.push_back(record.reply_to);
    graph.index_.emplace(id, graph.messages_.size());
    graph.messages_.push_back(to_message(std::move(record), graph.messages_.size()));
    observe_participant(graph.messages_.back(), graph.participants_,
                        graph.participant_index_);
  }

  // Resolve reply links in ingestion order. Only links already accepted are
  // followed when checking for a cycle, so the graph stays acyclic throughout.
  // A chain can only lead back to a message that already has an accepted
  // reply, so the walk is skipped for every other message.
  std::vector<bool> has_child(graph.messages_.size(), false);
  for (std::size_t i = 0; i < graph.messages_.size(); ++i) {
    if (!requested_parents[i].has_value()) {
      continue;
    }
    auto& message = graph.messages_[i];
    const core::MessageId target = *requested_parents[i];

    if (graph.index_.count(target) == 0) {
      graph.orphan_references_.push_back(
          {message.id, target, domain::OrphanReason::kMissingTarget});
      continue;
    }

    bool closes_cycle = false;
    std::optional<core::MessageId> cursor = target;
    if (!has_child[i]) {
      cursor.reset();
      closes_cycle = target == message.id;
    }
    while (cursor.has_value()) {
      if (*cursor == message.id) {
        closes_cycle = true;
        break;
      }
      cursor = graph.messages_[graph.index_.at(*cursor)].reply_to;
    }
    if (closes_cycle) {
      graph.orphan_references_.push_back({message.id, target, domain::OrphanReason::kCycle});
      continue;
    }
    message.reply_to = target;
    has_child[graph.index_.at(target)] = true;
  }

  return BuildResult::ok(std::move(graph));
}

}  // namespace chatsan::graph
