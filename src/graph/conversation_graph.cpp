#include "chatsan/graph/conversation_graph.h"

#include <algorithm>

namespace chatsan::graph {

const std::vector<core::MessageId>& ThreadForest::children_of(const core::MessageId id) const {
  static const std::vector<core::MessageId> kNoChildren;
  const auto it = children.find(id);
  return it == children.end() ? kNoChildren : it->second;
}

const domain::Participant* ConversationGraph::find_participant(
    const core::ParticipantId& id) const {
  const auto it = participant_index_.find(id);
  return it == participant_index_.end() ? nullptr : &participants_[it->second];
}

const domain::Message* ConversationGraph::find(const core::MessageId id) const {
  const auto it = index_.find(id);
  return it == index_.end() ? nullptr : &messages_[it->second];
}

std::vector<const domain::Message*> ConversationGraph::chronological() const {
  std::vector<const domain::Message*> ordered;
  ordered.reserve(messages_.size());
  for (const auto& message : messages_) {
    ordered.push_back(&message);
  }
  // messages_ is in ingestion order, so a stable sort keeps that as the tie-break.
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const domain::Message* a, const domain::Message* b) {
                     return a->timestamp < b->timestamp;
                   });
  return ordered;
}

ThreadForest ConversationGraph::thread_forest() const {
  ThreadForest forest;
  for (const domain::Message* message : chronological()) {
    if (message->reply_to.has_value()) {
      forest.children[*message->reply_to].push_back(message->id);
    } else {
      forest.roots.push_back(message->id);
    }
  }
  return forest;
}

std::vector<ThreadVisit> ConversationGraph::depth_first(const ThreadForest& forest) const {
  std::vector<ThreadVisit> out;
  out.reserve(messages_.size());

  std::vector<std::pair<core::MessageId, std::size_t>> stack;
  for (auto it = forest.roots.rbegin(); it != forest.roots.rend(); ++it) {
    stack.emplace_back(*it, 0);
  }
  while (!stack.empty()) {
    const auto [id, depth] = stack.back();
    stack.pop_back();

    const domain::Message* message = find(id);
    if (message == nullptr) {
      continue;
    }
    out.push_back(ThreadVisit{message, depth});

    const auto& kids = forest.children_of(id);
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      stack.emplace_back(*it, depth + 1);
    }
  }
  return out;
}

}  // namespace chatsan::graph
