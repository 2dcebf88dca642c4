#include "chatsan/graph/conversation_graph_builder.h"
#include "chatsan/ingest/export_loader.h"

#include "fixtures.h"

#include <catch2/catch.hpp>

#include <optional>

using namespace chatsan;

namespace {

domain::RawMessageRecord record(const std::int64_t id, const std::int64_t timestamp,
                                const std::string& sender,
                                const std::optional<std::int64_t> reply_to = std::nullopt) {
  domain::RawMessageRecord out;
  out.id = core::MessageId{id};
  out.timestamp = timestamp;
  out.sender_id = core::ParticipantId{sender};
  out.sender_name = sender;
  out.text = "message " + std::to_string(id);
  if (reply_to.has_value()) {
    out.reply_to = core::MessageId{*reply_to};
  }
  return out;
}

domain::RawExport raw_export(std::vector<domain::RawMessageRecord> records) {
  domain::RawExport raw;
  raw.chat.name = "Graph";
  raw.chat.type = "private_group";
  raw.chat.id = "1";
  raw.records = std::move(records);
  return raw;
}

graph::ConversationGraph build(std::vector<domain::RawMessageRecord> records) {
  auto result = graph::ConversationGraphBuilder{}.build(raw_export(std::move(records)));
  REQUIRE(result.has_value());
  return std::move(result).value();
}

std::vector<std::int64_t> ids_of(const std::vector<const domain::Message*>& messages) {
  std::vector<std::int64_t> out;
  for (const auto* message : messages) {
    out.push_back(message->id.value);
  }
  return out;
}

}  // namespace

TEST_CASE("Missing reply targets become orphan notices", "[graph][builder]") {
  auto loaded = ingest::ExportLoader{}.load(test_fixtures::kSmallExport);
  REQUIRE(loaded.has_value());
  auto result = graph::ConversationGraphBuilder{}.build(std::move(loaded).value());
  REQUIRE(result.has_value());
  const auto& graph = result.value();

  REQUIRE(graph.size() == 3);
  // The orphan is kept; only its link is dropped.
  const auto* carol = graph.find(core::MessageId{3});
  REQUIRE(carol != nullptr);
  CHECK_FALSE(carol->reply_to.has_value());

  REQUIRE(graph.orphan_references().size() == 1);
  CHECK(graph.orphan_references()[0].message_id.value == 3);
  CHECK(graph.orphan_references()[0].target_id.value == 99);
  CHECK(graph.orphan_references()[0].reason == domain::OrphanReason::kMissingTarget);

  const auto* bob = graph.find(core::MessageId{2});
  REQUIRE(bob != nullptr);
  REQUIRE(bob->reply_to.has_value());
  CHECK(bob->reply_to->value == 1);
}

TEST_CASE("Reply cycles are broken at the closing link", "[graph][builder]") {
  SECTION("two-message cycle") {
    const auto graph = build({record(1, 100, "a", 2), record(2, 101, "b", 1)});

    // Message 1 -> 2 is accepted first; 2 -> 1 would close the loop.
    REQUIRE(graph.find(core::MessageId{1})->reply_to.has_value());
    CHECK_FALSE(graph.find(core::MessageId{2})->reply_to.has_value());
    REQUIRE(graph.orphan_references().size() == 1);
    CHECK(graph.orphan_references()[0].message_id.value == 2);
    CHECK(graph.orphan_references()[0].reason == domain::OrphanReason::kCycle);
  }

  SECTION("self reply") {
    const auto graph = build({record(5, 100, "a", 5)});
    CHECK_FALSE(graph.find(core::MessageId{5})->reply_to.has_value());
    REQUIRE(graph.orphan_references().size() == 1);
    CHECK(graph.orphan_references()[0].reason == domain::OrphanReason::kCycle);
  }

  SECTION("three-message cycle") {
    const auto graph =
        build({record(1, 100, "a", 3), record(2, 101, "b", 1), record(3, 102, "c", 2)});
    REQUIRE(graph.orphan_references().size() == 1);
    CHECK(graph.orphan_references()[0].message_id.value == 3);

    // Every message is still reachable from a root.
    const auto forest = graph.thread_forest();
    CHECK(graph.depth_first(forest).size() == 3);
  }
}

TEST_CASE("Chronological order is stable on equal timestamps", "[graph][order]") {
  const auto graph = build({record(30, 200, "a"), record(10, 100, "b"), record(20, 200, "c"),
                            record(40, 100, "d")});
  CHECK(ids_of(graph.chronological()) == std::vector<std::int64_t>{10, 40, 30, 20});
}

TEST_CASE("Thread forest and depth-first walk", "[graph][thread]") {
  auto loaded = ingest::ExportLoader{}.load(test_fixtures::kRichExport);
  REQUIRE(loaded.has_value());
  auto result = graph::ConversationGraphBuilder{}.build(std::move(loaded).value());
  REQUIRE(result.has_value());
  const auto& graph = result.value();

  const auto forest = graph.thread_forest();
  std::vector<std::int64_t> roots;
  for (const auto& id : forest.roots) {
    roots.push_back(id.value);
  }
  CHECK(roots == std::vector<std::int64_t>{10, 13, 14, 15});
  CHECK(forest.children_of(core::MessageId{10}).size() == 1);
  CHECK(forest.children_of(core::MessageId{12}).empty());

  std::vector<std::pair<std::int64_t, std::size_t>> visits;
  for (const auto& visit : graph.depth_first(forest)) {
    visits.emplace_back(visit.message->id.value, visit.depth);
  }
  const std::vector<std::pair<std::int64_t, std::size_t>> expected = {
      {10, 0}, {11, 1}, {12, 2}, {13, 0}, {14, 0}, {15, 0}, {16, 1}};
  CHECK(visits == expected);
}

TEST_CASE("Deep reply chains are walked without recursion", "[graph][thread]") {
  constexpr std::int64_t kDepth = 20000;
  std::vector<domain::RawMessageRecord> records;
  records.reserve(kDepth);
  records.push_back(record(1, 1, "a"));
  for (std::int64_t id = 2; id <= kDepth; ++id) {
    records.push_back(record(id, id, id % 2 == 0 ? "b" : "a", id - 1));
  }
  const auto graph = build(std::move(records));

  const auto visits = graph.depth_first(graph.thread_forest());
  REQUIRE(visits.size() == static_cast<std::size_t>(kDepth));
  CHECK(visits.back().depth == static_cast<std::size_t>(kDepth - 1));
  CHECK(graph.orphan_references().empty());
}

TEST_CASE("Participant registry", "[graph][participants]") {
  auto renamed = record(3, 300, "user1");
  renamed.sender_name = "Alice Renamed";
  auto unnamed = record(4, 50, "user1");
  unnamed.sender_name.clear();
  auto anonymous = record(5, 400, "");

  const auto graph = build({record(1, 100, "user1"), record(2, 200, "user2"), renamed, unnamed,
                            anonymous});

  // Senders without an id are not registered.
  REQUIRE(graph.participants().size() == 2);
  CHECK(graph.participants()[0].id.value == "user1");
  CHECK(graph.participants()[1].id.value == "user2");

  const auto* user1 = graph.find_participant(core::ParticipantId{"user1"});
  REQUIRE(user1 != nullptr);
  CHECK(user1->display_name == "user1");
  CHECK(user1->observed_names == std::vector<std::string>{"user1", "Alice Renamed"});
  CHECK(user1->first_seen == 50);
  CHECK(user1->last_seen == 300);
  CHECK(user1->message_count == 3);

  CHECK(graph.find_participant(core::ParticipantId{"nobody"}) == nullptr);
}

TEST_CASE("Duplicate ids are a schema error", "[graph][builder]") {
  auto result =
      graph::ConversationGraphBuilder{}.build(raw_export({record(1, 1, "a"), record(1, 2, "b")}));
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kSchemaError);
  CHECK(result.error().message_id == 1);
  CHECK(result.error().chat_name == "Graph");
}
