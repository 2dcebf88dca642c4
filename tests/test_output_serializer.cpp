#include "chatsan/cleaning/cleaning_strategy_matrix.h"
#include "chatsan/core/clock.h"
#include "chatsan/graph/conversation_graph_builder.h"
#include "chatsan/ingest/export_loader.h"
#include "chatsan/output/output_serializer.h"

#include "fixtures.h"

#include <catch2/catch.hpp>

using namespace chatsan;
using domain::Approach;
using output::OutputFormat;

namespace {

cleaning::CleanedDocument rich_document(const Approach approach, const int level) {
  auto loaded = ingest::ExportLoader{}.load(test_fixtures::kRichExport);
  REQUIRE(loaded.has_value());
  auto built = graph::ConversationGraphBuilder{}.build(std::move(loaded).value());
  REQUIRE(built.has_value());

  anonymize::AnonymizationService anonymizer(core::Salt{"salt-1"});
  core::FixedClock clock(1700003600);
  auto cleaned = cleaning::CleaningStrategyMatrix{}.apply(
      built.value(), domain::CleaningPolicy{approach, level}, anonymizer, clock);
  REQUIRE(cleaned.has_value());
  return std::move(cleaned).value();
}

// A one-message document built by hand.
cleaning::CleanedDocument manual_document(const Approach approach, const int level,
                                          const std::string& text, const std::size_t depth = 0) {
  cleaning::CleanedDocument document;
  auto spec = cleaning::lookup_policy(domain::CleaningPolicy{approach, level});
  REQUIRE(spec.has_value());
  document.spec = spec.value();
  document.metadata.chat.name = "Manual";
  document.metadata.message_count = 1;

  cleaning::MessageUnit unit;
  unit.id = core::MessageId{1};
  unit.timestamp = 0;
  unit.sender = "X";
  unit.text = text;
  unit.depth = depth;
  document.units.push_back(unit);
  return document;
}

std::string render(const cleaning::CleanedDocument& document, const OutputFormat format) {
  auto result = output::OutputSerializer{}.render(document, format);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("JSON keys are exactly the policy fields in canonical order", "[output][json]") {
  const auto document = rich_document(Approach::kPrivacy, 3);
  const auto messages = output::OutputSerializer{}.to_json(document);

  REQUIRE(messages.size() == 7);
  for (const auto& message : messages) {
    std::vector<std::string> keys;
    for (const auto& item : message.items()) {
      keys.push_back(item.key());
    }
    CHECK(keys == document.spec.keys());
  }

  // Absent values are null, never omitted.
  const auto& first = messages[0];
  CHECK(first["id"] == 10);
  CHECK(first["timestamp"] == "2023-11-14T22:13:20");
  CHECK(first["forwarded_from"].is_null());
  CHECK(first["media"].is_null());
  CHECK(first["reactions"][0]["emoji"] == "👍");
  CHECK(first["reactions"][0]["actors"][1] == "user3");

  const auto& voice = messages[2];
  CHECK(voice["media"]["type"] == "voice_message");
  CHECK(voice["media"]["duration_seconds"] == 7);
  CHECK(voice["reply_to"] == 11);
  CHECK(voice["depth"] == 2);

  const auto& tombstone = messages[5];
  CHECK(tombstone["kind"] == "tombstone");
  CHECK(tombstone["sender_id"].is_null());
}

TEST_CASE("Rendering is deterministic", "[output]") {
  const auto a = rich_document(Approach::kContext, 3);
  const auto b = rich_document(Approach::kContext, 3);
  for (const auto format : {OutputFormat::kText, OutputFormat::kJson, OutputFormat::kMarkdown}) {
    CHECK(render(a, format) == render(b, format));
  }
}

TEST_CASE("Text projection", "[output][text]") {
  SECTION("threaded with annotations") {
    const auto text = render(rich_document(Approach::kContext, 3), OutputFormat::kText);
    CHECK(text ==
          "22:13 Alice: Anyone up for hiking? [reactions: 👍(2)]\n"
          "  22:14 Bob: Yes! See https://trails.example (edited)\n"
          "    22:15 Carol: Count me in [media: voice_message]\n"
          "22:16 Alice: [service]\n"
          "22:17 Dave: Trail tip: start early, bring water (forwarded from Trail News)\n"
          "22:18 Unknown: [deleted]\n"
          "  22:19 Alice: What was deleted?\n");
  }

  SECTION("summaries at size level 3") {
    const auto text = render(rich_document(Approach::kSize, 3), OutputFormat::kText);
    CHECK(text.find("22:15 Carol: Count me in [media: Voice message (7s)]\n") !=
          std::string::npos);
    CHECK(text.find("22:13 Alice: Anyone up for hiking? [reactions: 👍(2)]\n") !=
          std::string::npos);
  }

  SECTION("continuation lines are marked under the message indentation") {
    const auto text =
        render(manual_document(Approach::kContext, 2, "line one\nline two", 1), OutputFormat::kText);
    CHECK(text == "  00:00 X: line one\n    | line two\n");
  }

  SECTION("a body line shaped like a message stays a continuation") {
    const auto document = manual_document(Approach::kContext, 2, "see log:\n10:05 Mallory: pwned");
    const auto text = render(document, OutputFormat::kText);
    CHECK(text == "00:00 X: see log:\n  | 10:05 Mallory: pwned\n");
  }

  SECTION("minimal privacy leaves the clock out") {
    const auto text = render(rich_document(Approach::kPrivacy, 1), OutputFormat::kText);
    CHECK(text.find("22:1") == std::string::npos);
    CHECK(text.find(": Anyone up for hiking?\n") != std::string::npos);
    CHECK(text.rfind("User_", 0) == 0);
  }
}

TEST_CASE("Markdown projection", "[output][markdown]") {
  const auto markdown = render(rich_document(Approach::kContext, 2), OutputFormat::kMarkdown);

  CHECK(markdown.rfind("# Weekend Plans\n\n_Policy: context/2 (medium), 7 messages_\n", 0) == 0);
  CHECK(markdown.find("\n22:13 **Alice**: Anyone up for hiking?\n") != std::string::npos);
  CHECK(markdown.find("\n> 22:14 **Bob**: Yes! See https://trails.example\n") !=
        std::string::npos);
  CHECK(markdown.find("\n> > 22:15 **Carol**: Count me in\n") != std::string::npos);

  SECTION("minimal privacy leaves the clock out") {
    const auto minimal = render(manual_document(Approach::kPrivacy, 1, "hello"),
                                OutputFormat::kMarkdown);
    CHECK(minimal == "# Manual\n\n_Policy: privacy/1 (basic), 1 messages_\n\n**X**: hello\n");

    // The JSON form still carries the timestamp key.
    const auto json = render(manual_document(Approach::kPrivacy, 1, "hello"), OutputFormat::kJson);
    CHECK(json.find("\"timestamp\": \"1970-01-01T00:00:00\"") != std::string::npos);
  }
}

TEST_CASE("CSV projection", "[output][csv]") {
  SECTION("header and quoting") {
    const auto csv = render(rich_document(Approach::kSize, 2), OutputFormat::kCsv);
    CHECK(csv.rfind("id,timestamp,sender,text,links\n", 0) == 0);
    CHECK(csv.find("11,2023-11-14T22:14:20,Bob,Yes! See https://trails.example,"
                   "https://trails.example\n") != std::string::npos);
    CHECK(csv.find("14,2023-11-14T22:17:20,Dave,\"Trail tip: start early, bring water\",\n") !=
          std::string::npos);
  }

  SECTION("embedded quotes and newlines") {
    const auto csv =
        render(manual_document(Approach::kSize, 1, "say \"hi\"\nthen go"), OutputFormat::kCsv);
    CHECK(csv == "id,timestamp,sender,text\n1,1970-01-01T00:00:00,X,\"say \"\"hi\"\"\nthen go\"\n");
  }

  SECTION("nested policies are rejected") {
    const auto document = rich_document(Approach::kPrivacy, 3);
    auto result = output::OutputSerializer{}.render(document, OutputFormat::kCsv);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kUnsupportedFormatError);
    CHECK(result.error().chat_name == "Weekend Plans");
    CHECK(result.error().message.find("use json or markdown") != std::string::npos);
  }
}

TEST_CASE("Metadata document", "[output][metadata]") {
  auto document = rich_document(Approach::kContext, 3);
  document.metadata.salt = "persisted-salt";

  const auto text = output::OutputSerializer{}.render_metadata_json(document);
  const auto meta = nlohmann::json::parse(text);

  CHECK(meta["schema_version"] == "1");
  CHECK(meta["generated_at"] == "2023-11-14T23:13:20");
  CHECK(meta["chat"]["name"] == "Weekend Plans");
  CHECK(meta["chat"]["id"] == "4242");
  CHECK(meta["chat"]["date_from"] == "2023-11-14T22:13:20");
  CHECK(meta["policy"]["approach"] == "context");
  CHECK(meta["policy"]["level"] == 3);
  CHECK(meta["policy"]["level_name"] == "full");
  CHECK(meta["policy"]["structure"] == "threaded");
  CHECK(meta["policy"]["anonymized"] == false);
  CHECK(meta["message_count"] == 7);
  CHECK(meta["participant_count"] == 4);
  CHECK(meta["notices"]["orphan_references"].empty());
  CHECK(meta["notices"]["encoding_fallback"].is_null());
  CHECK(meta["salt"] == "persisted-salt");
  REQUIRE(meta["interactions"].size() == 3);
  CHECK(meta["interactions"][0]["from"] == "user2");

  SECTION("interactions only for the full context cell") {
    const auto plain = output::OutputSerializer{}.metadata_json(
        rich_document(Approach::kContext, 2));
    CHECK_FALSE(plain.contains("interactions"));
    CHECK_FALSE(plain.contains("salt"));
  }
}
