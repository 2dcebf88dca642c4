#include "chatsan/analysis/builtin_plugins.h"
#include "chatsan/analysis/plugin_registry.h"
#include "chatsan/app/sanitize_pipeline.h"
#include "chatsan/core/clock.h"
#include "chatsan/core/salt_source.h"

#include <catch2/catch.hpp>

using namespace chatsan;

namespace {

constexpr const char* kProjection =
    "09:15 User_aaa: morning\n"
    "  09:16 User_bbb: hi\n"
    "    09:20 User_aaa: coffee?\n"
    "      | second line: not a message\n"
    "14:02 User_ccc: afternoon\n"
    "14:30 User_aaa: meeting at 3: ok\n";

class EchoPlugin final : public analysis::IAnalysisPlugin {
 public:
  [[nodiscard]] std::string_view name() const override { return "echo"; }
  [[nodiscard]] std::string_view description() const override { return "Echoes the input"; }
  [[nodiscard]] analysis::AnalysisResult analyze(
      const analysis::AnalysisRequest& request) const override {
    return analysis::AnalysisResult{request.chat_text, "text", {}};
  }
};

}  // namespace

TEST_CASE("Text projection lines are parsed", "[analysis][parse]") {
  auto line = analysis::parse_text_line("    09:20 User_aaa: coffee?");
  REQUIRE(line.has_value());
  CHECK(line->time == "09:20");
  CHECK(line->sender == "User_aaa");
  CHECK(line->body == "coffee?");
  CHECK(line->depth == 2);

  // The first ": " after the time ends the sender.
  auto colon = analysis::parse_text_line("14:30 User_aaa: meeting at 3: ok");
  REQUIRE(colon.has_value());
  CHECK(colon->body == "meeting at 3: ok");

  CHECK_FALSE(analysis::parse_text_line("").has_value());
  CHECK_FALSE(analysis::parse_text_line("      | second line: not a message").has_value());
  CHECK_FALSE(analysis::parse_text_line("  | 10:05 Mallory: pwned").has_value());
  CHECK_FALSE(analysis::parse_text_line(" 09:20 User_aaa: odd indent").has_value());
  CHECK_FALSE(analysis::parse_text_line("09:20 no separator").has_value());

  // Policies without a clock render "sender: body".
  auto untimed = analysis::parse_text_line("User_aaa: no clock here");
  REQUIRE(untimed.has_value());
  CHECK(untimed->time.empty());
  CHECK(untimed->sender == "User_aaa");
  CHECK(untimed->body == "no clock here");

  CHECK(analysis::parse_text_projection(kProjection).size() == 5);
}

TEST_CASE("Default registry carries the built-in plugins", "[analysis][registry]") {
  const auto registry = analysis::make_default_registry();
  CHECK(registry.names() == std::vector<std::string>{"hourly_timeline", "participant_activity"});
  CHECK(registry.find("participant_activity") != nullptr);
  CHECK(registry.find("sentiment") == nullptr);

  auto unknown = registry.run("sentiment", analysis::AnalysisRequest{});
  REQUIRE_FALSE(unknown.has_value());
  CHECK(unknown.error() == "unknown analysis plugin: sentiment");
}

TEST_CASE("Registry rejects duplicate and null plugins", "[analysis][registry]") {
  analysis::PluginRegistry registry;
  REQUIRE(registry.add(std::make_unique<EchoPlugin>()).has_value());
  CHECK_FALSE(registry.add(std::make_unique<EchoPlugin>()).has_value());
  CHECK_FALSE(registry.add(nullptr).has_value());

  auto result = registry.run("echo", analysis::AnalysisRequest{"abc", {}});
  REQUIRE(result.has_value());
  CHECK(result.value().result == "abc");
  CHECK(result.value().metadata.at("plugin") == "echo");
}

TEST_CASE("Participant activity counts messages per sender", "[analysis][plugins]") {
  const auto registry = analysis::make_default_registry();

  auto result = registry.run("participant_activity", analysis::AnalysisRequest{kProjection, {}});
  REQUIRE(result.has_value());
  CHECK(result.value().format == "markdown");
  CHECK(result.value().result ==
        "| Sender | Messages |\n"
        "|---|---|\n"
        "| User_aaa | 3 |\n"
        "| User_bbb | 1 |\n"
        "| User_ccc | 1 |\n");
  CHECK(result.value().metadata.at("total_messages") == "5");
  CHECK(result.value().metadata.at("participants") == "3");

  auto top = registry.run("participant_activity",
                          analysis::AnalysisRequest{kProjection, {{"top", "1"}}});
  REQUIRE(top.has_value());
  CHECK(top.value().result == "| Sender | Messages |\n|---|---|\n| User_aaa | 3 |\n");
}

TEST_CASE("Hourly timeline buckets messages by hour", "[analysis][plugins]") {
  const analysis::HourlyTimelinePlugin plugin;
  const auto result = plugin.analyze(analysis::AnalysisRequest{kProjection, {}});

  CHECK(result.result ==
        "| Hour (UTC) | Messages |\n"
        "|---|---|\n"
        "| 09:00 | 3 |\n"
        "| 14:00 | 2 |\n");
  CHECK(result.metadata.at("busiest_hour") == "9");
  CHECK(result.metadata.at("total_messages") == "5");
}

TEST_CASE("Multi-line bodies do not invent messages", "[analysis][plugins]") {
  constexpr std::string_view kExport = R"({
    "name": "Logs", "type": "private_group", "id": 1,
    "messages": [
      {"id": 1, "date_unixtime": "36000", "from": "Alice", "from_id": "user1",
       "text": "see log:\n10:05 Mallory: pwned\nUser_x: also not a message"}
    ]
  })";

  core::FixedSaltSource salts(core::Salt{"salt"});
  core::FixedClock clock(0);
  const auto registry = analysis::make_default_registry();

  for (const auto& [approach, level] :
       std::vector<std::pair<std::string, int>>{{"context", 2}, {"privacy", 1}}) {
    app::SanitizeRequest request;
    request.approach = approach;
    request.level = level;
    request.format = "text";
    auto sanitized = app::run_sanitize_pipeline(kExport, request, salts, clock);
    REQUIRE(sanitized.has_value());

    auto result = registry.run("participant_activity",
                               analysis::AnalysisRequest{sanitized.value().rendered, {}});
    REQUIRE(result.has_value());
    CHECK(result.value().metadata.at("total_messages") == "1");
    CHECK(result.value().metadata.at("participants") == "1");
    CHECK(result.value().result.find("Mallory") == std::string::npos);
  }
}

TEST_CASE("Hourly timeline ignores lines without a clock", "[analysis][plugins]") {
  const analysis::HourlyTimelinePlugin plugin;
  const auto result = plugin.analyze(analysis::AnalysisRequest{"User_a: hi\nUser_b: hey\n", {}});
  CHECK(result.result == "| Hour (UTC) | Messages |\n|---|---|\n");
  CHECK(result.metadata.at("total_messages") == "0");
  CHECK(result.metadata.count("busiest_hour") == 0);
}
