#include "chatsan/cleaning/policy_table.h"
#include "chatsan/output/output_format.h"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace chatsan;
using cleaning::Field;
using domain::Approach;

namespace {

cleaning::PolicySpec cell(const Approach approach, const int level) {
  auto result = cleaning::lookup_policy(domain::CleaningPolicy{approach, level});
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("Table has one cell per approach and level", "[cleaning][policy]") {
  const auto& table = cleaning::policy_table();
  REQUIRE(table.size() == 9);

  for (const auto approach : {Approach::kPrivacy, Approach::kSize, Approach::kContext}) {
    for (int level = domain::kMinLevel; level <= domain::kMaxLevel; ++level) {
      const auto spec = cell(approach, level);
      CHECK(spec.policy.approach == approach);
      CHECK(spec.policy.level == level);
      // id, timestamp, sender and text are always present.
      CHECK(spec.has(Field::kId));
      CHECK(spec.has(Field::kTimestamp));
      CHECK(spec.has(Field::kSender));
      CHECK(spec.has(Field::kText));
    }
  }
}

TEST_CASE("Higher levels keep every key of lower levels", "[cleaning][policy]") {
  for (const auto approach : {Approach::kPrivacy, Approach::kSize, Approach::kContext}) {
    for (int level = 2; level <= domain::kMaxLevel; ++level) {
      const auto lower = cell(approach, level - 1);
      const auto higher = cell(approach, level);
      for (const auto& key : lower.keys()) {
        INFO(domain::policy_label(higher.policy) << " missing " << key);
        CHECK(higher.has_key(key));
      }
      CHECK(higher.keys().size() > lower.keys().size());
    }
  }
}

TEST_CASE("Fields are listed in canonical order", "[cleaning][policy]") {
  for (const auto& spec : cleaning::policy_table()) {
    CHECK(std::is_sorted(spec.fields.begin(), spec.fields.end()));
    CHECK(std::adjacent_find(spec.fields.begin(), spec.fields.end()) == spec.fields.end());
  }

  const auto keys = cell(Approach::kPrivacy, 2).keys();
  CHECK(keys == std::vector<std::string>{"id", "timestamp", "sender", "text", "reply_to", "depth"});
}

TEST_CASE("Structure and anonymization per cell", "[cleaning][policy]") {
  CHECK(cell(Approach::kPrivacy, 1).anonymize_senders);
  CHECK(cell(Approach::kPrivacy, 2).anonymize_senders);
  // Full privacy level preserves original identifiers.
  CHECK_FALSE(cell(Approach::kPrivacy, 3).anonymize_senders);
  CHECK_FALSE(cell(Approach::kSize, 1).anonymize_senders);
  CHECK_FALSE(cell(Approach::kContext, 3).anonymize_senders);

  CHECK(cell(Approach::kPrivacy, 1).structure == cleaning::StructureMode::kChronological);
  CHECK(cell(Approach::kPrivacy, 2).structure == cleaning::StructureMode::kThreaded);
  CHECK(cell(Approach::kSize, 3).structure == cleaning::StructureMode::kChronological);
  CHECK(cell(Approach::kContext, 2).structure == cleaning::StructureMode::kThreaded);

  CHECK_FALSE(cell(Approach::kPrivacy, 1).has(Field::kReplyTo));
  CHECK(cell(Approach::kContext, 3).has(Field::kReplies));
  CHECK(cell(Approach::kContext, 3).interaction_summary);
  CHECK_FALSE(cell(Approach::kContext, 2).interaction_summary);
  CHECK(cell(Approach::kSize, 3).has(Field::kMediaSummary));
  CHECK_FALSE(cell(Approach::kSize, 3).has(Field::kMediaDetail));

  // Only the minimal privacy cell drops the clock from text and markdown.
  for (const auto& spec : cleaning::policy_table()) {
    const bool minimal_privacy = spec.policy == domain::CleaningPolicy{Approach::kPrivacy, 1};
    CHECK(spec.clock_in_projection != minimal_privacy);
    CHECK(spec.has(Field::kTimestamp));
  }
}

TEST_CASE("CSV compatibility follows the shape of each cell", "[cleaning][policy][csv]") {
  const std::vector<std::pair<Approach, int>> flat = {
      {Approach::kPrivacy, 1}, {Approach::kPrivacy, 2}, {Approach::kSize, 1},
      {Approach::kSize, 2},    {Approach::kSize, 3},    {Approach::kContext, 1},
      {Approach::kContext, 2}};
  for (const auto& [approach, level] : flat) {
    const auto spec = cell(approach, level);
    CHECK(spec.is_flat());
    CHECK(output::check_compatibility(spec, output::OutputFormat::kCsv).has_value());
  }

  for (const auto& nested : {cell(Approach::kPrivacy, 3), cell(Approach::kContext, 3)}) {
    CHECK_FALSE(nested.is_flat());
    auto result = output::check_compatibility(nested, output::OutputFormat::kCsv);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kUnsupportedFormatError);
    // Every other format accepts the cell.
    CHECK(output::check_compatibility(nested, output::OutputFormat::kJson).has_value());
    CHECK(output::check_compatibility(nested, output::OutputFormat::kMarkdown).has_value());
  }
}

TEST_CASE("Policy validation", "[cleaning][policy]") {
  SECTION("make_policy") {
    auto ok = domain::make_policy("Context", 3);
    REQUIRE(ok.has_value());
    CHECK(ok.value().approach == Approach::kContext);

    auto bad_approach = domain::make_policy("secrecy", 1);
    REQUIRE_FALSE(bad_approach.has_value());
    CHECK(bad_approach.error().code == core::ErrorCode::kInvalidPolicyError);

    for (const int level : {0, 4, -1}) {
      auto bad_level = domain::make_policy("privacy", level);
      REQUIRE_FALSE(bad_level.has_value());
      CHECK(bad_level.error().code == core::ErrorCode::kInvalidPolicyError);
    }
  }

  SECTION("lookup re-validates hand-built policies") {
    auto result = cleaning::lookup_policy(domain::CleaningPolicy{Approach::kSize, 7});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kInvalidPolicyError);
    CHECK(result.error().message == "no cleaning policy for size/7 (levels are 1..3)");
  }

  SECTION("labels") {
    CHECK(domain::policy_label(domain::CleaningPolicy{Approach::kPrivacy, 2}) == "privacy/2");
    CHECK(domain::level_name(1) == "basic");
    CHECK(domain::level_name(3) == "full");
  }
}
