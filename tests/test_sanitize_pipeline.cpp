#include "chatsan/app/sanitize_pipeline.h"
#include "chatsan/core/clock.h"

#include "fixtures.h"

#include <catch2/catch.hpp>

using namespace chatsan;

namespace {

// Hands out "salt-1", "salt-2", ... and counts the calls.
class CountingSaltSource final : public core::ISaltSource {
 public:
  core::Salt generate() override { return core::Salt{"salt-" + std::to_string(++calls_)}; }
  [[nodiscard]] int calls() const { return calls_; }

 private:
  int calls_{0};
};

app::SanitizeRequest request_for(const std::string& approach, const int level,
                                 const std::string& format) {
  app::SanitizeRequest request;
  request.approach = approach;
  request.level = level;
  request.format = format;
  return request;
}

}  // namespace

TEST_CASE("Privacy level 1 JSON for a small export", "[app][pipeline]") {
  CountingSaltSource salts;
  core::FixedClock clock(1700000000);

  auto result = app::run_sanitize_pipeline(test_fixtures::kSmallExport,
                                           request_for("privacy", 1, "json"), salts, clock);
  REQUIRE(result.has_value());
  CHECK(salts.calls() == 1);

  // Ordered by timestamp, senders pseudonymized under "salt-1", no reply_to key,
  // and the dangling reference of message 3 is not an error.
  CHECK(result.value().rendered ==
        "[\n"
        "  {\n"
        "    \"id\": 3,\n"
        "    \"timestamp\": \"1970-01-01T00:00:09\",\n"
        "    \"sender\": \"User_4fd1c8e69bbe\",\n"
        "    \"text\": \"early\"\n"
        "  },\n"
        "  {\n"
        "    \"id\": 1,\n"
        "    \"timestamp\": \"1970-01-01T00:00:10\",\n"
        "    \"sender\": \"User_fe8a4a064bb5\",\n"
        "    \"text\": \"hi\"\n"
        "  },\n"
        "  {\n"
        "    \"id\": 2,\n"
        "    \"timestamp\": \"1970-01-01T00:00:11\",\n"
        "    \"sender\": \"User_ed57c0436f40\",\n"
        "    \"text\": \"hey\"\n"
        "  }\n"
        "]\n");

  const auto& meta = result.value().document.metadata;
  REQUIRE(meta.orphan_references.size() == 1);
  CHECK(meta.orphan_references[0].target_id.value == 99);
  CHECK(meta.generated_at == "2023-11-14T22:13:20");
  CHECK(result.value().metadata_json.find("\"missing_target\"") != std::string::npos);
}

TEST_CASE("Identical inputs and salt give identical bytes", "[app][pipeline]") {
  core::FixedClock clock(0);
  auto request = request_for("privacy", 2, "json");
  request.salt = core::Salt{"fixed"};

  CountingSaltSource unused;
  auto first = app::run_sanitize_pipeline(test_fixtures::kRichExport, request, unused, clock);
  auto second = app::run_sanitize_pipeline(test_fixtures::kRichExport, request, unused, clock);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value().rendered == second.value().rendered);
  // An explicit salt means the source is never consulted.
  CHECK(unused.calls() == 0);

  request.salt = core::Salt{"other"};
  auto third = app::run_sanitize_pipeline(test_fixtures::kRichExport, request, unused, clock);
  REQUIRE(third.has_value());
  CHECK(third.value().rendered != first.value().rendered);
}

TEST_CASE("Policy and format are validated before parsing", "[app][pipeline]") {
  CountingSaltSource salts;
  core::FixedClock clock(0);
  const std::string_view garbage = "this is not an export";

  SECTION("bad level") {
    auto result = app::run_sanitize_pipeline(garbage, request_for("privacy", 9, "json"), salts,
                                             clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kInvalidPolicyError);
  }

  SECTION("bad approach") {
    auto result = app::run_sanitize_pipeline(garbage, request_for("brevity", 1, "json"), salts,
                                             clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kInvalidPolicyError);
  }

  SECTION("unknown format") {
    auto result = app::run_sanitize_pipeline(garbage, request_for("size", 1, "xml"), salts, clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kUnsupportedFormatError);
  }

  SECTION("CSV for a nested policy") {
    auto result = app::run_sanitize_pipeline(garbage, request_for("context", 3, "csv"), salts,
                                             clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kUnsupportedFormatError);
  }

  SECTION("valid policy, invalid export") {
    auto result = app::run_sanitize_pipeline(garbage, request_for("size", 1, "csv"), salts, clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kSchemaError);
  }

  CHECK(salts.calls() == 0);
}

TEST_CASE("Salt is persisted only on request and only when anonymizing", "[app][pipeline]") {
  CountingSaltSource salts;
  core::FixedClock clock(0);

  auto request = request_for("privacy", 1, "text");
  request.persist_salt = true;
  auto anonymized = app::run_sanitize_pipeline(test_fixtures::kRichExport, request, salts, clock);
  REQUIRE(anonymized.has_value());
  CHECK(anonymized.value().document.metadata.salt == "salt-1");
  CHECK(anonymized.value().metadata_json.find("\"salt\": \"salt-1\"") != std::string::npos);

  request.approach = "context";
  auto plain = app::run_sanitize_pipeline(test_fixtures::kRichExport, request, salts, clock);
  REQUIRE(plain.has_value());
  CHECK_FALSE(plain.value().document.metadata.salt.has_value());

  request.approach = "privacy";
  request.persist_salt = false;
  auto quiet = app::run_sanitize_pipeline(test_fixtures::kRichExport, request, salts, clock);
  REQUIRE(quiet.has_value());
  CHECK_FALSE(quiet.value().document.metadata.salt.has_value());
}

TEST_CASE("Pseudonym length follows the request", "[app][pipeline]") {
  CountingSaltSource salts;
  core::FixedClock clock(0);

  auto request = request_for("privacy", 1, "text");
  request.pseudonym_length = 4;
  auto result = app::run_sanitize_pipeline(test_fixtures::kSmallExport, request, salts, clock);
  REQUIRE(result.has_value());
  CHECK(result.value().rendered == "User_4fd1: early\n"
                                   "User_fe8a: hi\n"
                                   "User_ed57: hey\n");
}
