#include "chatsan/storage/run_log.h"
#include "chatsan/storage/sqlite/sqlite_db.h"
#include "chatsan/storage/sqlite/sqlite_run_log.h"

#include <catch2/catch.hpp>

using namespace chatsan;

namespace {

storage::RunRecord make_record(const std::string& run_id, const std::string& status) {
  storage::RunRecord record;
  record.run_id = run_id;
  record.input_path = "exports/" + run_id + ".json";
  record.chat_name = "Team";
  record.policy = "privacy/2";
  record.format = "text";
  record.status = status;
  record.created_at = "2026-01-01T00:00:00";
  if (status == "ok") {
    record.output_path = "data/output/" + run_id + ".txt";
    record.message_count = 12;
    record.orphan_count = 1;
    record.warnings = {"1 reply reference(s) could not be resolved"};
  } else {
    record.error = "SchemaError: input is not a JSON document";
  }
  return record;
}

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

}  // namespace

TEST_CASE("InMemoryRunLog append and find", "[storage][runlog]") {
  storage::InMemoryRunLog log;

  REQUIRE(log.append(make_record("run-a", "ok")).has_value());
  REQUIRE(log.append(make_record("run-b", "failed")).has_value());

  const auto all = log.list_all();
  REQUIRE(all.size() == 2);
  CHECK(all[0].run_id == "run-a");
  CHECK(all[1].run_id == "run-b");

  const auto found = log.find("run-b");
  REQUIRE(found.has_value());
  CHECK(found->status == "failed");
  CHECK_FALSE(log.find("run-z").has_value());

  // Run ids are unique.
  CHECK_FALSE(log.append(make_record("run-a", "ok")).has_value());
  CHECK_FALSE(log.append(make_record("", "ok")).has_value());
}

TEST_CASE("SQLite schema initialization", "[sqlite][schema]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();

  CHECK(db->get_schema_version() == 0);
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);

  // Idempotent
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteRunLog round-trips records", "[sqlite][runlog]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteRunLog log(db);

  REQUIRE(log.append(make_record("run-1", "ok")).has_value());
  REQUIRE(log.append(make_record("run-2", "failed")).has_value());

  const auto found = log.find("run-1");
  REQUIRE(found.has_value());
  CHECK(found->input_path == "exports/run-1.json");
  CHECK(found->chat_name == "Team");
  CHECK(found->policy == "privacy/2");
  CHECK(found->format == "text");
  CHECK(found->output_path == "data/output/run-1.txt");
  CHECK(found->status == "ok");
  CHECK_FALSE(found->error.has_value());
  CHECK(found->message_count == 12);
  CHECK(found->orphan_count == 1);
  CHECK(found->collision_count == 0);
  CHECK(found->warnings == std::vector<std::string>{"1 reply reference(s) could not be resolved"});
  CHECK(found->created_at == "2026-01-01T00:00:00");

  const auto failed = log.find("run-2");
  REQUIRE(failed.has_value());
  CHECK_FALSE(failed->output_path.has_value());
  CHECK(failed->error == "SchemaError: input is not a JSON document");
  CHECK(failed->warnings.empty());

  CHECK_FALSE(log.find("run-3").has_value());
}

TEST_CASE("SqliteRunLog keeps append order and unique ids", "[sqlite][runlog]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteRunLog log(db);

  for (const auto* id : {"run-c", "run-a", "run-b"}) {
    REQUIRE(log.append(make_record(id, "ok")).has_value());
  }
  const auto all = log.list_all();
  REQUIRE(all.size() == 3);
  CHECK(all[0].run_id == "run-c");
  CHECK(all[1].run_id == "run-a");
  CHECK(all[2].run_id == "run-b");

  auto duplicate = log.append(make_record("run-a", "ok"));
  CHECK_FALSE(duplicate.has_value());
  CHECK(log.list_all().size() == 3);
}
