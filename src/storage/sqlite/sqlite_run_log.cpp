#include "chatsan/storage/sqlite/sqlite_run_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace chatsan::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT run_id, input_path, chat_name, policy, format, output_path, status, error,"
    "       message_count, orphan_count, collision_count, skipped_count, warnings_json,"
    "       created_at"
    "  FROM run_log";

std::string column_text(sqlite3_stmt* stmt, const int col) {
  const auto* raw = sqlite3_column_text(stmt, col);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : std::string();  // NOLINT
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, const int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, col);
}

std::size_t column_count(sqlite3_stmt* stmt, const int col) {
  return static_cast<std::size_t>(sqlite3_column_int64(stmt, col));
}

RunRecord read_row(sqlite3_stmt* stmt) {
  RunRecord record;
  record.run_id = column_text(stmt, 0);
  record.input_path = column_text(stmt, 1);
  record.chat_name = column_text(stmt, 2);
  record.policy = column_text(stmt, 3);
  record.format = column_text(stmt, 4);
  record.output_path = column_optional_text(stmt, 5);
  record.status = column_text(stmt, 6);
  record.error = column_optional_text(stmt, 7);
  record.message_count = column_count(stmt, 8);
  record.orphan_count = column_count(stmt, 9);
  record.collision_count = column_count(stmt, 10);
  record.skipped_count = column_count(stmt, 11);

  const auto warnings = nlohmann::json::parse(column_text(stmt, 12), nullptr, false);
  if (warnings.is_array()) {
    for (const auto& w : warnings) {
      if (w.is_string()) {
        record.warnings.push_back(w.get<std::string>());
      }
    }
  }
  record.created_at = column_text(stmt, 13);
  return record;
}

}  // namespace

SqliteRunLog::SqliteRunLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteRunLog::append(const RunRecord& record) {
  const char* sql = R"(
    INSERT INTO run_log
      (run_id, input_path, chat_name, policy, format, output_path, status, error,
       message_count, orphan_count, collision_count, skipped_count, warnings_json, created_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return core::Result<bool, std::string>::err("Failed to prepare run_log insert: " +
                                                stmt.error());
  }

  const nlohmann::json warnings = record.warnings;
  stmt.bind_text(1, record.run_id);
  stmt.bind_text(2, record.input_path);
  stmt.bind_text(3, record.chat_name);
  stmt.bind_text(4, record.policy);
  stmt.bind_text(5, record.format);
  stmt.bind_optional_text(6, record.output_path);
  stmt.bind_text(7, record.status);
  stmt.bind_optional_text(8, record.error);
  stmt.bind_int64(9, static_cast<std::int64_t>(record.message_count));
  stmt.bind_int64(10, static_cast<std::int64_t>(record.orphan_count));
  stmt.bind_int64(11, static_cast<std::int64_t>(record.collision_count));
  stmt.bind_int64(12, static_cast<std::int64_t>(record.skipped_count));
  stmt.bind_text(13, warnings.dump());
  stmt.bind_text(14, record.created_at);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return core::Result<bool, std::string>::err(
        "Failed to insert run record: " + std::string(sqlite3_errmsg(db_->connection())));
  }
  return core::Result<bool, std::string>::ok(true);
}

std::vector<RunRecord> SqliteRunLog::list_all() const {
  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) + " ORDER BY seq");
  if (!stmt.is_valid()) {
    return {};
  }
  std::vector<RunRecord> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_row(stmt.get()));
  }
  return result;
}

std::optional<RunRecord> SqliteRunLog::find(const std::string& run_id) const {
  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) + " WHERE run_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, run_id);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_row(stmt.get());
  }
  return std::nullopt;
}

}  // namespace chatsan::storage::sqlite
