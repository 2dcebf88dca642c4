#pragma once

#include "chatsan/storage/run_log.h"
#include "chatsan/storage/sqlite/sqlite_db.h"

#include <memory>

namespace chatsan::storage::sqlite {

// SqliteRunLog persists run records to the run_log table (schema v1).
// Call SqliteDb::ensure_schema_v1() before use.
class SqliteRunLog final : public IRunLog {
 public:
  explicit SqliteRunLog(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> append(const RunRecord& record) override;
  [[nodiscard]] std::vector<RunRecord> list_all() const override;
  [[nodiscard]] std::optional<RunRecord> find(const std::string& run_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace chatsan::storage::sqlite
