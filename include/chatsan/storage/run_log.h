#pragma once

#include "chatsan/core/result.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chatsan::storage {

// RunRecord is the audit entry for one sanitization of one export.
// It never carries message content or real participant identities.
struct RunRecord {
  std::string run_id;
  std::string input_path;
  std::string chat_name;
  std::string policy;  // "privacy/2"
  std::string format;  // "text"
  std::optional<std::string> output_path;
  std::string status;  // "ok" or "failed"
  std::optional<std::string> error;
  std::size_t message_count{0};
  std::size_t orphan_count{0};
  std::size_t collision_count{0};
  std::size_t skipped_count{0};
  std::vector<std::string> warnings;
  std::string created_at;
};

class IRunLog {
 public:
  virtual ~IRunLog() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> append(const RunRecord& record) = 0;

  // All records in append order.
  [[nodiscard]] virtual std::vector<RunRecord> list_all() const = 0;

  [[nodiscard]] virtual std::optional<RunRecord> find(const std::string& run_id) const = 0;
};

class InMemoryRunLog final : public IRunLog {
 public:
  [[nodiscard]] core::Result<bool, std::string> append(const RunRecord& record) override;
  [[nodiscard]] std::vector<RunRecord> list_all() const override;
  [[nodiscard]] std::optional<RunRecord> find(const std::string& run_id) const override;

 private:
  std::vector<RunRecord> records_;
};

}  // namespace chatsan::storage
