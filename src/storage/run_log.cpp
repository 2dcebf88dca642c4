#include "chatsan/storage/run_log.h"

#include <algorithm>

namespace chatsan::storage {

core::Result<bool, std::string> InMemoryRunLog::append(const RunRecord& record) {
  if (record.run_id.empty()) {
    return core::Result<bool, std::string>::err("run record has no run_id");
  }
  if (find(record.run_id).has_value()) {
    return core::Result<bool, std::string>::err("duplicate run_id: " + record.run_id);
  }
  records_.push_back(record);
  return core::Result<bool, std::string>::ok(true);
}

std::vector<RunRecord> InMemoryRunLog::list_all() const {
  return records_;
}

std::optional<RunRecord> InMemoryRunLog::find(const std::string& run_id) const {
  const auto it = std::find_if(records_.begin(), records_.end(),
                               [&run_id](const RunRecord& r) { return r.run_id == run_id; });
  if (it == records_.end()) {
    return std::nullopt;
  }
  return *it;
}

}  // namespace chatsan::storage
