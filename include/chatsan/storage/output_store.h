#pragma once

#include "chatsan/core/result.h"
#include "chatsan/domain/cleaning_policy.h"
#include "chatsan/output/output_format.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace chatsan::storage {

// OutputTarget names one rendered artifact.
struct OutputTarget {
  std::string chat_name;
  domain::CleaningPolicy policy;
  output::OutputFormat format{output::OutputFormat::kText};
  std::int64_t generated_at{0};  // unix seconds
};

// <clean_chat_name>_<approach>_<basic|medium|full>_<YYYYmmdd_HHMMSS><ext>
[[nodiscard]] std::string make_output_filename(const OutputTarget& target);

class IOutputStore {
 public:
  virtual ~IOutputStore() = default;

  // Writes content and returns the path it landed at. Never overwrites: a name
  // already taken gets a "_2", "_3", ... suffix before the extension.
  [[nodiscard]] virtual core::Result<std::filesystem::path, std::string> write(
      const OutputTarget& target, std::string_view content) = 0;
};

// Writes into a directory, creating it on first use. Thread-safe.
class FileOutputStore final : public IOutputStore {
 public:
  explicit FileOutputStore(std::filesystem::path directory);

  [[nodiscard]] core::Result<std::filesystem::path, std::string> write(
      const OutputTarget& target, std::string_view content) override;

  [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

 private:
  std::filesystem::path directory_;
  std::mutex mutex_;
};

// Keeps artifacts in memory; for tests and dry runs. Thread-safe.
class InMemoryOutputStore final : public IOutputStore {
 public:
  [[nodiscard]] core::Result<std::filesystem::path, std::string> write(
      const OutputTarget& target, std::string_view content) override;

  [[nodiscard]] std::map<std::string, std::string> files() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> files_;
};

}  // namespace chatsan::storage
