#include "chatsan/storage/output_store.h"

#include "chatsan/core/text.h"
#include "chatsan/core/time_format.h"

#include <fstream>
#include <system_error>

namespace chatsan::storage {

namespace {

// Returns the first of name, name_2, name_3, ... for which `taken` is false.
template <typename Taken>
std::string first_free_name(const OutputTarget& target, Taken taken) {
  const std::string base = make_output_filename(target);
  if (!taken(base)) {
    return base;
  }
  const std::string ext(output::file_extension(target.format));
  const std::string stem = base.substr(0, base.size() - ext.size());
  for (int suffix = 2;; ++suffix) {
    std::string candidate = stem + "_" + std::to_string(suffix) + ext;
    if (!taken(candidate)) {
      return candidate;
    }
  }
}

}  // namespace

std::string make_output_filename(const OutputTarget& target) {
  return core::clean_filename(target.chat_name) + "_" +
         std::string(domain::approach_name(target.policy.approach)) + "_" +
         std::string(domain::level_name(target.policy.level)) + "_" +
         core::format_compact(target.generated_at) +
         std::string(output::file_extension(target.format));
}

FileOutputStore::FileOutputStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

core::Result<std::filesystem::path, std::string> FileOutputStore::write(
    const OutputTarget& target, const std::string_view content) {
  using R = core::Result<std::filesystem::path, std::string>;
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    return R::err("Failed to create output directory " + directory_.string() + ": " +
                  ec.message());
  }

  const std::string name = first_free_name(target, [this](const std::string& candidate) {
    std::error_code exists_ec;
    return std::filesystem::exists(directory_ / candidate, exists_ec);
  });
  const std::filesystem::path path = directory_ / name;

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return R::err("Failed to open output file: " + path.string());
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    return R::err("Failed to write output file: " + path.string());
  }
  return R::ok(path);
}

core::Result<std::filesystem::path, std::string> InMemoryOutputStore::write(
    const OutputTarget& target, const std::string_view content) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string name = first_free_name(
      target, [this](const std::string& candidate) { return files_.count(candidate) != 0; });
  files_.emplace(name, std::string(content));
  return core::Result<std::filesystem::path, std::string>::ok(std::filesystem::path(name));
}

std::map<std::string, std::string> InMemoryOutputStore::files() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_;
}

}  // namespace chatsan::storage
