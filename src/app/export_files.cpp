#include "chatsan/app/export_files.h"

#include "chatsan/core/text.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace chatsan::app {

core::Result<std::string, std::string> read_export_file(
    const std::filesystem::path& path) {
  using R = core::Result<std::string, std::string>;

  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return R::err("Failed to stat file: " + path.string() + ": " + ec.message());
  }
  if (size > kMaxExportBytes) {
    return R::err("File too large (" + std::to_string(size) + " bytes): " + path.string());
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return R::err("Failed to open file: " + path.string());
  }
  std::string data(static_cast<std::size_t>(size), '\0');
  if (!data.empty() && !file.read(data.data(), static_cast<std::streamsize>(size))) {
    return R::err("Failed to read file: " + path.string());
  }
  return R::ok(std::move(data));
}

core::Result<std::vector<std::filesystem::path>, std::string> list_export_files(
    const std::filesystem::path& directory) {
  using R = core::Result<std::vector<std::filesystem::path>, std::string>;

  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    return R::err("Failed to list directory " + directory.string() + ": " + ec.message());
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    if (core::normalize_ascii_lower(entry.path().extension().string()) == ".json") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return R::ok(std::move(files));
}

}  // namespace chatsan::app
