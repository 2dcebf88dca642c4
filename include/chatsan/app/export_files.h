#pragma once

#include "chatsan/core/result.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chatsan::app {

/// Exports larger than this are refused before reading.
constexpr std::uintmax_t kMaxExportBytes = 100u * 1024u * 1024u;

/// Read an export file into memory. The bytes are returned undecoded.
[[nodiscard]] core::Result<std::string, std::string> read_export_file(
    const std::filesystem::path& path);

/// List the *.json files of a directory (non-recursive), sorted by path.
[[nodiscard]] core::Result<std::vector<std::filesystem::path>, std::string> list_export_files(
    const std::filesystem::path& directory);

}  // namespace chatsan::app
