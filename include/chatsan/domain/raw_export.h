#pragma once

#include "chatsan/domain/message.h"
#include "chatsan/domain/notices.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatsan::domain {

struct ChatMetadata {
  std::string name;
  std::string type;  // "personal_chat", "private_group", "public_channel", ...
  std::string id;
  std::optional<std::int64_t> date_from;  // earliest message timestamp
  std::optional<std::int64_t> date_to;    // latest message timestamp
};

// RawExport is the validated, normalized result of loading one export document.
// Records keep ingestion order. Records that could not be normalized are listed
// in skipped_records instead of failing the whole load.
struct RawExport {
  ChatMetadata chat;
  std::vector<RawMessageRecord> records;
  std::vector<SkippedRecordNotice> skipped_records;
  std::optional<std::string> encoding_fallback;  // e.g. "utf-16le" when not UTF-8
};

}  // namespace chatsan::domain
