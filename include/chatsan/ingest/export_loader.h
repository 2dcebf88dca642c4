#pragma once

#include "chatsan/core/errors.h"
#include "chatsan/core/result.h"
#include "chatsan/domain/raw_export.h"

#include <string_view>

namespace chatsan::ingest {

/// Options for export loading
struct LoadOptions {
  bool allow_utf16_fallback{true};  // Decode UTF-16 input when it carries a byte order mark
};

using LoadResult = core::Result<domain::RawExport, core::EngineError>;

/// ExportLoader validates one chat-export document and normalizes its records.
///
/// Structural problems with the document itself are fatal (SchemaError,
/// EncodingError). Problems confined to a single record (no integer id, no
/// usable timestamp) skip that record with a SkippedRecordNotice.
class ExportLoader {
 public:
  explicit ExportLoader(LoadOptions options = {}) : options_(options) {}

  [[nodiscard]] LoadResult load(std::string_view bytes) const;

 private:
  LoadOptions options_;
};

}  // namespace chatsan::ingest
