#pragma once

#include "chatsan/core/result.h"

#include <optional>
#include <string>
#include <string_view>

namespace chatsan::ingest {

enum class SourceEncoding {
  kUtf8,
  kUtf16LE,
  kUtf16BE,
};

/// Name used in the encoding-fallback notice ("utf-8", "utf-16le", "utf-16be")
[[nodiscard]] std::string_view encoding_name(SourceEncoding encoding);

struct DecodedText {
  std::string utf8;
  SourceEncoding source{SourceEncoding::kUtf8};
};

/// Strict UTF-8 validation: rejects overlong forms, surrogates and code points above U+10FFFF.
[[nodiscard]] bool is_valid_utf8(std::string_view bytes);

/// Decodes export bytes into UTF-8.
/// - A UTF-8 byte order mark is stripped.
/// - A UTF-16 byte order mark selects UTF-16 decoding when allow_utf16 is set.
/// - Anything else must already be valid UTF-8.
/// The error string describes the first undecodable position.
[[nodiscard]] core::Result<DecodedText, std::string> decode_to_utf8(std::string_view bytes,
                                                                    bool allow_utf16);

}  // namespace chatsan::ingest
