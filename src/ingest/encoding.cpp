#include "chatsan/ingest/encoding.h"

#include <cstdint>

namespace chatsan::ingest {

namespace {

void append_utf8(std::string& out, const std::uint32_t cp) {
  if (cp < 0x80u) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800u) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6u)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp < 0x10000u) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

core::Result<std::string, std::string> decode_utf16(const std::string_view bytes,
                                                    const bool little_endian) {
  using R = core::Result<std::string, std::string>;
  if (bytes.size() % 2u != 0u) {
    return R::err("odd byte count in UTF-16 input");
  }

  auto unit_at = [&](const std::size_t i) -> std::uint32_t {
    const auto b0 = static_cast<std::uint8_t>(bytes[i]);
    const auto b1 = static_cast<std::uint8_t>(bytes[i + 1]);
    return little_endian ? (static_cast<std::uint32_t>(b1) << 8u) | b0
                         : (static_cast<std::uint32_t>(b0) << 8u) | b1;
  };

  std::string out;
  out.reserve(bytes.size());
  std::size_t i = 0;
  while (i < bytes.size()) {
    const std::uint32_t unit = unit_at(i);
    i += 2;
    if (unit >= 0xD800u && unit <= 0xDBFFu) {
      if (i >= bytes.size()) {
        return R::err("truncated surrogate pair at byte " + std::to_string(i - 2));
      }
      const std::uint32_t low = unit_at(i);
      if (low < 0xDC00u || low > 0xDFFFu) {
        return R::err("unpaired high surrogate at byte " + std::to_string(i - 2));
      }
      i += 2;
      append_utf8(out, 0x10000u + ((unit - 0xD800u) << 10u) + (low - 0xDC00u));
    } else if (unit >= 0xDC00u && unit <= 0xDFFFu) {
      return R::err("unpaired low surrogate at byte " + std::to_string(i - 2));
    } else {
      append_utf8(out, unit);
    }
  }
  return R::ok(std::move(out));
}

// Returns the offset of the first invalid byte, or bytes.size() when valid.
std::size_t first_invalid_utf8(const std::string_view bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto b0 = static_cast<std::uint8_t>(bytes[i]);
    if (b0 < 0x80u) {
      ++i;
      continue;
    }

    std::size_t len = 0;
    std::uint32_t cp = 0;
    std::uint32_t min_cp = 0;
    if ((b0 & 0xE0u) == 0xC0u) {
      len = 2;
      cp = b0 & 0x1Fu;
      min_cp = 0x80u;
    } else if ((b0 & 0xF0u) == 0xE0u) {
      len = 3;
      cp = b0 & 0x0Fu;
      min_cp = 0x800u;
    } else if ((b0 & 0xF8u) == 0xF0u) {
      len = 4;
      cp = b0 & 0x07u;
      min_cp = 0x10000u;
    } else {
      return i;
    }
    if (i + len > bytes.size()) {
      return i;
    }
    for (std::size_t k = 1; k < len; ++k) {
      const auto b = static_cast<std::uint8_t>(bytes[i + k]);
      if ((b & 0xC0u) != 0x80u) {
        return i;
      }
      cp = (cp << 6u) | (b & 0x3Fu);
    }
    if (cp < min_cp || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) {
      return i;
    }
    i += len;
  }
  return bytes.size();
}

}  // namespace

std::string_view encoding_name(const SourceEncoding encoding) {
  switch (encoding) {
    case SourceEncoding::kUtf8:
      return "utf-8";
    case SourceEncoding::kUtf16LE:
      return "utf-16le";
    case SourceEncoding::kUtf16BE:
      return "utf-16be";
  }
  return "utf-8";
}

bool is_valid_utf8(const std::string_view bytes) {
  return first_invalid_utf8(bytes) == bytes.size();
}

core::Result<DecodedText, std::string> decode_to_utf8(std::string_view bytes,
                                                      const bool allow_utf16) {
  using R = core::Result<DecodedText, std::string>;

  if (bytes.size() >= 3 && static_cast<std::uint8_t>(bytes[0]) == 0xEFu &&
      static_cast<std::uint8_t>(bytes[1]) == 0xBBu && static_cast<std::uint8_t>(bytes[2]) == 0xBFu) {
    bytes.remove_prefix(3);
  } else if (bytes.size() >= 2) {
    const auto b0 = static_cast<std::uint8_t>(bytes[0]);
    const auto b1 = static_cast<std::uint8_t>(bytes[1]);
    const bool le_bom = b0 == 0xFFu && b1 == 0xFEu;
    const bool be_bom = b0 == 0xFEu && b1 == 0xFFu;
    if (le_bom || be_bom) {
      if (!allow_utf16) {
        return R::err("UTF-16 input is not accepted");
      }
      auto decoded = decode_utf16(bytes.substr(2), le_bom);
      if (!decoded.has_value()) {
        return R::err(decoded.error());
      }
      return R::ok(DecodedText{std::move(decoded).value(),
                               le_bom ? SourceEncoding::kUtf16LE : SourceEncoding::kUtf16BE});
    }
  }

  const std::size_t bad = first_invalid_utf8(bytes);
  if (bad != bytes.size()) {
    return R::err("invalid UTF-8 sequence at byte " + std::to_string(bad));
  }
  return R::ok(DecodedText{std::string(bytes), SourceEncoding::kUtf8});
}

}  // namespace chatsan::ingest
