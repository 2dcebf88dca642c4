#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chatsan::core {

// Fatal error taxonomy of the sanitization engine.
// Non-fatal conditions (orphan replies, pseudonym collisions, skipped records)
// are notices carried in document metadata, not errors.
enum class ErrorCode {
  kSchemaError,             // malformed export structure
  kEncodingError,           // undecodable byte content
  kInvalidPolicyError,      // unknown approach or level
  kUnsupportedFormatError,  // output format incompatible with policy shape
};

// EngineError carries enough context for a caller to present a message without
// the engine doing any logging or UI itself.
struct EngineError {
  ErrorCode code{ErrorCode::kSchemaError};
  std::string message;
  std::string chat_name;                   // empty when not yet known
  std::optional<std::int64_t> message_id;  // offending record, when applicable
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);

// describe renders "SchemaError: <message> (chat 'X', message 42)".
[[nodiscard]] std::string describe(const EngineError& error);

inline EngineError make_error(ErrorCode code, std::string message,
                              std::string chat_name = {},
                              std::optional<std::int64_t> message_id = std::nullopt) {
  return EngineError{code, std::move(message), std::move(chat_name), message_id};
}

}  // namespace chatsan::core
