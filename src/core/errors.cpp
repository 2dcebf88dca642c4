#include "chatsan/core/errors.h"

namespace chatsan::core {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
    case ErrorCode::kSchemaError:
      return "SchemaError";
    case ErrorCode::kEncodingError:
      return "EncodingError";
    case ErrorCode::kInvalidPolicyError:
      return "InvalidPolicyError";
    case ErrorCode::kUnsupportedFormatError:
      return "UnsupportedFormatError";
  }
  return "UnknownError";
}

std::string describe(const EngineError& error) {
  std::string out{error_code_name(error.code)};
  out += ": ";
  out += error.message;

  if (!error.chat_name.empty() || error.message_id.has_value()) {
    out += " (";
    if (!error.chat_name.empty()) {
      out += "chat '" + error.chat_name + "'";
    }
    if (error.message_id.has_value()) {
      if (!error.chat_name.empty()) {
        out += ", ";
      }
      out += "message " + std::to_string(error.message_id.value());
    }
    out += ")";
  }
  return out;
}

}  // namespace chatsan::core
