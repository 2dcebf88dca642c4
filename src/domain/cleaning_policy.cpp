#include "chatsan/domain/cleaning_policy.h"

#include "chatsan/core/text.h"

namespace chatsan::domain {

std::string_view approach_name(const Approach approach) {
  switch (approach) {
    case Approach::kPrivacy:
      return "privacy";
    case Approach::kSize:
      return "size";
    case Approach::kContext:
      return "context";
  }
  return "privacy";
}

std::string_view level_name(const int level) {
  switch (level) {
    case 1:
      return "basic";
    case 2:
      return "medium";
    case 3:
      return "full";
    default:
      return "unknown";
  }
}

std::string policy_label(const CleaningPolicy& policy) {
  return std::string(approach_name(policy.approach)) + "/" + std::to_string(policy.level);
}

core::Result<Approach, core::EngineError> parse_approach(const std::string_view name) {
  const std::string key = core::normalize_ascii_lower(core::trim(name));
  if (key == "privacy") {
    return core::Result<Approach, core::EngineError>::ok(Approach::kPrivacy);
  }
  if (key == "size") {
    return core::Result<Approach, core::EngineError>::ok(Approach::kSize);
  }
  if (key == "context") {
    return core::Result<Approach, core::EngineError>::ok(Approach::kContext);
  }
  return core::Result<Approach, core::EngineError>::err(core::make_error(
      core::ErrorCode::kInvalidPolicyError,
      "unknown approach '" + std::string(name) + "' (expected privacy, size or context)"));
}

core::Result<CleaningPolicy, core::EngineError> make_policy(const std::string_view approach,
                                                            const int level) {
  auto parsed = parse_approach(approach);
  if (!parsed.has_value()) {
    return core::Result<CleaningPolicy, core::EngineError>::err(parsed.error());
  }
  if (level < kMinLevel || level > kMaxLevel) {
    return core::Result<CleaningPolicy, core::EngineError>::err(
        core::make_error(core::ErrorCode::kInvalidPolicyError,
                         "level " + std::to_string(level) + " is out of range 1..3"));
  }
  return core::Result<CleaningPolicy, core::EngineError>::ok(
      CleaningPolicy{parsed.value(), level});
}

}  // namespace chatsan::domain
