#pragma once

#include "chatsan/core/errors.h"
#include "chatsan/core/result.h"

#include <string>
#include <string_view>

namespace chatsan::domain {

enum class Approach {
  kPrivacy,
  kSize,
  kContext,
};

constexpr int kMinLevel = 1;
constexpr int kMaxLevel = 3;

// CleaningPolicy is an (approach, level) pair. Construct through make_policy()
// to get validation; a hand-built policy is re-validated at lookup time.
struct CleaningPolicy {
  Approach approach{Approach::kPrivacy};
  int level{2};

  auto operator<=>(const CleaningPolicy&) const = default;
};

[[nodiscard]] std::string_view approach_name(Approach approach);

// "basic", "medium", "full"; "unknown" outside 1..3.
[[nodiscard]] std::string_view level_name(int level);

// "privacy/2"
[[nodiscard]] std::string policy_label(const CleaningPolicy& policy);

[[nodiscard]] core::Result<Approach, core::EngineError> parse_approach(std::string_view name);

// make_policy validates both axes. Approach names are case-insensitive.
[[nodiscard]] core::Result<CleaningPolicy, core::EngineError> make_policy(std::string_view approach,
                                                                          int level);

}  // namespace chatsan::domain
