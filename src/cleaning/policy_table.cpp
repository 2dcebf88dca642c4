#include "chatsan/cleaning/policy_table.h"

#include <algorithm>

namespace chatsan::cleaning {

namespace {

using domain::Approach;

std::vector<PolicySpec> build_table() {
  constexpr auto kChrono = StructureMode::kChronological;
  constexpr auto kThreaded = StructureMode::kThreaded;

  // Every level starts from the base columns.
  const std::vector<Field> base = {Field::kId, Field::kTimestamp, Field::kSender, Field::kText};

  auto with = [](std::vector<Field> fields, std::initializer_list<Field> extra) {
    fields.insert(fields.end(), extra.begin(), extra.end());
    std::sort(fields.begin(), fields.end());
    fields.erase(std::unique(fields.begin(), fields.end()), fields.end());
    return fields;
  };

  const auto privacy2 = with(base, {Field::kReplyTo, Field::kDepth});
  const auto privacy3 =
      with(privacy2, {Field::kSenderId, Field::kKind, Field::kLinks, Field::kEdited,
                      Field::kForwardedFrom, Field::kMediaDetail, Field::kReactionDetail});

  const auto size2 = with(base, {Field::kLinks});
  const auto size3 = with(size2, {Field::kKind, Field::kEdited, Field::kMediaSummary,
                                  Field::kReactionSummary});

  const auto context2 = with(base, {Field::kReplyTo, Field::kDepth});
  const auto context3 =
      with(context2, {Field::kSenderId, Field::kKind, Field::kEdited, Field::kForwardedFrom,
                      Field::kMediaDetail, Field::kReactionDetail, Field::kReplies});

  return {
      PolicySpec{{Approach::kPrivacy, 1}, base, kChrono, true, false, false},
      PolicySpec{{Approach::kPrivacy, 2}, privacy2, kThreaded, true, false, true},
      PolicySpec{{Approach::kPrivacy, 3}, privacy3, kThreaded, false, false, true},
      PolicySpec{{Approach::kSize, 1}, base, kChrono, false, false, true},
      PolicySpec{{Approach::kSize, 2}, size2, kChrono, false, false, true},
      PolicySpec{{Approach::kSize, 3}, size3, kChrono, false, false, true},
      PolicySpec{{Approach::kContext, 1}, base, kChrono, false, false, true},
      PolicySpec{{Approach::kContext, 2}, context2, kThreaded, false, false, true},
      PolicySpec{{Approach::kContext, 3}, context3, kThreaded, false, true, true},
  };
}

}  // namespace

std::string_view field_key(const Field field) {
  switch (field) {
    case Field::kId:
      return "id";
    case Field::kTimestamp:
      return "timestamp";
    case Field::kSender:
      return "sender";
    case Field::kSenderId:
      return "sender_id";
    case Field::kKind:
      return "kind";
    case Field::kText:
      return "text";
    case Field::kLinks:
      return "links";
    case Field::kReplyTo:
      return "reply_to";
    case Field::kDepth:
      return "depth";
    case Field::kEdited:
      return "edited";
    case Field::kForwardedFrom:
      return "forwarded_from";
    case Field::kMediaSummary:
    case Field::kMediaDetail:
      return "media";
    case Field::kReactionSummary:
    case Field::kReactionDetail:
      return "reactions";
    case Field::kReplies:
      return "replies";
  }
  return "";
}

bool is_nested(const Field field) {
  return field == Field::kMediaDetail || field == Field::kReactionDetail ||
         field == Field::kReplies;
}

std::string_view structure_name(const StructureMode mode) {
  return mode == StructureMode::kThreaded ? "threaded" : "chronological";
}

bool PolicySpec::has(const Field field) const {
  return std::find(fields.begin(), fields.end(), field) != fields.end();
}

bool PolicySpec::has_key(const std::string_view key) const {
  return std::any_of(fields.begin(), fields.end(),
                     [key](const Field f) { return field_key(f) == key; });
}

std::vector<std::string> PolicySpec::keys() const {
  std::vector<std::string> out;
  out.reserve(fields.size());
  for (const Field f : fields) {
    out.emplace_back(field_key(f));
  }
  return out;
}

bool PolicySpec::is_flat() const {
  return std::none_of(fields.begin(), fields.end(), is_nested);
}

const std::vector<PolicySpec>& policy_table() {
  static const std::vector<PolicySpec> kTable = build_table();
  return kTable;
}

core::Result<PolicySpec, core::EngineError> lookup_policy(const domain::CleaningPolicy& policy) {
  for (const auto& spec : policy_table()) {
    if (spec.policy == policy) {
      return core::Result<PolicySpec, core::EngineError>::ok(spec);
    }
  }
  return core::Result<PolicySpec, core::EngineError>::err(core::make_error(
      core::ErrorCode::kInvalidPolicyError,
      "no cleaning policy for " + domain::policy_label(policy) + " (levels are 1..3)"));
}

}  // namespace chatsan::cleaning
