#pragma once

#include "chatsan/analysis/analysis_plugin.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatsan::analysis {

// One message line of the text projection: "HH:MM sender: body", or
// "sender: body" for policies that leave the clock out.
struct TextLine {
  std::string time;  // empty when the line has no clock
  std::string sender;
  std::string body;
  std::size_t depth{0};
};

// Parses a text projection line; continuation lines ("| ..." after the
// indent) and blanks yield nullopt.
[[nodiscard]] std::optional<TextLine> parse_text_line(std::string_view line);

[[nodiscard]] std::vector<TextLine> parse_text_projection(std::string_view text);

// Messages per sender as a markdown table. Param "top" caps the rows (default 10).
class ParticipantActivityPlugin final : public IAnalysisPlugin {
 public:
  [[nodiscard]] std::string_view name() const override { return "participant_activity"; }
  [[nodiscard]] std::string_view description() const override {
    return "Message counts per sender";
  }
  [[nodiscard]] AnalysisResult analyze(const AnalysisRequest& request) const override;
};

// Messages per hour of day (UTC) as a markdown table. Lines without a clock
// are not counted.
class HourlyTimelinePlugin final : public IAnalysisPlugin {
 public:
  [[nodiscard]] std::string_view name() const override { return "hourly_timeline"; }
  [[nodiscard]] std::string_view description() const override {
    return "Message counts per hour of day";
  }
  [[nodiscard]] AnalysisResult analyze(const AnalysisRequest& request) const override;
};

}  // namespace chatsan::analysis
