#include "chatsan/analysis/builtin_plugins.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <map>

namespace chatsan::analysis {

namespace {

constexpr std::size_t kDefaultTopSenders = 10;

bool is_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

std::size_t param_as_size(const AnalysisRequest& request, const std::string& key,
                          const std::size_t fallback) {
  const auto it = request.params.find(key);
  if (it == request.params.end()) {
    return fallback;
  }
  std::size_t value = 0;
  const auto* end = it->second.data() + it->second.size();
  const auto [ptr, ec] = std::from_chars(it->second.data(), end, value);
  return (ec == std::errc() && ptr == end && value > 0) ? value : fallback;
}

}  // namespace

std::optional<TextLine> parse_text_line(std::string_view line) {
  std::size_t indent = 0;
  while (indent < line.size() && line[indent] == ' ') {
    ++indent;
  }
  // Message lines are indented by whole levels of two spaces.
  if (indent % 2 != 0) {
    return std::nullopt;
  }
  line.remove_prefix(indent);
  if (line.empty() || line.front() == '|') {
    return std::nullopt;
  }

  TextLine out;
  // Optional "HH:MM " prefix
  if (line.size() >= 6 && is_digit(line[0]) && is_digit(line[1]) && line[2] == ':' &&
      is_digit(line[3]) && is_digit(line[4]) && line[5] == ' ') {
    out.time = std::string(line.substr(0, 5));
    line.remove_prefix(6);
  }
  const auto separator = line.find(": ");
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  out.sender = std::string(line.substr(0, separator));
  out.body = std::string(line.substr(separator + 2));
  out.depth = indent / 2;
  if (out.sender.empty()) {
    return std::nullopt;
  }
  return out;
}

std::vector<TextLine> parse_text_projection(const std::string_view text) {
  std::vector<TextLine> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    if (auto parsed = parse_text_line(text.substr(start, end - start))) {
      lines.push_back(std::move(*parsed));
    }
    start = end + 1;
  }
  return lines;
}

AnalysisResult ParticipantActivityPlugin::analyze(const AnalysisRequest& request) const {
  const auto lines = parse_text_projection(request.chat_text);

  std::map<std::string, std::size_t> counts;
  for (const auto& line : lines) {
    ++counts[line.sender];
  }
  std::vector<std::pair<std::string, std::size_t>> ranked(counts.begin(), counts.end());
  // Most active first; the map already gives name order for ties.
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });

  const std::size_t top = param_as_size(request, "top", kDefaultTopSenders);
  if (ranked.size() > top) {
    ranked.resize(top);
  }

  AnalysisResult result;
  result.format = "markdown";
  result.result = "| Sender | Messages |\n|---|---|\n";
  for (const auto& [sender, count] : ranked) {
    result.result += "| " + sender + " | " + std::to_string(count) + " |\n";
  }
  result.metadata["total_messages"] = std::to_string(lines.size());
  result.metadata["participants"] = std::to_string(counts.size());
  return result;
}

AnalysisResult HourlyTimelinePlugin::analyze(const AnalysisRequest& request) const {
  const auto lines = parse_text_projection(request.chat_text);

  std::array<std::size_t, 24> per_hour{};
  std::size_t timed = 0;
  for (const auto& line : lines) {
    if (line.time.empty()) {
      continue;
    }
    ++timed;
    const int hour = (line.time[0] - '0') * 10 + (line.time[1] - '0');
    if (hour >= 0 && hour < 24) {
      ++per_hour[static_cast<std::size_t>(hour)];
    }
  }

  AnalysisResult result;
  result.format = "markdown";
  result.result = "| Hour (UTC) | Messages |\n|---|---|\n";
  std::size_t busiest = 0;
  for (std::size_t hour = 0; hour < per_hour.size(); ++hour) {
    if (per_hour[hour] == 0) {
      continue;
    }
    const std::string label = (hour < 10 ? "0" : "") + std::to_string(hour) + ":00";
    result.result += "| " + label + " | " + std::to_string(per_hour[hour]) + " |\n";
    if (per_hour[hour] > per_hour[busiest]) {
      busiest = hour;
    }
  }
  result.metadata["total_messages"] = std::to_string(timed);
  if (timed > 0) {
    result.metadata["busiest_hour"] = std::to_string(busiest);
  }
  return result;
}

}  // namespace chatsan::analysis
