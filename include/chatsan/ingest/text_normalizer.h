#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chatsan::ingest {

/// Flat text plus the links carried by its entities.
struct NormalizedText {
  std::string body;
  std::vector<std::string> links;
};

/// Flattens an export's rich text into a plain string.
/// `text` may be a string or an array mixing strings and entity objects
/// ({"type": "bold", "text": "..."}); `entities` is the optional parallel
/// text_entities array. When `text` is empty the entities supply the body.
/// Links are taken from "link" entities (their text) and "text_link" entities
/// (their href), deduplicated in first-seen order.
[[nodiscard]] NormalizedText normalize_text(const nlohmann::json& text,
                                            const nlohmann::json& entities);

}  // namespace chatsan::ingest
