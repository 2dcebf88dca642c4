#include "chatsan/ingest/text_normalizer.h"

#include <algorithm>

namespace chatsan::ingest {

namespace {

std::string entity_text(const nlohmann::json& entity) {
  if (entity.is_string()) {
    return entity.get<std::string>();
  }
  if (entity.is_object()) {
    const auto it = entity.find("text");
    if (it != entity.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return {};
}

void collect_link(const nlohmann::json& entity, std::vector<std::string>& links) {
  if (!entity.is_object()) {
    return;
  }
  const auto type_it = entity.find("type");
  if (type_it == entity.end() || !type_it->is_string()) {
    return;
  }
  const auto type = type_it->get<std::string>();

  std::string link;
  if (type == "link") {
    link = entity_text(entity);
  } else if (type == "text_link") {
    const auto href = entity.find("href");
    if (href != entity.end() && href->is_string()) {
      link = href->get<std::string>();
    }
  }
  if (!link.empty() && std::find(links.begin(), links.end(), link) == links.end()) {
    links.push_back(std::move(link));
  }
}

}  // namespace

NormalizedText normalize_text(const nlohmann::json& text, const nlohmann::json& entities) {
  NormalizedText out;

  if (text.is_string()) {
    out.body = text.get<std::string>();
  } else if (text.is_array()) {
    for (const auto& part : text) {
      out.body += entity_text(part);
    }
  }

  const bool has_entities = entities.is_array() && !entities.empty();
  if (out.body.empty() && has_entities) {
    for (const auto& entity : entities) {
      out.body += entity_text(entity);
    }
  }

  // Entities and inline text parts describe the same spans; prefer the
  // dedicated array and fall back to the inline objects.
  if (has_entities) {
    for (const auto& entity : entities) {
      collect_link(entity, out.links);
    }
  } else if (text.is_array()) {
    for (const auto& part : text) {
      collect_link(part, out.links);
    }
  }

  return out;
}

}  // namespace chatsan::ingest
