#include "session/session_record.hpp"

namespace piacp {

namespace {

std::optional<std::string> optional_string(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return std::nullopt;
}

}  // namespace

SessionRecord parse_session_record(std::string_view line) {
  json obj = json::parse(sanitize_utf8(line), nullptr, false);
  if (obj.is_discarded() || !obj.is_object()) {
    return OtherRecord{};
  }

  auto type = optional_string(obj, "type").value_or("");
  auto timestamp = optional_string(obj, "timestamp");

  if (type == "session") {
    auto id = optional_string(obj, "id");
    auto cwd = optional_string(obj, "cwd");
    if (!id || id->empty() || !cwd || cwd->empty()) {
      return OtherRecord{type, timestamp};
    }
    SessionHeader header;
    header.id = *id;
    header.cwd = *cwd;
    header.timestamp = timestamp;
    if (auto it = obj.find("version"); it != obj.end() && it->is_number_integer()) {
      header.version = it->get<int>();
    }
    return header;
  }

  if (type == "message") {
    auto it = obj.find("message");
    if (it == obj.end() || !it->is_object()) {
      return OtherRecord{type, timestamp};
    }
    MessageRecord record;
    record.id = optional_string(obj, "id").value_or("");
    record.parent_id = optional_string(obj, "parentId");
    record.timestamp = timestamp;
    record.role = optional_string(*it, "role").value_or("");
    record.content = it->value("content", json(nullptr));
    return record;
  }

  if (type == "session_info") {
    auto name = optional_string(obj, "name");
    if (!name) {
      return OtherRecord{type, timestamp};
    }
    SessionInfoRecord record;
    record.id = optional_string(obj, "id").value_or("");
    record.parent_id = optional_string(obj, "parentId");
    record.timestamp = timestamp;
    record.name = trim(*name);
    return record;
  }

  return OtherRecord{type, timestamp};
}

std::optional<std::string> record_timestamp(const SessionRecord& record) {
  return std::visit([](const auto& r) -> std::optional<std::string> { return r.timestamp; }, record);
}

std::optional<std::string> first_text(const json& content) {
  if (content.is_string()) {
    return content.get<std::string>();
  }
  if (content.is_array()) {
    for (const auto& block : content) {
      if (block.is_object() && block.value("type", "") == "text") {
        auto it = block.find("text");
        if (it != block.end() && it->is_string()) {
          return it->get<std::string>();
        }
      }
    }
  }
  return std::nullopt;
}

}  // namespace piacp
