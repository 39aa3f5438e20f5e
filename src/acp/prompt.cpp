#include "acp/prompt.hpp"

namespace piacp::acp {

namespace {

std::string string_or(const json& obj, const char* key, const std::string& fallback) {
  if (obj.is_object()) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return fallback;
}

void append_resource(std::string& message, const json& resource) {
  std::string uri = string_or(resource, "uri", "(unknown)");

  if (resource.is_object() && resource.contains("text") && resource["text"].is_string()) {
    std::string mime = string_or(resource, "mimeType", "text/plain");
    message += "\n[Embedded Context] " + uri + " (" + mime + ")\n" + resource["text"].get<std::string>();
  } else if (resource.is_object() && resource.contains("blob") && resource["blob"].is_string()) {
    std::string mime = string_or(resource, "mimeType", "application/octet-stream");
    auto bytes = base64_decoded_size(resource["blob"].get<std::string>());
    message += "\n[Embedded Context] " + uri + " (" + mime + ", " + std::to_string(bytes) + " bytes)";
  } else {
    message += "\n[Embedded Context] " + uri;
  }
}

}  // namespace

size_t base64_decoded_size(const std::string& data) {
  size_t len = data.size();
  if (len > 0 && data[len - 1] == '=') --len;
  if (len > 1 && data[len - 1] == '=') --len;
  return (len * 3) / 4;
}

PiPrompt prompt_to_pi_message(const json& blocks) {
  PiPrompt out;
  if (!blocks.is_array()) {
    return out;
  }

  for (const auto& block : blocks) {
    if (!block.is_object()) continue;
    auto type = string_or(block, "type", "");

    if (type == "text") {
      out.message += string_or(block, "text", "");
    } else if (type == "resource_link") {
      out.message += "\n[Context] " + string_or(block, "uri", "");
    } else if (type == "image") {
      out.images.push_back({string_or(block, "mimeType", ""), string_or(block, "data", "")});
    } else if (type == "resource") {
      append_resource(out.message, block.value("resource", json(nullptr)));
    } else if (type == "audio") {
      auto bytes = base64_decoded_size(string_or(block, "data", ""));
      out.message += "\n[Audio] (" + string_or(block, "mimeType", "") + ", " + std::to_string(bytes) + " bytes) not supported by pi-acp";
    }
  }

  return out;
}

}  // namespace piacp::acp
