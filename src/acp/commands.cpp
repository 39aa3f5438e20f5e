#include "acp/commands.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <map>

namespace piacp::acp {

namespace fs = std::filesystem;

namespace {

constexpr size_t kDescriptionMaxChars = 80;

// Frontmatter `description:` wins, else the first non-empty line without leading '#'
std::string describe_template(const fs::path& file) {
  std::ifstream in(file);
  std::string line;
  bool in_frontmatter = false;
  bool seen_content = false;
  while (std::getline(in, line)) {
    auto text = trim(line);
    if (text.empty()) continue;

    if (!seen_content && !in_frontmatter && text == "---") {
      in_frontmatter = true;
      continue;
    }
    if (in_frontmatter) {
      if (text == "---") {
        in_frontmatter = false;
      } else if (text.rfind("description:", 0) == 0) {
        auto value = trim(std::string_view(text).substr(12));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
          value = value.substr(1, value.size() - 2);
        }
        if (!value.empty()) return truncate_utf8(value, kDescriptionMaxChars);
      }
      continue;
    }
    seen_content = true;
    if (text.front() == '#') {
      auto start = text.find_first_not_of('#');
      if (start == std::string::npos) continue;
      text = trim(std::string_view(text).substr(start));
      if (text.empty()) continue;
    }
    return truncate_utf8(text, kDescriptionMaxChars);
  }
  return "Prompt template";
}

void scan_prompt_dir(const fs::path& dir, std::map<std::string, AvailableCommand>& out) {
  std::error_code ec;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || it->path().extension() != ".md") continue;

    AvailableCommand command;
    command.name = it->path().stem().string();
    command.description = describe_template(it->path());
    command.input_hint = "arguments";
    out[command.name] = std::move(command);
  }
}

}  // namespace

json AvailableCommand::to_json() const {
  json j = {{"name", name}, {"description", description}};
  if (input_hint) {
    j["input"] = {{"hint", *input_hint}};
  }
  return j;
}

std::vector<AvailableCommand> builtin_commands() {
  return {
      {"steering", "Show the current steering mode", std::nullopt},
      {"name", "Set the session display name", "<name>"},
  };
}

std::vector<AvailableCommand> load_file_commands(const fs::path& agent_dir, const fs::path& cwd) {
  std::map<std::string, AvailableCommand> by_name;
  scan_prompt_dir(agent_dir / "prompts", by_name);
  if (!cwd.empty()) {
    scan_prompt_dir(cwd / ".pi" / "prompts", by_name);
  }

  std::vector<AvailableCommand> commands;
  for (auto& [name, command] : by_name) {
    bool shadows_builtin = name == "steering" || name == "name";
    if (shadows_builtin) {
      spdlog::debug("[bridge] prompt template /{} hidden by builtin command", name);
      continue;
    }
    commands.push_back(std::move(command));
  }
  return commands;
}

json commands_to_json(const std::vector<AvailableCommand>& commands) {
  json list = json::array();
  for (const auto& command : commands) {
    list.push_back(command.to_json());
  }
  return list;
}

std::optional<SlashCommand> parse_slash_command(const json& blocks) {
  if (!blocks.is_array() || blocks.empty()) {
    return std::nullopt;
  }
  const auto& first = blocks.front();
  if (!first.is_object() || first.value("type", "") != "text" || !first.contains("text") || !first["text"].is_string()) {
    return std::nullopt;
  }

  auto text = trim(first["text"].get<std::string>());
  if (text.size() < 2 || text.front() != '/') {
    return std::nullopt;
  }

  auto end = text.find_first_of(" \t\r\n", 1);
  SlashCommand command;
  command.name = text.substr(1, end == std::string::npos ? std::string::npos : end - 1);
  command.args = end == std::string::npos ? "" : trim(std::string_view(text).substr(end));
  return command;
}

}  // namespace piacp::acp
