#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace piacp::acp {

// Entry of an available_commands_update
struct AvailableCommand {
  std::string name;
  std::string description;
  std::optional<std::string> input_hint;

  json to_json() const;
};

// Commands answered by the bridge itself: /steering, /name
std::vector<AvailableCommand> builtin_commands();

// Prompt templates: <agent_dir>/prompts/*.md, then <cwd>/.pi/prompts/*.md.
// A project template replaces a global one with the same name. Sorted by name.
std::vector<AvailableCommand> load_file_commands(const std::filesystem::path& agent_dir, const std::filesystem::path& cwd);

json commands_to_json(const std::vector<AvailableCommand>& commands);

struct SlashCommand {
  std::string name;  // without the leading '/'
  std::string args;  // trimmed
};

// "/name My Session" in the leading text block -> {name, "My Session"}
std::optional<SlashCommand> parse_slash_command(const json& blocks);

}  // namespace piacp::acp
