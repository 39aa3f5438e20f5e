#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace piacp {

// WebSocket transport policy
struct ServerSettings {
  std::string host = "127.0.0.1";
  uint16_t port = 8787;

  // Admission control: connections beyond this are rejected at upgrade time
  size_t max_connections = 10;

  // Fixed window rate limit, counted per connection
  size_t rate_limit_messages = 100;
  int64_t rate_limit_window_ms = 60000;

  // Liveness probing
  int64_t ping_interval_ms = 30000;
  int64_t pong_timeout_ms = 10000;

  // Idle eviction
  int64_t idle_timeout_ms = 300000;
  int64_t idle_check_interval_ms = 60000;

  // Upper bound on shutdown before the process force-exits
  int64_t shutdown_grace_ms = 10000;
};

// How the pi subprocess is started for each session
struct PiSettings {
  std::string command = "pi";
  std::vector<std::string> args;
  int64_t request_timeout_ms = 30000;

  // Root of pi's state (sessions/, prompts/); empty means the default
  std::optional<std::filesystem::path> agent_dir;
};

// Application configuration
struct Config {
  ServerSettings server;
  PiSettings pi;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;
  bool log_to_stderr = true;

  // Load from file; a missing or malformed file yields the defaults
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: PI_ACP_HOST, PI_ACP_PORT, PI_ACP_MAX_CONNECTIONS,
  //        PI_ACP_PI_COMMAND, PI_CODING_AGENT_DIR, PI_ACP_LOG_LEVEL
  static Config from_env();

  // Overlay environment variables on an existing config
  static void apply_env(Config& config);

  // pi agent dir with the default applied
  std::filesystem::path agent_dir() const;

  // <agent_dir>/sessions
  std::filesystem::path sessions_dir() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

// ~/.config/pi-acp
std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

// $PI_CODING_AGENT_DIR, or ~/.pi/agent
std::filesystem::path pi_agent_dir();

std::filesystem::path pi_sessions_dir();
}  // namespace config_paths

}  // namespace piacp
