#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace piacp {

namespace fs = std::filesystem;

namespace {

const char* env_or_null(const char* name) {
  const char* value = std::getenv(name);
  if (value && *value) {
    return value;
  }
  return nullptr;
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return config;
  }

  try {
    json j = json::parse(file);

    if (j.contains("server")) {
      const auto& s = j["server"];
      config.server.host = s.value("host", config.server.host);
      config.server.port = s.value("port", config.server.port);
      config.server.max_connections = s.value("max_connections", config.server.max_connections);
      config.server.rate_limit_messages = s.value("rate_limit_messages", config.server.rate_limit_messages);
      config.server.rate_limit_window_ms = s.value("rate_limit_window_ms", config.server.rate_limit_window_ms);
      config.server.ping_interval_ms = s.value("ping_interval_ms", config.server.ping_interval_ms);
      config.server.pong_timeout_ms = s.value("pong_timeout_ms", config.server.pong_timeout_ms);
      config.server.idle_timeout_ms = s.value("idle_timeout_ms", config.server.idle_timeout_ms);
      config.server.idle_check_interval_ms = s.value("idle_check_interval_ms", config.server.idle_check_interval_ms);
      config.server.shutdown_grace_ms = s.value("shutdown_grace_ms", config.server.shutdown_grace_ms);
    }

    if (j.contains("pi")) {
      const auto& p = j["pi"];
      config.pi.command = p.value("command", config.pi.command);
      config.pi.request_timeout_ms = p.value("request_timeout_ms", config.pi.request_timeout_ms);
      if (p.contains("args")) {
        for (const auto& arg : p["args"]) {
          config.pi.args.push_back(arg);
        }
      }
      if (p.contains("agent_dir")) {
        config.pi.agent_dir = p["agent_dir"].get<std::string>();
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
    config.log_to_stderr = j.value("log_to_stderr", true);

  } catch (const std::exception& e) {
    spdlog::warn("[config] failed to parse {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();
  apply_env(config);
  return config;
}

void Config::apply_env(Config& config) {
  if (const char* host = env_or_null("PI_ACP_HOST")) {
    config.server.host = host;
  }

  if (const char* port = env_or_null("PI_ACP_PORT")) {
    try {
      int value = std::stoi(port);
      if (value > 0 && value <= 65535) {
        config.server.port = static_cast<uint16_t>(value);
      } else {
        spdlog::warn("[config] PI_ACP_PORT out of range: {}", port);
      }
    } catch (const std::exception&) {
      spdlog::warn("[config] PI_ACP_PORT is not a number: {}", port);
    }
  }

  if (const char* max_conn = env_or_null("PI_ACP_MAX_CONNECTIONS")) {
    try {
      long value = std::stol(max_conn);
      if (value > 0) {
        config.server.max_connections = static_cast<size_t>(value);
      }
    } catch (const std::exception&) {
      spdlog::warn("[config] PI_ACP_MAX_CONNECTIONS is not a number: {}", max_conn);
    }
  }

  if (const char* command = env_or_null("PI_ACP_PI_COMMAND")) {
    config.pi.command = command;
  }

  if (const char* agent_dir = env_or_null("PI_CODING_AGENT_DIR")) {
    config.pi.agent_dir = fs::path(agent_dir);
  }

  if (const char* level = env_or_null("PI_ACP_LOG_LEVEL")) {
    config.log_level = level;
  }
}

fs::path Config::agent_dir() const {
  if (pi.agent_dir) {
    return *pi.agent_dir;
  }
  return config_paths::pi_agent_dir();
}

fs::path Config::sessions_dir() const {
  return agent_dir() / "sessions";
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "pi-acp";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".pi-acp" / "config.json";
}

fs::path pi_agent_dir() {
  if (const char* dir = env_or_null("PI_CODING_AGENT_DIR")) {
    return fs::path(dir);
  }
  return home_dir() / ".pi" / "agent";
}

fs::path pi_sessions_dir() {
  return pi_agent_dir() / "sessions";
}

}  // namespace config_paths

}  // namespace piacp
